#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>
#include "claparse/option.hpp"
#include "claparse/option_error.hpp"
#include "claparse/option_value.hpp"

namespace fs = std::filesystem;

namespace claparse {

namespace {

const char* const kTrueWords[] = {"true", "yes", "on", "1"};
const char* const kFalseWords[] = {"false", "no", "off", "0"};

std::string to_lower(const std::string& s, const std::locale& loc) {
    std::string out = s;
    std::use_facet<std::ctype<char>>(loc).tolower(&out[0], &out[0] + out.size());
    return out;
}

std::string trim(const std::string& s, const std::locale& loc) {
    auto not_space = [&loc](char c) { return !std::isspace(c, loc); };
    auto first = std::find_if(s.begin(), s.end(), not_space);
    auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string();
}

bool parse_boolean(const std::string& raw, const std::locale& loc, bool& out) {
    const std::string s = to_lower(trim(raw, loc), loc);
    for (const char* w : kTrueWords) {
        if (s == w) {
            out = true;
            return true;
        }
    }
    for (const char* w : kFalseWords) {
        if (s == w) {
            out = false;
            return true;
        }
    }
    return false;
}

// Whole-token decimal integer with optional sign, inclusive [min, max].
bool parse_whole_integer(const std::string& raw, long long min, long long max, long long& out) {
    if (raw.empty() || std::isspace(static_cast<unsigned char>(raw.front())))
        return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(raw.c_str(), &end, 10);
    if (end == raw.c_str() || *end != '\0' || errno == ERANGE)
        return false;
    if (v < min || v > max)
        return false;
    out = v;
    return true;
}

template <typename T> bool parse_floating(const std::string& raw, const std::locale& loc, T& out) {
    static_assert(std::is_floating_point<T>::value, "floating point type required");
    if (raw.empty())
        return false;
    std::istringstream iss(raw);
    iss.imbue(loc);
    T v{};
    iss >> std::noskipws >> v;
    if (iss.fail())
        return false;
    if (iss.peek() != std::char_traits<char>::eof())
        return false;
    out = v;
    return true;
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y))
        return 29;
    return days[m - 1];
}

bool parse_date(const std::string& raw, const std::string& format, const std::locale& loc,
                Date& out) {
    std::tm tm{};
    tm.tm_mday = 0;
    std::istringstream iss(raw);
    iss.imbue(loc);
    iss >> std::get_time(&tm, format.c_str());
    if (iss.fail())
        return false;
    if (iss.peek() != std::char_traits<char>::eof())
        return false;
    Date d{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    if (d.month < 1 || d.month > 12)
        return false;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month))
        return false;
    out = d;
    return true;
}

bool accept_path(const std::string& raw, FileExistence existence, FileType type) {
    if (raw.empty())
        return false;
    std::error_code ec;
    const fs::path p(raw);
    const bool exists = fs::exists(p, ec);
    if (ec)
        return false;
    if (existence == FileExistence::Existing && !exists)
        return false;
    if (existence == FileExistence::NonExisting && exists)
        return false;
    if (type == FileType::Directory && !fs::is_directory(p, ec))
        return false;
    if (type == FileType::File && !fs::is_regular_file(p, ec))
        return false;
    return true;
}

// Substring match against the allowed values: case-insensitive first, then
// case-sensitive to break ties. A unique candidate is required.
bool match_enum_string(const std::vector<std::string>& allowed, const std::string& raw,
                       bool ignore_case, const std::locale& loc, std::string& out) {
    if (raw.empty())
        return false;
    std::vector<std::string> candidates;
    if (ignore_case) {
        const std::string needle = to_lower(raw, loc);
        for (const auto& v : allowed) {
            if (to_lower(v, loc).find(needle) != std::string::npos)
                candidates.push_back(v);
        }
    } else {
        candidates = allowed;
    }
    if (candidates.size() > 1 || !ignore_case) {
        std::vector<std::string> exact_case;
        for (const auto& v : candidates) {
            if (v.find(raw) != std::string::npos)
                exact_case.push_back(v);
        }
        candidates.swap(exact_case);
    }
    if (candidates.size() != 1)
        return false;
    out = candidates.front();
    return true;
}

} // namespace

OptionValue Option::parse_value(const std::string& raw, const std::locale& locale) const {
    switch (kind_) {
    case ValueKind::Boolean: {
        bool b = false;
        if (parse_boolean(raw, locale, b))
            return b;
        break;
    }
    case ValueKind::Integer: {
        long long v = 0;
        if (parse_whole_integer(raw, std::numeric_limits<int>::min(),
                                std::numeric_limits<int>::max(), v))
            return static_cast<int>(v);
        break;
    }
    case ValueKind::Long: {
        long long v = 0;
        if (parse_whole_integer(raw, std::numeric_limits<long long>::min(),
                                std::numeric_limits<long long>::max(), v))
            return v;
        break;
    }
    case ValueKind::Float: {
        float f = 0.0f;
        if (parse_floating(raw, locale, f))
            return f;
        break;
    }
    case ValueKind::Double: {
        double d = 0.0;
        if (parse_floating(raw, locale, d))
            return d;
        break;
    }
    case ValueKind::String:
        return raw;
    case ValueKind::Date: {
        Date d;
        if (parse_date(raw, date_format_, locale, d))
            return d;
        break;
    }
    case ValueKind::EnumString: {
        std::string s;
        if (match_enum_string(allowed_strings_, raw, ignore_case_, locale, s))
            return s;
        break;
    }
    case ValueKind::EnumInteger: {
        long long v = 0;
        if (parse_whole_integer(raw, std::numeric_limits<int>::min(),
                                std::numeric_limits<int>::max(), v) &&
            std::find(allowed_integers_.begin(), allowed_integers_.end(),
                      static_cast<int>(v)) != allowed_integers_.end())
            return static_cast<int>(v);
        break;
    }
    case ValueKind::File:
        if (accept_path(raw, file_existence_, file_type_))
            return fs::path(raw);
        break;
    }
    throw OptionError(ErrorKind::IllegalValue, *this, raw, true);
}

const char* to_string(ValueKind kind) {
    switch (kind) {
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Integer:
        return "integer";
    case ValueKind::Long:
        return "long";
    case ValueKind::Float:
        return "float";
    case ValueKind::Double:
        return "double";
    case ValueKind::String:
        return "string";
    case ValueKind::Date:
        return "date";
    case ValueKind::EnumString:
        return "enum-string";
    case ValueKind::EnumInteger:
        return "enum-integer";
    case ValueKind::File:
        return "file";
    }
    return "unknown";
}

std::string to_string(const OptionValue& value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    if (const auto* b = std::get_if<bool>(&value)) {
        oss << (*b ? "true" : "false");
    } else if (const auto* i = std::get_if<int>(&value)) {
        oss << *i;
    } else if (const auto* l = std::get_if<long long>(&value)) {
        oss << *l;
    } else if (const auto* f = std::get_if<float>(&value)) {
        oss << *f;
    } else if (const auto* d = std::get_if<double>(&value)) {
        oss << *d;
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        oss << *s;
    } else if (const auto* dt = std::get_if<Date>(&value)) {
        oss << std::setfill('0') << std::setw(4) << dt->year << '-' << std::setw(2) << dt->month
            << '-' << std::setw(2) << dt->day;
    } else if (const auto* p = std::get_if<fs::path>(&value)) {
        oss << p->string();
    }
    return oss.str();
}

} // namespace claparse
