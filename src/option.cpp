#include "claparse/option.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include "claparse/option_error.hpp"

namespace claparse {

namespace {

bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

} // namespace

bool is_valid_short_name(char c) { return is_alnum(c) || c == '@' || c == '?'; }

bool is_valid_long_name(const std::string& name) {
    if (name.size() < 2 || name.size() > kMaxLongNameLength)
        return false;
    if (!is_alnum(name.front()) || !is_alnum(name.back()))
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) { return is_alnum(c) || c == '-'; });
}

Option::Option(ValueKind kind, char short_name, const std::string& long_name,
               const std::string& description, int min_count, int max_count)
    : kind_(kind), short_name_(short_name), long_name_(long_name), description_(description) {
    if (!is_valid_short_name(short_name))
        throw std::invalid_argument("Invalid short option name: '" +
                                    std::string(1, short_name) + "'");
    if (!long_name.empty() && !is_valid_long_name(long_name))
        throw std::invalid_argument("Invalid long option name: \"" + long_name + "\"");
    check_counts(min_count, max_count);
    min_count_ = min_count;
    max_count_ = max_count;
}

Option::Option(ValueKind kind, char short_name, const std::string& long_name,
               const std::string& description, bool mandatory, bool allow_many)
    : Option(kind, short_name, long_name, description, mandatory ? 1 : 0,
             allow_many ? kMaxCountLimit : 1) {}

void Option::check_counts(int min_count, int max_count) const {
    if (min_count < kMinCountLimit)
        throw std::invalid_argument("Invalid minimum count for option " + display_name());
    if (max_count < min_count || max_count > kMaxCountLimit)
        throw std::invalid_argument("Invalid maximum count for option " + display_name());
}

void Option::set_counts(int min_count, int max_count) {
    check_counts(min_count, max_count);
    min_count_ = min_count;
    max_count_ = max_count;
}

Option& Option::set_hidden(bool hidden) {
    hidden_ = hidden;
    return *this;
}

Option& Option::set_allowed_values(const std::vector<std::string>& values, bool ignore_case) {
    if (kind_ != ValueKind::EnumString)
        throw std::invalid_argument("Option " + display_name() + " is not an enumerated string");
    if (values.empty())
        throw std::invalid_argument("Option " + display_name() + " needs at least one value");
    allowed_strings_ = values;
    ignore_case_ = ignore_case;
    return *this;
}

Option& Option::set_allowed_values(const std::vector<int>& values) {
    if (kind_ != ValueKind::EnumInteger)
        throw std::invalid_argument("Option " + display_name() + " is not an enumerated integer");
    if (values.empty())
        throw std::invalid_argument("Option " + display_name() + " needs at least one value");
    allowed_integers_ = values;
    return *this;
}

Option& Option::set_file_filter(FileExistence existence, FileType type) {
    if (kind_ != ValueKind::File)
        throw std::invalid_argument("Option " + display_name() + " is not a file option");
    file_existence_ = existence;
    file_type_ = type;
    return *this;
}

Option& Option::set_date_format(const std::string& format) {
    if (kind_ != ValueKind::Date)
        throw std::invalid_argument("Option " + display_name() + " is not a date option");
    if (format.empty())
        throw std::invalid_argument("Empty date format for option " + display_name());
    date_format_ = format;
    return *this;
}

std::string Option::allowed_values_string() const {
    std::string out;
    if (kind_ == ValueKind::EnumString) {
        for (const auto& v : allowed_strings_) {
            if (!out.empty())
                out += ", ";
            out += "\"" + v + "\"";
        }
    } else if (kind_ == ValueKind::EnumInteger) {
        for (int v : allowed_integers_) {
            if (!out.empty())
                out += ", ";
            out += std::to_string(v);
        }
    }
    return out;
}

std::string Option::display_name() const {
    std::string s = "-";
    s += short_name_;
    if (!long_name_.empty())
        s += ",--" + long_name_;
    return s;
}

bool Option::is_value_valid(const OptionValue& value, const std::locale& locale) const {
    switch (kind_) {
    case ValueKind::EnumString: {
        const auto* s = std::get_if<std::string>(&value);
        if (s == nullptr)
            return false;
        try {
            parse_value(*s, locale);
            return true;
        } catch (const OptionError&) {
            return false;
        }
    }
    case ValueKind::EnumInteger: {
        const auto* i = std::get_if<int>(&value);
        return i != nullptr &&
               std::find(allowed_integers_.begin(), allowed_integers_.end(), *i) !=
                   allowed_integers_.end();
    }
    case ValueKind::Boolean:
        return std::holds_alternative<bool>(value);
    case ValueKind::Integer:
        return std::holds_alternative<int>(value);
    case ValueKind::Long:
        return std::holds_alternative<long long>(value);
    case ValueKind::Float:
        return std::holds_alternative<float>(value);
    case ValueKind::Double:
        return std::holds_alternative<double>(value);
    case ValueKind::String:
        return std::holds_alternative<std::string>(value);
    case ValueKind::Date:
        return std::holds_alternative<Date>(value);
    case ValueKind::File:
        return std::holds_alternative<std::filesystem::path>(value);
    }
    return false;
}

} // namespace claparse
