#include "claparse/usage_formatter.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace claparse {

namespace {

std::string annotation(const Option& opt) {
    if (opt.is_mandatory() && opt.allows_many())
        return "(mandatory, repeatable)";
    if (opt.is_mandatory())
        return "(mandatory)";
    if (opt.allows_many())
        return "(repeatable)";
    return "";
}

void append_indented(std::string& out, const std::string& text, const std::string& indent) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
        out += indent + line + "\n";
}

} // namespace

UsageFormatter::UsageFormatter(const OptionRegistry& registry, const std::locale& locale)
    : registry_(registry), locale_(locale) {}

std::string UsageFormatter::placeholder(const Option& option) {
    switch (option.kind()) {
    case ValueKind::Boolean:
        return "";
    case ValueKind::Integer:
    case ValueKind::EnumInteger:
        return "<integer>";
    case ValueKind::Long:
        return "<long>";
    case ValueKind::Float:
        return "<float>";
    case ValueKind::Double:
        return "<double>";
    case ValueKind::String:
    case ValueKind::EnumString:
        return "<string>";
    case ValueKind::Date:
        return "<date>";
    case ValueKind::File:
        switch (option.file_type()) {
        case FileType::File:
            return "<file>";
        case FileType::Directory:
            return "<dir>";
        case FileType::Any:
            break;
        }
        return "<path>";
    }
    return "";
}

std::string UsageFormatter::synopsis(const Option& option, bool with_long_name) {
    std::string out = "-";
    out += option.short_name();
    if (with_long_name && option.has_long_name())
        out += ", --" + option.long_name();
    std::string ph = placeholder(option);
    if (!ph.empty())
        out += " " + ph;
    return out;
}

std::string UsageFormatter::date_example(const Option& option) const {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os.imbue(locale_);
    os << std::put_time(&tm, option.date_format().c_str());
    return os.str();
}

std::string UsageFormatter::short_usage(const std::string& app, const std::string& suffix_args,
                                        const std::string& extra_info) const {
    std::string out = "Usage: " + app;
    for (const auto& opt : registry_.options()) {
        if (opt->is_hidden())
            continue;
        std::string item = synopsis(*opt, show_long_names_);
        if (!opt->is_mandatory())
            item = "[" + item + "]";
        if (opt->allows_many())
            item += "...";
        out += " " + item;
    }
    if (!suffix_args.empty())
        out += " " + suffix_args;
    out += "\n";
    if (!extra_info.empty())
        append_indented(out, extra_info, "");
    return out;
}

std::string UsageFormatter::long_usage(const std::string& app, const std::string& suffix_args,
                                       const std::string& extra_info) const {
    std::vector<const Option*> visible;
    for (const auto& opt : registry_.options()) {
        if (!opt->is_hidden())
            visible.push_back(opt.get());
    }

    std::string out = "Usage: " + app;
    if (!visible.empty())
        out += " [options]";
    if (!suffix_args.empty())
        out += " " + suffix_args;
    out += "\n";

    if (!visible.empty()) {
        out += "Options:\n";
        std::size_t width = 0;
        for (const Option* opt : visible)
            width = std::max(width, synopsis(*opt, true).size());
        for (const Option* opt : visible) {
            std::string head = "  " + synopsis(*opt, true);
            std::string note = annotation(*opt);
            if (!note.empty()) {
                head.append(width + 4 - head.size(), ' ');
                head += note;
            }
            out += head + "\n";
            if (opt->kind() == ValueKind::EnumString || opt->kind() == ValueKind::EnumInteger)
                out += "      Allowed values: " + opt->allowed_values_string() + "\n";
            else if (opt->kind() == ValueKind::Date)
                out += "      Format example: " + date_example(*opt) + "\n";
            append_indented(out, opt->description(), "      ");
        }
    }

    if (!extra_info.empty()) {
        out += "\n";
        append_indented(out, extra_info, "");
    }
    return out;
}

} // namespace claparse
