#include "claparse/arg_scanner.hpp"
#include <algorithm>
#include <cctype>
#include <utility>
#include "claparse/logger.hpp"
#include "claparse/option_error.hpp"

namespace claparse {

namespace {

bool has_space(const std::string& s) {
    return std::find_if(s.begin(), s.end(), [](char c) {
               return std::isspace(static_cast<unsigned char>(c)) != 0;
           }) != s.end();
}

// Value appended to a short head: an optional '=' or ':' and then one or more
// non-space characters. Fails when the tail contains whitespace.
bool short_inline_value(const std::string& tail, std::optional<std::string>& value) {
    value.reset();
    if (tail.empty())
        return true;
    if (has_space(tail))
        return false;
    if (tail.size() > 1 && (tail[0] == '=' || tail[0] == ':'))
        value = tail.substr(1);
    else
        value = tail;
    return true;
}

void check_head_length(const std::string& arg, std::size_t head_length) {
    if (head_length > kMaxOptionHeadLength)
        throw OptionError(ErrorKind::IllegalValue, arg.substr(0, 32) + "...");
}

} // namespace

ArgScanner::ArgScanner(const OptionRegistry& registry, const PatternSet& patterns,
                       const std::locale& locale)
    : registry_(registry), patterns_(patterns), locale_(locale) {}

ParseResult ArgScanner::scan(const std::vector<std::string>& args) const {
    ParseResult result(registry_, locale_);
    Cursor cursor{args, 0};
    bool end_of_options = false;

    while (cursor.pos < args.size()) {
        const std::string& arg = args[cursor.pos++];
        if (end_of_options || arg == "-") {
            log_debug("Non-option argument", {{"arg", arg}});
            result.non_options_.push_back(arg);
        } else if (arg == "--") {
            log_debug("End of options");
            end_of_options = true;
        } else if (!match_long(arg, cursor, result) && !match_short(arg, cursor, result)) {
            log_debug("Non-option argument", {{"arg", arg}});
            result.non_options_.push_back(arg);
        }
    }

    validate_counts(result);
    return result;
}

bool ArgScanner::match_long(const std::string& arg, Cursor& cursor, ParseResult& result) const {
    if (arg.compare(0, 2, "--") != 0)
        return false;
    const std::size_t delim = arg.find_first_of("=:", 2);
    const std::string head = arg.substr(0, delim);
    if (has_space(head))
        return false;
    check_head_length(arg, head.size());

    std::optional<std::string> inline_value;
    if (delim != std::string::npos) {
        inline_value = arg.substr(delim + 1);
        if (inline_value->empty() || has_space(*inline_value))
            return false;
    }
    std::smatch m;
    if (!std::regex_match(head, m, patterns_.long_option))
        return false;
    const std::string name = m[1].str();
    auto opt = registry_.find_long(name);
    if (!opt)
        throw OptionError(ErrorKind::UnknownOption, name);
    log_debug("Long option", {{"arg", arg}, {"option", opt->display_name()}});
    assign_value(*opt, inline_value, cursor, result);
    return true;
}

bool ArgScanner::match_short(const std::string& arg, Cursor& cursor, ParseResult& result) const {
    if (arg.size() < 2 || (arg[0] != '-' && arg[0] != '/'))
        return false;
    std::size_t run_end = 1;
    while (run_end < arg.size() && patterns_.flag_names.find(arg[run_end]) != std::string::npos)
        ++run_end;
    check_head_length(arg, run_end);

    std::smatch m;
    std::optional<std::string> inline_value;
    if (run_end == arg.size()) {
        if (patterns_.flag_cluster && std::regex_match(arg, m, *patterns_.flag_cluster)) {
            log_debug("Flag cluster", {{"arg", arg}});
            set_flags(m[1].str(), result);
            return true;
        }
    } else if (patterns_.flags_then_value) {
        const std::string head = arg.substr(0, run_end + 1);
        if (std::regex_match(head, m, *patterns_.flags_then_value) &&
            short_inline_value(arg.substr(run_end + 1), inline_value)) {
            log_debug("Flags then value option", {{"arg", arg}});
            set_flags(m[1].str(), result);
            const std::string name = m[2].str();
            auto opt = registry_.find_short(name[0]);
            if (!opt)
                throw OptionError(ErrorKind::UnknownOption, name);
            assign_value(*opt, inline_value, cursor, result);
            return true;
        }
    }

    const std::string head = arg.substr(0, 2);
    if (!std::regex_match(head, m, patterns_.short_option) ||
        !short_inline_value(arg.substr(2), inline_value))
        return false;
    const std::string name = m[1].str();
    auto opt = registry_.find_short(name[0]);
    if (!opt)
        throw OptionError(ErrorKind::UnknownOption, name);
    log_debug("Short option", {{"arg", arg}, {"option", opt->display_name()}});
    assign_value(*opt, inline_value, cursor, result);
    return true;
}

void ArgScanner::set_flags(const std::string& names, ParseResult& result) const {
    for (char c : names) {
        auto opt = registry_.find_short(c);
        if (!opt)
            throw OptionError(ErrorKind::UnknownOption, std::string(1, c));
        if (opt->requires_value())
            throw OptionError(ErrorKind::NotAFlag, opt->display_name(), c);
        add_value(*opt, true, result);
    }
}

void ArgScanner::assign_value(const Option& option, const std::optional<std::string>& inline_value,
                              Cursor& cursor, ParseResult& result) const {
    if (inline_value) {
        const std::size_t have = result.values_of(option).size();
        const bool repeatable_flag = option.kind() == ValueKind::Boolean && option.allows_many() &&
                                     have < static_cast<std::size_t>(option.max_count());
        if (!option.requires_value() && !repeatable_flag)
            throw OptionError(ErrorKind::IllegalValue, option, *inline_value, true);
        add_value(option, option.parse_value(*inline_value, locale_), result);
    } else if (option.requires_value()) {
        if (cursor.pos >= cursor.args.size())
            throw OptionError(ErrorKind::IllegalValue, option);
        const std::string& raw = cursor.args[cursor.pos++];
        add_value(option, option.parse_value(raw, locale_), result);
    } else if (option.kind() == ValueKind::Boolean) {
        add_value(option, true, result);
    }
}

void ArgScanner::add_value(const Option& option, OptionValue value, ParseResult& result) const {
    ParseResult::Entry* entry = result.find_entry(option);
    if (entry == nullptr)
        throw OptionError(ErrorKind::UnknownOption, option.display_name());
    auto& values = entry->values;
    const std::size_t max = static_cast<std::size_t>(option.max_count());
    if (max == 0)
        throw OptionError(ErrorKind::IllegalValue, option, to_string(value), true);
    if (max == 1 && !values.empty())
        throw OptionError(ErrorKind::DuplicateSingleValue, option, to_string(value), true);
    if (values.size() >= max)
        throw OptionError(ErrorKind::ValueLimitExceeded, option, to_string(value), true);
    values.push_back(std::move(value));
}

void ArgScanner::validate_counts(const ParseResult& result) const {
    for (const auto& e : result.entries()) {
        const Option& opt = *e.option;
        const int count = static_cast<int>(e.values.size());
        if (opt.is_mandatory() && e.values.empty())
            throw OptionError(ErrorKind::IllegalValue, opt);
        if (count < opt.min_count() || count > opt.max_count())
            throw OptionError(ErrorKind::InvalidCount, opt);
    }
}

} // namespace claparse
