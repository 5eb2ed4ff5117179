#include "claparse/option_error.hpp"
#include "claparse/option.hpp"

namespace claparse {

namespace {

std::string quoted(const std::string& s) { return "\"" + s + "\""; }

std::string format_message(ErrorKind kind, const std::string& name, const std::string& value,
                           bool has_value, char flag, int min_count, int max_count) {
    switch (kind) {
    case ErrorKind::DuplicateName:
        return "Option name already in use: " + name;
    case ErrorKind::InvalidOptionType:
        return "Option " + name + " is not of the requested type";
    case ErrorKind::InvalidRetrievalType:
        return "Option " + name + " allows multiple values; retrieve them as a list";
    case ErrorKind::UnknownOption:
        return "Unknown option: " + name;
    case ErrorKind::NotAFlag:
        return "Option " + name + " requires a value and cannot be grouped as flag " +
               quoted(std::string(1, flag));
    case ErrorKind::IllegalValue:
        if (!has_value)
            return "Missing or illegal value for option " + name;
        return "Illegal value for option " + name + ": " + quoted(value);
    case ErrorKind::DuplicateSingleValue:
        return "Option " + name + " only accepts a single value, also given " + quoted(value);
    case ErrorKind::ValueLimitExceeded:
        return "Too many values for option " + name + " (at most " + std::to_string(max_count) +
               "), rejected " + quoted(value);
    case ErrorKind::InvalidCount:
        return "Option " + name + " must be given between " + std::to_string(min_count) +
               " and " + std::to_string(max_count) + " times";
    }
    return "Option error: " + name;
}

} // namespace

OptionError::OptionError(ErrorKind kind, const Option& option, const std::string& value,
                         bool has_value)
    : std::runtime_error(format_message(kind, option.display_name(), value, has_value, '\0',
                                        option.min_count(), option.max_count())),
      kind_(kind), option_name_(option.display_name()), value_(value), has_value_(has_value),
      min_count_(option.min_count()), max_count_(option.max_count()) {}

OptionError::OptionError(ErrorKind kind, const std::string& option_name)
    : std::runtime_error(format_message(kind, option_name, "", false, '\0', -1, -1)), kind_(kind),
      option_name_(option_name) {}

OptionError::OptionError(ErrorKind kind, const std::string& option_name, char flag)
    : std::runtime_error(format_message(kind, option_name, "", false, flag, -1, -1)), kind_(kind),
      option_name_(option_name), flag_(flag) {}

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DuplicateName:
        return "DuplicateName";
    case ErrorKind::InvalidOptionType:
        return "InvalidOptionType";
    case ErrorKind::InvalidRetrievalType:
        return "InvalidRetrievalType";
    case ErrorKind::UnknownOption:
        return "UnknownOption";
    case ErrorKind::NotAFlag:
        return "NotAFlag";
    case ErrorKind::IllegalValue:
        return "IllegalValue";
    case ErrorKind::DuplicateSingleValue:
        return "DuplicateSingleValue";
    case ErrorKind::ValueLimitExceeded:
        return "ValueLimitExceeded";
    case ErrorKind::InvalidCount:
        return "InvalidCount";
    }
    return "Unknown";
}

} // namespace claparse
