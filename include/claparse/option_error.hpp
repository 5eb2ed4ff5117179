#ifndef CLAPARSE_OPTION_ERROR_HPP
#define CLAPARSE_OPTION_ERROR_HPP
#include <stdexcept>
#include <string>

namespace claparse {

class Option;

/**
 * @brief Category of a parsing or retrieval failure.
 *
 * The first group describes incorrect API usage by the calling program, the
 * second group describes malformed command lines supplied by the user.
 */
enum class ErrorKind {
    // API usage
    DuplicateName,
    InvalidOptionType,
    InvalidRetrievalType,
    // Command line
    UnknownOption,
    NotAFlag,
    IllegalValue,
    DuplicateSingleValue,
    ValueLimitExceeded,
    InvalidCount
};

/**
 * @brief Exception thrown for every registration, parse and query failure.
 *
 * Carries the error category together with the offending option, name,
 * value or flag character so callers can build their own diagnostics. The
 * inherited `what()` string is a ready-made English message.
 */
class OptionError : public std::runtime_error {
  public:
    /** Failure attached to a registered option and an optional raw value. */
    OptionError(ErrorKind kind, const Option& option, const std::string& value = "",
                bool has_value = false);

    /** Failure attached to a bare option name (no descriptor available). */
    OptionError(ErrorKind kind, const std::string& option_name);

    /** Failure naming an option and the flag character that triggered it. */
    OptionError(ErrorKind kind, const std::string& option_name, char flag);

    ErrorKind kind() const { return kind_; }

    /** @return Display form of the option, e.g. `-s,--size`, or the raw name. */
    const std::string& option_name() const { return option_name_; }

    /** @return Offending value, empty when none was involved. */
    const std::string& value() const { return value_; }

    /** @return Whether a value accompanies this error. */
    bool has_value() const { return has_value_; }

    /** @return Flag character for cluster errors, `'\0'` otherwise. */
    char flag() const { return flag_; }

    /** @return Lower bound of the option's occurrence count, or -1. */
    int min_count() const { return min_count_; }

    /** @return Upper bound of the option's occurrence count, or -1. */
    int max_count() const { return max_count_; }

  private:
    ErrorKind kind_;
    std::string option_name_;
    std::string value_;
    bool has_value_ = false;
    char flag_ = '\0';
    int min_count_ = -1;
    int max_count_ = -1;
};

/** @return Stable identifier for @p kind, e.g. `"UnknownOption"`. */
const char* to_string(ErrorKind kind);

} // namespace claparse

#endif // CLAPARSE_OPTION_ERROR_HPP
