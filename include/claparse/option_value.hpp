#ifndef CLAPARSE_OPTION_VALUE_HPP
#define CLAPARSE_OPTION_VALUE_HPP
#include <filesystem>
#include <string>
#include <variant>

namespace claparse {

/**
 * @brief Closed set of value kinds an option can carry.
 *
 * The kind decides whether an option takes a value at all (only
 * `Boolean` does not), which parser converts the raw text, and which
 * alternative of @ref OptionValue the parsed result occupies.
 */
enum class ValueKind {
    Boolean,
    Integer,
    Long,
    Float,
    Double,
    String,
    Date,
    EnumString,
    EnumInteger,
    File
};

/** Calendar date without time of day. */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) { return !(a == b); }

/** A single parsed option value. */
using OptionValue =
    std::variant<bool, int, long long, float, double, std::string, Date, std::filesystem::path>;

/** @return Human readable kind name used in logs and diagnostics. */
const char* to_string(ValueKind kind);

/** @return Text form of @p value (dates as YYYY-MM-DD). */
std::string to_string(const OptionValue& value);

/** @return `true` if @p kind stores its values as @p T. */
template <typename T> bool holds_kind(ValueKind kind);

template <> inline bool holds_kind<bool>(ValueKind kind) { return kind == ValueKind::Boolean; }
template <> inline bool holds_kind<int>(ValueKind kind) {
    return kind == ValueKind::Integer || kind == ValueKind::EnumInteger;
}
template <> inline bool holds_kind<long long>(ValueKind kind) { return kind == ValueKind::Long; }
template <> inline bool holds_kind<float>(ValueKind kind) { return kind == ValueKind::Float; }
template <> inline bool holds_kind<double>(ValueKind kind) { return kind == ValueKind::Double; }
template <> inline bool holds_kind<std::string>(ValueKind kind) {
    return kind == ValueKind::String || kind == ValueKind::EnumString;
}
template <> inline bool holds_kind<Date>(ValueKind kind) { return kind == ValueKind::Date; }
template <> inline bool holds_kind<std::filesystem::path>(ValueKind kind) {
    return kind == ValueKind::File;
}

} // namespace claparse

#endif // CLAPARSE_OPTION_VALUE_HPP
