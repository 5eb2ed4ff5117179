#ifndef CLAPARSE_OPTION_HPP
#define CLAPARSE_OPTION_HPP
#include <cstddef>
#include <locale>
#include <string>
#include <vector>
#include "claparse/option_value.hpp"

namespace claparse {

/// Lowest permitted occurrence count.
constexpr int kMinCountLimit = 0;
/// Highest permitted occurrence count; also the count used for "allow many".
constexpr int kMaxCountLimit = 100;

/// Longest accepted long option name.
constexpr std::size_t kMaxLongNameLength = 256;

/** Existence requirement applied to @ref ValueKind::File values. */
enum class FileExistence { Any, Existing, NonExisting };

/** Filesystem entry type required for @ref ValueKind::File values. */
enum class FileType { Any, File, Directory };

/**
 * @brief Declaration of a single command line option.
 *
 * An option is identified by a mandatory one-character short name
 * (`[A-Za-z0-9@?]`) and an optional long name (`[A-Za-z0-9][A-Za-z0-9-]*[A-Za-z0-9]`).
 * Its @ref ValueKind decides whether it takes a value and how that value
 * is converted. Occurrence bounds follow `0 <= min <= max <= kMaxCountLimit`;
 * a positive minimum makes the option mandatory and a maximum above one
 * makes it repeatable.
 *
 * Descriptors hold configuration only. Values collected during a parse
 * live in the @ref ParseResult returned by that parse, so one descriptor
 * can be shared by any number of parse runs.
 *
 * Constructors and setters throw `std::invalid_argument` for malformed
 * names, counts or kind-specific settings.
 */
class Option {
  public:
    Option(ValueKind kind, char short_name, const std::string& long_name,
           const std::string& description, int min_count, int max_count);

    /** Shorthand mapping @p mandatory to min 1 and @p allow_many to max @ref kMaxCountLimit. */
    Option(ValueKind kind, char short_name, const std::string& long_name,
           const std::string& description, bool mandatory, bool allow_many);

    char short_name() const { return short_name_; }
    const std::string& long_name() const { return long_name_; }
    bool has_long_name() const { return !long_name_.empty(); }
    const std::string& description() const { return description_; }
    ValueKind kind() const { return kind_; }

    /** @return `true` for every kind except @ref ValueKind::Boolean. */
    bool requires_value() const { return kind_ != ValueKind::Boolean; }

    int min_count() const { return min_count_; }
    int max_count() const { return max_count_; }
    bool is_mandatory() const { return min_count_ > 0; }
    bool allows_many() const { return max_count_ > 1; }

    /**
     * @brief Replace the occurrence bounds.
     *
     * @throws std::invalid_argument if the bounds violate
     *         `0 <= min <= max <= kMaxCountLimit`.
     */
    void set_counts(int min_count, int max_count);

    /** Hide (or show) the option in usage messages; matching is unaffected. */
    Option& set_hidden(bool hidden = true);
    bool is_hidden() const { return hidden_; }

    /** Restrict an @ref ValueKind::EnumString option to @p values. */
    Option& set_allowed_values(const std::vector<std::string>& values, bool ignore_case = true);

    /** Restrict an @ref ValueKind::EnumInteger option to @p values. */
    Option& set_allowed_values(const std::vector<int>& values);

    const std::vector<std::string>& allowed_strings() const { return allowed_strings_; }
    const std::vector<int>& allowed_integers() const { return allowed_integers_; }
    bool ignore_case() const { return ignore_case_; }

    /** Apply an existence/type filter to an @ref ValueKind::File option. */
    Option& set_file_filter(FileExistence existence, FileType type);
    FileExistence file_existence() const { return file_existence_; }
    FileType file_type() const { return file_type_; }

    /** Set the `std::get_time` format of an @ref ValueKind::Date option. */
    Option& set_date_format(const std::string& format);
    const std::string& date_format() const { return date_format_; }

    /** @return Allowed values joined for display, e.g. `"jpg", "png"`. */
    std::string allowed_values_string() const;

    /** @return `-s` or `-s,--size`, used in diagnostics. */
    std::string display_name() const;

    /**
     * @brief Convert raw command line text into a typed value.
     *
     * @param raw    Text taken from the command line.
     * @param locale Locale governing case folding, number and date formats.
     * @return Value stored in the alternative matching @ref kind().
     * @throws OptionError with @ref ErrorKind::IllegalValue when @p raw is
     *         rejected.
     */
    OptionValue parse_value(const std::string& raw, const std::locale& locale) const;

    /**
     * @brief Check an already typed value against the option's restrictions.
     *
     * Only enumerated kinds restrict values; for every other kind this
     * reports whether @p value holds the right alternative.
     */
    bool is_value_valid(const OptionValue& value, const std::locale& locale) const;

  private:
    void check_counts(int min_count, int max_count) const;

    ValueKind kind_;
    char short_name_;
    std::string long_name_;
    std::string description_;
    int min_count_ = kMinCountLimit;
    int max_count_ = kMaxCountLimit;
    bool hidden_ = false;
    std::vector<std::string> allowed_strings_;
    std::vector<int> allowed_integers_;
    bool ignore_case_ = true;
    FileExistence file_existence_ = FileExistence::Any;
    FileType file_type_ = FileType::Any;
    std::string date_format_ = "%Y-%m-%d";
};

/** @return `true` if @p c may be used as a short option name. */
bool is_valid_short_name(char c);

/**
 * @return `true` if @p name may be used as a long option name; names are
 *         limited to @ref kMaxLongNameLength characters.
 */
bool is_valid_long_name(const std::string& name);

} // namespace claparse

#endif // CLAPARSE_OPTION_HPP
