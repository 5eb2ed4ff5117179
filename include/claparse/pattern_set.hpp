#ifndef CLAPARSE_PATTERN_SET_HPP
#define CLAPARSE_PATTERN_SET_HPP
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include "claparse/option_registry.hpp"

namespace claparse {

/// Grammar of a single short option name.
extern const char* const kShortNamePattern;
/// Grammar of a long option name.
extern const char* const kLongNamePattern;

/// Longest option head handed to the matching rules. Longer heads are
/// rejected by the scanner before any rule runs.
constexpr std::size_t kMaxOptionHeadLength = 1024;

/**
 * @brief Matching rules synthesized from a registry.
 *
 * Rules match the option head of a token only: `--name` up to the first
 * `=` or `:`, or the prefix, flag run and value option of a short group.
 * The inline value after the head is split off by the scanner, which keeps
 * regex work bounded by @ref kMaxOptionHeadLength. Capture groups:
 * - `long_option`:   1 = long name
 * - `flag_cluster`:  1 = flag characters
 * - `flags_then_value`: 1 = leading flags (may be empty), 2 = value option
 * - `short_option`:  1 = short name
 *
 * `flag_cluster` is absent when no flag options are registered and
 * `flags_then_value` is absent when no value-taking options are; an absent
 * rule never matches.
 */
struct PatternSet {
    std::regex long_option;
    std::optional<std::regex> flag_cluster;
    std::optional<std::regex> flags_then_value;
    std::regex short_option;

    /// Short names of flag options and of value-taking options.
    std::string flag_names;
    std::string value_names;

    /// Regex sources, kept for diagnostics.
    std::string long_option_source;
    std::string flag_cluster_source;
    std::string flags_then_value_source;
    std::string short_option_source;
};

/**
 * @brief Build the matching rules for the current contents of @p registry.
 *
 * Short names are partitioned into flags and value-taking options and
 * assembled into character classes; regex metacharacters are escaped.
 * The result does not track later registry changes, so callers compile
 * once per parse.
 */
PatternSet compile_patterns(const OptionRegistry& registry);

/** @return Character class matching any one of @p names, e.g. `[ab\?]`. */
std::string make_char_class(const std::string& names);

} // namespace claparse

#endif // CLAPARSE_PATTERN_SET_HPP
