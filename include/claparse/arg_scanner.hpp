#ifndef CLAPARSE_ARG_SCANNER_HPP
#define CLAPARSE_ARG_SCANNER_HPP
#include <locale>
#include <optional>
#include <string>
#include <vector>
#include "claparse/option_registry.hpp"
#include "claparse/parse_result.hpp"
#include "claparse/pattern_set.hpp"

namespace claparse {

/**
 * @brief Single left-to-right pass over a command line.
 *
 * Each token is classified by trying, in order: the end-of-options and
 * stdin sentinels (`--`, `-`), the long-option rule, the flag-cluster
 * rule, the flags-then-value rule and the short-option rule. Tokens that
 * match nothing, and every token after `--`, become non-option arguments.
 * A value-taking option without an inline value consumes the following
 * token. After the pass every option's occurrence count is validated.
 *
 * Rules see only the option head of a token; the inline value after it is
 * split off here. A head longer than @ref kMaxOptionHeadLength is rejected
 * with @ref ErrorKind::IllegalValue, while values and non-option arguments
 * may be of any length.
 *
 * The scanner reads the registry and writes only into the
 * @ref ParseResult it returns, so a failed scan leaves no state behind.
 */
class ArgScanner {
  public:
    ArgScanner(const OptionRegistry& registry, const PatternSet& patterns,
               const std::locale& locale);

    /**
     * @brief Scan @p args (program name excluded).
     *
     * @throws OptionError for unknown options, misplaced value options in a
     *         flag cluster, rejected or missing values, over-long option
 *         heads, and count violations.
     */
    ParseResult scan(const std::vector<std::string>& args) const;

  private:
    struct Cursor {
        const std::vector<std::string>& args;
        std::size_t pos;
    };

    bool match_long(const std::string& arg, Cursor& cursor, ParseResult& result) const;
    bool match_short(const std::string& arg, Cursor& cursor, ParseResult& result) const;
    void set_flags(const std::string& names, ParseResult& result) const;
    void assign_value(const Option& option, const std::optional<std::string>& inline_value,
                      Cursor& cursor, ParseResult& result) const;
    void add_value(const Option& option, OptionValue value, ParseResult& result) const;
    void validate_counts(const ParseResult& result) const;

    const OptionRegistry& registry_;
    const PatternSet& patterns_;
    std::locale locale_;
};

} // namespace claparse

#endif // CLAPARSE_ARG_SCANNER_HPP
