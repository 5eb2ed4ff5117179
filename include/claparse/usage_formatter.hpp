#ifndef CLAPARSE_USAGE_FORMATTER_HPP
#define CLAPARSE_USAGE_FORMATTER_HPP
#include <locale>
#include <string>
#include "claparse/option_registry.hpp"

namespace claparse {

/**
 * @brief Render usage messages from the declared options.
 *
 * Options appear in registration order; hidden options are skipped.
 *
 * Short form (one line):
 * @code
 * Usage: resize -w <integer> [-d <dir>] [-v]... <file> ...
 * @endcode
 *
 * Long form:
 * @code
 * Usage: resize [options] <file> ...
 * Options:
 *   -w, --width <integer>  (mandatory)
 *       Width of resized images.
 *   -v, --verbose          (repeatable)
 *       Displays extra runtime information.
 * @endcode
 */
class UsageFormatter {
  public:
    UsageFormatter(const OptionRegistry& registry, const std::locale& locale);

    /** Also print long names in the short usage form. */
    void set_show_long_names(bool show) { show_long_names_ = show; }

    /**
     * @param app         Program name shown after `Usage:`.
     * @param suffix_args Description of non-option arguments, may be empty.
     * @param extra_info  Free text appended on its own line, may be empty.
     */
    std::string short_usage(const std::string& app, const std::string& suffix_args = "",
                            const std::string& extra_info = "") const;

    /** @copydoc short_usage */
    std::string long_usage(const std::string& app, const std::string& suffix_args = "",
                           const std::string& extra_info = "") const;

    /** @return e.g. `-w <integer>` or, with @p with_long_name, `-w, --width <integer>`. */
    static std::string synopsis(const Option& option, bool with_long_name);

    /** @return Value placeholder such as `<integer>`; empty for flags. */
    static std::string placeholder(const Option& option);

  private:
    std::string date_example(const Option& option) const;

    const OptionRegistry& registry_;
    std::locale locale_;
    bool show_long_names_ = false;
};

} // namespace claparse

#endif // CLAPARSE_USAGE_FORMATTER_HPP
