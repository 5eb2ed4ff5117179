#ifndef CLAPARSE_ARG_PARSER_HPP
#define CLAPARSE_ARG_PARSER_HPP
#include <cstddef>
#include <iosfwd>
#include <locale>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "claparse/option.hpp"
#include "claparse/option_registry.hpp"
#include "claparse/parse_result.hpp"

namespace claparse {

/**
 * @brief Command line parser supporting POSIX short and GNU long options.
 *
 * Every option has a one-character short name (`-v`, or `/v`) and may also
 * have a long name (`--verbose`). Values follow the option name in the
 * same argument (`-s10`, `-s=10`, `-s:10`, `--size=10`, `--size:10`) or in
 * the next argument (`-s 10`, `--size 10`). Flags can be grouped (`-abc`)
 * and a group may end in a value-taking option (`-abcs10`). The argument
 * `--` ends option processing and a lone `-` is always passed through as a
 * non-option argument.
 *
 * @code
 * claparse::ArgParser parser;
 * auto width = parser.add_integer_option('w', "width", "Image width", true, false);
 * parser.add_boolean_option('v', "verbose", "More output", true);
 * const auto& res = parser.parse(argc, argv);
 * int w = *res.value<int>("width");
 * std::size_t verbosity = res.flag_count("v");
 * @endcode
 *
 * Parsing never modifies the option descriptors; each call to parse()
 * produces a new @ref ParseResult, which is also kept for the query
 * helpers of this class until the next call.
 */
class ArgParser {
    OptionRegistry registry_;
    std::locale locale_;
    std::optional<ParseResult> result_;
    bool show_long_names_ = false;

  public:
    /** @param locale Locale passed to every value parser. */
    explicit ArgParser(const std::locale& locale = std::locale::classic());

    /** Register a preconfigured option. @see OptionRegistry::add */
    std::shared_ptr<Option> add_option(std::shared_ptr<Option> option);

    std::shared_ptr<Option> add_boolean_option(char short_name, const std::string& long_name = "",
                                               const std::string& description = "",
                                               bool allow_many = false);
    std::shared_ptr<Option> add_boolean_option(char short_name, const std::string& long_name,
                                               const std::string& description, int min_count,
                                               int max_count);

    std::shared_ptr<Option> add_integer_option(char short_name, const std::string& long_name,
                                               const std::string& description, bool mandatory,
                                               bool allow_many);
    std::shared_ptr<Option> add_integer_option(char short_name, const std::string& long_name,
                                               const std::string& description, int min_count,
                                               int max_count);

    std::shared_ptr<Option> add_long_option(char short_name, const std::string& long_name,
                                            const std::string& description, bool mandatory,
                                            bool allow_many);
    std::shared_ptr<Option> add_long_option(char short_name, const std::string& long_name,
                                            const std::string& description, int min_count,
                                            int max_count);

    std::shared_ptr<Option> add_float_option(char short_name, const std::string& long_name,
                                             const std::string& description, bool mandatory,
                                             bool allow_many);
    std::shared_ptr<Option> add_float_option(char short_name, const std::string& long_name,
                                             const std::string& description, int min_count,
                                             int max_count);
    std::shared_ptr<Option> add_double_option(char short_name, const std::string& long_name,
                                              const std::string& description, bool mandatory,
                                              bool allow_many);
    std::shared_ptr<Option> add_double_option(char short_name, const std::string& long_name,
                                              const std::string& description, int min_count,
                                              int max_count);

    std::shared_ptr<Option> add_string_option(char short_name, const std::string& long_name = "",
                                              const std::string& description = "",
                                              bool mandatory = false, bool allow_many = false);
    std::shared_ptr<Option> add_string_option(char short_name, const std::string& long_name,
                                              const std::string& description, int min_count,
                                              int max_count);

    std::shared_ptr<Option> add_date_option(char short_name, const std::string& long_name,
                                            const std::string& description, bool mandatory,
                                            bool allow_many);
    std::shared_ptr<Option> add_date_option(char short_name, const std::string& long_name,
                                            const std::string& description, int min_count,
                                            int max_count);

    /** Path option accepting any path. */
    std::shared_ptr<Option> add_file_option(char short_name, const std::string& long_name,
                                            const std::string& description, bool mandatory,
                                            bool allow_many);
    /** Path option that must not exist yet. */
    std::shared_ptr<Option> add_file_new_option(char short_name, const std::string& long_name,
                                                const std::string& description, bool mandatory,
                                                bool allow_many);
    /** Path option naming an existing regular file. */
    std::shared_ptr<Option> add_file_existing_option(char short_name,
                                                     const std::string& long_name,
                                                     const std::string& description,
                                                     bool mandatory, bool allow_many);
    /** Path option naming an existing directory. */
    std::shared_ptr<Option> add_directory_existing_option(char short_name,
                                                          const std::string& long_name,
                                                          const std::string& description,
                                                          bool mandatory, bool allow_many);

    std::shared_ptr<Option> add_enum_string_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   bool mandatory, bool allow_many,
                                                   const std::vector<std::string>& allowed,
                                                   bool ignore_case = true);
    std::shared_ptr<Option> add_enum_integer_option(char short_name, const std::string& long_name,
                                                    const std::string& description,
                                                    bool mandatory, bool allow_many,
                                                    const std::vector<int>& allowed);

    /** @see OptionRegistry::remove */
    bool remove_option(const std::shared_ptr<Option>& option);
    /** @see OptionRegistry::remove */
    bool remove_option(const std::string& name);

    /** @see OptionRegistry::set_hidden */
    void set_hidden(const std::string& name);

    /** Show long names in the short usage message as well. */
    void show_long_names_in_short_usage(bool show = true) { show_long_names_ = show; }

    const OptionRegistry& registry() const { return registry_; }
    const std::locale& locale() const { return locale_; }

    /**
     * @brief Parse @p args (program name excluded).
     *
     * @return The new result, also retained by this parser.
     * @throws OptionError when the command line is malformed. The previous
     *         result is discarded in that case.
     */
    const ParseResult& parse(const std::vector<std::string>& args);

    /** Parse `argv[1]..argv[argc-1]`. */
    const ParseResult& parse(int argc, char* argv[]);

    /** @return `true` once a parse has completed successfully. */
    bool has_result() const { return result_.has_value(); }

    /**
     * @return Result of the last successful parse.
     * @throws std::logic_error if no parse has succeeded yet.
     */
    const ParseResult& result() const;

    const std::vector<OptionValue>& values_of(const Option& option) const {
        return result().values_of(option);
    }
    const std::vector<std::string>& non_option_arguments() const {
        return result().non_option_arguments();
    }
    bool parsed_solitary_hyphen() const { return result().parsed_solitary_hyphen(); }
    bool flag(const std::string& name) const { return result().flag(name); }
    std::size_t flag_count(const std::string& name) const { return result().flag_count(name); }

    /** @see ParseResult::option */
    const Option& option(const std::string& name, ValueKind kind) const {
        return result().option(name, kind);
    }

    template <typename T> std::vector<T> values(const std::string& name) const {
        return result().values<T>(name);
    }
    template <typename T> T value(const std::string& name, const T& def) const {
        return result().value<T>(name, def);
    }

    /**
     * @brief Write a usage message to @p os.
     *
     * @param long_usage  Long form with descriptions when `true`.
     * @param app         Program name.
     * @param suffix_args Description of the non-option arguments.
     * @param extra_info  Additional text printed after the options.
     */
    void print_usage(std::ostream& os, bool long_usage, const std::string& app,
                     const std::string& suffix_args = "",
                     const std::string& extra_info = "") const;
};

} // namespace claparse

#endif // CLAPARSE_ARG_PARSER_HPP
