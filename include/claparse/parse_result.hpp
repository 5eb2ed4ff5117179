#ifndef CLAPARSE_PARSE_RESULT_HPP
#define CLAPARSE_PARSE_RESULT_HPP
#include <cstddef>
#include <filesystem>
#include <locale>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "claparse/option.hpp"
#include "claparse/option_error.hpp"
#include "claparse/option_registry.hpp"
#include "claparse/option_value.hpp"

namespace claparse {

class ArgScanner;

/**
 * @brief Outcome of one parse run.
 *
 * Holds, for every option registered when the parse started, the values
 * collected in order of appearance, plus the ordered list of non-option
 * arguments. A result keeps its own references to the option descriptors
 * and stays valid after the registry changes.
 */
class ParseResult {
  public:
    struct Entry {
        std::shared_ptr<Option> option;
        std::vector<OptionValue> values;
    };

    ParseResult() = default;
    ParseResult(const OptionRegistry& registry, const std::locale& locale);

    /**
     * @return Values collected for @p option.
     * @throws OptionError with @ref ErrorKind::UnknownOption if @p option was
     *         not registered when the parse ran.
     */
    const std::vector<OptionValue>& values_of(const Option& option) const;

    /** @copydoc values_of(const Option&) const */
    const std::vector<OptionValue>& values_of(const std::string& name) const;

    /** @return Number of values collected for @p option. */
    std::size_t count(const Option& option) const { return values_of(option).size(); }

    /** @return Non-option arguments in command line order. */
    const std::vector<std::string>& non_option_arguments() const { return non_options_; }

    /** @return `true` if a lone `-` was among the non-option arguments. */
    bool parsed_solitary_hyphen() const;

    const std::vector<Entry>& entries() const { return entries_; }

    /**
     * @brief Resolve @p name and check that its values are stored as @p kind.
     *
     * @throws OptionError with @ref ErrorKind::UnknownOption or
     *         @ref ErrorKind::InvalidOptionType.
     */
    const Option& option(const std::string& name, ValueKind kind) const;

    /**
     * @brief All values of option @p name as @p T.
     *
     * @throws OptionError with @ref ErrorKind::UnknownOption when @p name is
     *         unknown, or @ref ErrorKind::InvalidOptionType when the option
     *         does not store @p T.
     */
    template <typename T> std::vector<T> values(const std::string& name) const {
        const Entry& e = typed_entry(name, &holds_kind<T>);
        std::vector<T> out;
        out.reserve(e.values.size());
        for (const auto& v : e.values)
            out.push_back(std::get<T>(v));
        return out;
    }

    /**
     * @brief Single value of a non-repeatable option.
     *
     * @return The collected value, or an empty optional if none was given.
     * @throws OptionError with @ref ErrorKind::InvalidRetrievalType if the
     *         option is repeatable.
     */
    template <typename T> std::optional<T> value(const std::string& name) const {
        const Entry& e = single_entry(name, &holds_kind<T>);
        if (e.values.empty())
            return std::nullopt;
        return std::get<T>(e.values.front());
    }

    /**
     * @brief Single value of a non-repeatable option, or @p def.
     *
     * For enumerated options @p def must itself be an allowed value;
     * otherwise @ref ErrorKind::IllegalValue is thrown whether or not a
     * value was parsed.
     */
    template <typename T> T value(const std::string& name, const T& def) const {
        const Entry& e = single_entry(name, &holds_kind<T>);
        if (!e.option->is_value_valid(OptionValue(std::in_place_type<T>, def), locale_))
            throw OptionError(ErrorKind::IllegalValue, *e.option,
                              to_string(OptionValue(std::in_place_type<T>, def)), true);
        if (e.values.empty())
            return def;
        return std::get<T>(e.values.front());
    }

    /** @return Whether flag option @p name evaluated to true at least once. */
    bool flag(const std::string& name) const { return flag_count(name) > 0; }

    /** @return How many times Boolean option @p name evaluated to true. */
    std::size_t flag_count(const std::string& name) const;

    /** @return Canonicalized paths collected for File option @p name. */
    std::vector<std::filesystem::path> file_values(const std::string& name) const;

    /** @return Canonicalized path of File option @p name, or @p def. */
    std::filesystem::path file_value(const std::string& name,
                                     const std::filesystem::path& def = {}) const;

  private:
    friend class ArgScanner;

    Entry* find_entry(const Option& option);
    const Entry* find_entry(const Option& option) const;
    const Entry& named_entry(const std::string& name) const;
    const Entry& typed_entry(const std::string& name, bool (*accepts)(ValueKind)) const;
    const Entry& single_entry(const std::string& name, bool (*accepts)(ValueKind)) const;

    std::vector<Entry> entries_;
    std::vector<std::string> non_options_;
    std::locale locale_ = std::locale::classic();
};

} // namespace claparse

#endif // CLAPARSE_PARSE_RESULT_HPP
