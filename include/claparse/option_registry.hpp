#ifndef CLAPARSE_OPTION_REGISTRY_HPP
#define CLAPARSE_OPTION_REGISTRY_HPP
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "claparse/option.hpp"

namespace claparse {

/**
 * @brief Ordered collection of declared options.
 *
 * Insertion order is preserved and drives usage output. Short names are
 * unique across the registry, as are long names when present. The
 * registry is the single source of truth consulted by
 * @ref compile_patterns and @ref ArgScanner.
 */
class OptionRegistry {
    std::vector<std::shared_ptr<Option>> options_;

  public:
    /**
     * @brief Register an option.
     *
     * @param option Descriptor to append; must not be null.
     * @return The same @p option so callers can keep a handle to it.
     * @throws OptionError with @ref ErrorKind::DuplicateName if the short or
     *         long name is already taken.
     * @throws std::invalid_argument if @p option is null.
     */
    std::shared_ptr<Option> add(std::shared_ptr<Option> option);

    /**
     * @brief Remove a previously registered option by identity.
     *
     * @return `true` once the option has been removed.
     * @throws OptionError with @ref ErrorKind::UnknownOption when @p option
     *         is not registered here.
     */
    bool remove(const std::shared_ptr<Option>& option);

    /**
     * @brief Remove an option by short or long name.
     *
     * @throws OptionError with @ref ErrorKind::UnknownOption when no option
     *         has that name.
     */
    bool remove(const std::string& name);

    /** @return Option with short name @p c, or `nullptr`. */
    std::shared_ptr<Option> find_short(char c) const;

    /** @return Option with long name @p name, or `nullptr`. */
    std::shared_ptr<Option> find_long(const std::string& name) const;

    /**
     * @brief Look up by short name (when @p name is one character) and then
     * by long name.
     *
     * @return Matching option or `nullptr`.
     */
    std::shared_ptr<Option> find(const std::string& name) const;

    /**
     * @brief Hide the option named @p name from usage output.
     *
     * @throws OptionError with @ref ErrorKind::UnknownOption when no option
     *         has that name.
     */
    void set_hidden(const std::string& name);

    const std::vector<std::shared_ptr<Option>>& options() const { return options_; }
    std::size_t size() const { return options_.size(); }
    bool empty() const { return options_.empty(); }
};

} // namespace claparse

#endif // CLAPARSE_OPTION_REGISTRY_HPP
