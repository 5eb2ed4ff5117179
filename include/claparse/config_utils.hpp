#ifndef CLAPARSE_CONFIG_UTILS_HPP
#define CLAPARSE_CONFIG_UTILS_HPP
#include <string>
#include <vector>
#include "claparse/option_registry.hpp"

namespace claparse {

/**
 * @brief Turn a YAML configuration file into command line arguments.
 *
 * The root node must be a map whose keys name registered options, either
 * by long name or by one-character short name. Values translate as
 * follows:
 * - `true` adds one bare occurrence (`--name`), `false` and null add nothing;
 * - an integer given to a flag option repeats the flag that many times;
 * - any other scalar adds `--name` followed by the value as its own token;
 * - a sequence adds one occurrence per element.
 *
 * The generated tokens are appended to @p args in file order so they can be
 * placed ahead of the real command line before parsing.
 *
 * @param path     Filesystem path to the YAML file.
 * @param registry Options used to resolve keys.
 * @param args     Receives the generated argument tokens.
 * @param error    Human-readable message on failure.
 * @return `true` on success; `false` if the file is unreadable, malformed or
 *         names an unknown option.
 */
bool load_yaml_args(const std::string& path, const OptionRegistry& registry,
                    std::vector<std::string>& args, std::string& error);

/**
 * @brief Turn a JSON configuration file into command line arguments.
 *
 * Same rules as @ref load_yaml_args, with a JSON object at the root.
 */
bool load_json_args(const std::string& path, const OptionRegistry& registry,
                    std::vector<std::string>& args, std::string& error);

} // namespace claparse

#endif // CLAPARSE_CONFIG_UTILS_HPP
