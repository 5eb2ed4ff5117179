#include "claparse/config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include "claparse/logger.hpp"

namespace claparse {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string option_token(const std::string& key) {
    return key.size() == 1 ? "-" + key : "--" + key;
}

// A flag is switched on by `true` or repeated by a non-negative count.
bool push_flag(const std::string& token, bool on, long long repeat,
               std::vector<std::string>& args, std::string& error) {
    if (repeat < 0 || repeat > kMaxCountLimit) {
        error = "Invalid repeat count for " + token + ": " + std::to_string(repeat);
        return false;
    }
    if (!on)
        return true;
    for (long long i = 0; i < repeat; ++i)
        args.push_back(token);
    return true;
}

bool yaml_scalar_args(const Option& opt, const std::string& token, const YAML::Node& node,
                      std::vector<std::string>& args, std::string& error) {
    if (node.IsNull())
        return true;
    if (!node.IsScalar()) {
        error = "Nested value for " + token + " is not supported";
        return false;
    }
    if (opt.requires_value()) {
        args.push_back(token);
        args.push_back(node.Scalar());
        return true;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b))
        return push_flag(token, b, 1, args, error);
    long long n = 0;
    if (YAML::convert<long long>::decode(node, n))
        return push_flag(token, true, n, args, error);
    error = "Invalid value for flag " + token + ": " + node.Scalar();
    return false;
}

bool json_scalar_args(const Option& opt, const std::string& token, const ordered_json& v,
                      std::vector<std::string>& args, std::string& error) {
    if (v.is_null())
        return true;
    if (v.is_structured()) {
        error = "Nested value for " + token + " is not supported";
        return false;
    }
    if (!opt.requires_value()) {
        if (v.is_boolean())
            return push_flag(token, v.get<bool>(), 1, args, error);
        if (v.is_number_integer())
            return push_flag(token, true, v.get<long long>(), args, error);
        error = "Invalid value for flag " + token + ": " + v.dump();
        return false;
    }
    std::string s;
    if (v.is_string()) {
        s = v.get<std::string>();
    } else if (v.is_boolean()) {
        s = v.get<bool>() ? "true" : "false";
    } else if (v.is_number_unsigned()) {
        s = std::to_string(v.get<unsigned long long>());
    } else if (v.is_number_integer()) {
        s = std::to_string(v.get<long long>());
    } else {
        // Shortest text that reads back as the same double.
        s = v.dump();
    }
    args.push_back(token);
    args.push_back(s);
    return true;
}

const Option* resolve(const OptionRegistry& registry, const std::string& key,
                      std::string& error) {
    auto opt = registry.find(key);
    if (!opt) {
        error = "Unknown option in configuration: " + key;
        return nullptr;
    }
    return opt.get();
}

} // namespace

bool load_yaml_args(const std::string& path, const OptionRegistry& registry,
                    std::vector<std::string>& args, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    YAML::Node root;
    try {
        root = YAML::Load(ifs);
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
    if (root.IsNull())
        return true;
    if (!root.IsMap()) {
        error = "Root YAML node is not a map";
        return false;
    }
    std::vector<std::string> out;
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (!it->first.IsScalar()) {
            error = "Configuration keys must be scalars";
            return false;
        }
        const std::string key = it->first.Scalar();
        const Option* opt = resolve(registry, key, error);
        if (!opt)
            return false;
        const std::string token = option_token(key);
        const YAML::Node& node = it->second;
        if (node.IsSequence()) {
            for (const auto& elem : node) {
                if (!yaml_scalar_args(*opt, token, elem, out, error))
                    return false;
            }
        } else if (!yaml_scalar_args(*opt, token, node, out, error)) {
            return false;
        }
    }
    log_debug("Loaded YAML configuration",
              {{"path", path}, {"tokens", std::to_string(out.size())}});
    args.insert(args.end(), out.begin(), out.end());
    return true;
}

bool load_json_args(const std::string& path, const OptionRegistry& registry,
                    std::vector<std::string>& args, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    ordered_json root;
    try {
        ifs >> root;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
    if (!root.is_object()) {
        error = "Root JSON value is not an object";
        return false;
    }
    std::vector<std::string> out;
    for (const auto& [key, value] : root.items()) {
        const Option* opt = resolve(registry, key, error);
        if (!opt)
            return false;
        const std::string token = option_token(key);
        if (value.is_array()) {
            for (const auto& elem : value) {
                if (!json_scalar_args(*opt, token, elem, out, error))
                    return false;
            }
        } else if (!json_scalar_args(*opt, token, value, out, error)) {
            return false;
        }
    }
    log_debug("Loaded JSON configuration",
              {{"path", path}, {"tokens", std::to_string(out.size())}});
    args.insert(args.end(), out.begin(), out.end());
    return true;
}

} // namespace claparse
