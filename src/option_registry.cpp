#include "claparse/option_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include "claparse/logger.hpp"
#include "claparse/option_error.hpp"

namespace claparse {

std::shared_ptr<Option> OptionRegistry::add(std::shared_ptr<Option> option) {
    if (!option)
        throw std::invalid_argument("Cannot register a null option");
    for (const auto& o : options_) {
        if (o->short_name() == option->short_name())
            throw OptionError(ErrorKind::DuplicateName, std::string(1, option->short_name()));
        if (option->has_long_name() && o->long_name() == option->long_name())
            throw OptionError(ErrorKind::DuplicateName, option->long_name());
    }
    options_.push_back(option);
    log_debug("Registered option", {{"option", option->display_name()},
                                    {"kind", to_string(option->kind())},
                                    {"min", std::to_string(option->min_count())},
                                    {"max", std::to_string(option->max_count())}});
    return option;
}

bool OptionRegistry::remove(const std::shared_ptr<Option>& option) {
    auto it = std::find(options_.begin(), options_.end(), option);
    if (it == options_.end())
        throw OptionError(ErrorKind::UnknownOption, option ? option->display_name() : "");
    options_.erase(it);
    return true;
}

bool OptionRegistry::remove(const std::string& name) {
    auto opt = find(name);
    if (!opt)
        throw OptionError(ErrorKind::UnknownOption, name);
    return remove(opt);
}

std::shared_ptr<Option> OptionRegistry::find_short(char c) const {
    for (const auto& o : options_) {
        if (o->short_name() == c)
            return o;
    }
    return nullptr;
}

std::shared_ptr<Option> OptionRegistry::find_long(const std::string& name) const {
    if (name.empty())
        return nullptr;
    for (const auto& o : options_) {
        if (o->long_name() == name)
            return o;
    }
    return nullptr;
}

std::shared_ptr<Option> OptionRegistry::find(const std::string& name) const {
    std::shared_ptr<Option> opt;
    if (name.size() == 1)
        opt = find_short(name[0]);
    if (!opt)
        opt = find_long(name);
    return opt;
}

void OptionRegistry::set_hidden(const std::string& name) {
    auto opt = find(name);
    if (!opt)
        throw OptionError(ErrorKind::UnknownOption, name);
    opt->set_hidden();
}

} // namespace claparse
