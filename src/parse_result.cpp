#include "claparse/parse_result.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace claparse {

ParseResult::ParseResult(const OptionRegistry& registry, const std::locale& locale)
    : locale_(locale) {
    entries_.reserve(registry.size());
    for (const auto& o : registry.options())
        entries_.push_back(Entry{o, {}});
}

ParseResult::Entry* ParseResult::find_entry(const Option& option) {
    for (auto& e : entries_) {
        if (e.option.get() == &option)
            return &e;
    }
    return nullptr;
}

const ParseResult::Entry* ParseResult::find_entry(const Option& option) const {
    for (const auto& e : entries_) {
        if (e.option.get() == &option)
            return &e;
    }
    return nullptr;
}

const ParseResult::Entry& ParseResult::named_entry(const std::string& name) const {
    if (name.size() == 1) {
        for (const auto& e : entries_) {
            if (e.option->short_name() == name[0])
                return e;
        }
    }
    if (!name.empty()) {
        for (const auto& e : entries_) {
            if (e.option->long_name() == name)
                return e;
        }
    }
    throw OptionError(ErrorKind::UnknownOption, name);
}

const ParseResult::Entry& ParseResult::typed_entry(const std::string& name,
                                                   bool (*accepts)(ValueKind)) const {
    const Entry& e = named_entry(name);
    if (!accepts(e.option->kind()))
        throw OptionError(ErrorKind::InvalidOptionType, e.option->display_name());
    return e;
}

const ParseResult::Entry& ParseResult::single_entry(const std::string& name,
                                                    bool (*accepts)(ValueKind)) const {
    const Entry& e = typed_entry(name, accepts);
    if (e.option->allows_many())
        throw OptionError(ErrorKind::InvalidRetrievalType, e.option->display_name());
    return e;
}

const std::vector<OptionValue>& ParseResult::values_of(const Option& option) const {
    const Entry* e = find_entry(option);
    if (e == nullptr)
        throw OptionError(ErrorKind::UnknownOption, option.display_name());
    return e->values;
}

const std::vector<OptionValue>& ParseResult::values_of(const std::string& name) const {
    return named_entry(name).values;
}

const Option& ParseResult::option(const std::string& name, ValueKind kind) const {
    const Entry& e = named_entry(name);
    if (e.option->kind() != kind)
        throw OptionError(ErrorKind::InvalidOptionType, e.option->display_name());
    return *e.option;
}

bool ParseResult::parsed_solitary_hyphen() const {
    return std::find(non_options_.begin(), non_options_.end(), "-") != non_options_.end();
}

std::size_t ParseResult::flag_count(const std::string& name) const {
    const Entry& e = typed_entry(name, &holds_kind<bool>);
    return static_cast<std::size_t>(std::count_if(e.values.begin(), e.values.end(),
                                                  [](const OptionValue& v) {
                                                      return std::get<bool>(v);
                                                  }));
}

std::vector<fs::path> ParseResult::file_values(const std::string& name) const {
    const Entry& e = typed_entry(name, &holds_kind<fs::path>);
    std::vector<fs::path> out;
    for (const auto& v : e.values) {
        const auto& p = std::get<fs::path>(v);
        std::error_code ec;
        fs::path canon = fs::weakly_canonical(p, ec);
        if (ec)
            throw OptionError(ErrorKind::IllegalValue, *e.option, p.string(), true);
        out.push_back(canon);
    }
    return out;
}

fs::path ParseResult::file_value(const std::string& name, const fs::path& def) const {
    const Entry& e = single_entry(name, &holds_kind<fs::path>);
    if (e.values.empty())
        return def;
    const auto& p = std::get<fs::path>(e.values.front());
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(p, ec);
    if (ec)
        throw OptionError(ErrorKind::IllegalValue, *e.option, p.string(), true);
    return canon;
}

} // namespace claparse
