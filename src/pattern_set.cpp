#include "claparse/pattern_set.hpp"
#include <cstring>
#include "claparse/logger.hpp"

namespace claparse {

const char* const kShortNamePattern = "[A-Za-z0-9@?]";
const char* const kLongNamePattern = "[A-Za-z0-9][-A-Za-z0-9]*[A-Za-z0-9]";

namespace {

// Characters with a meaning inside a bracket expression, or outside one.
const char* const kRegexSpecial = "\\^$.|?*+()[]{}-/";

} // namespace

std::string make_char_class(const std::string& names) {
    std::string out = "[";
    for (char c : names) {
        if (std::strchr(kRegexSpecial, c) != nullptr)
            out += '\\';
        out += c;
    }
    out += "]";
    return out;
}

PatternSet compile_patterns(const OptionRegistry& registry) {
    PatternSet set;
    for (const auto& o : registry.options()) {
        if (o->requires_value())
            set.value_names += o->short_name();
        else
            set.flag_names += o->short_name();
    }

    set.long_option_source = std::string("--(") + kLongNamePattern + ")";
    set.short_option_source = std::string("[-/](") + kShortNamePattern + ")";
    set.long_option = std::regex(set.long_option_source);
    set.short_option = std::regex(set.short_option_source);

    const std::string flags = make_char_class(set.flag_names);
    if (!set.flag_names.empty()) {
        set.flag_cluster_source = "[-/](" + flags + "+)";
        set.flag_cluster = std::regex(set.flag_cluster_source);
    }
    if (!set.value_names.empty()) {
        const std::string leading = set.flag_names.empty() ? "()" : "(" + flags + "*)";
        set.flags_then_value_source =
            "[-/]" + leading + "(" + make_char_class(set.value_names) + ")";
        set.flags_then_value = std::regex(set.flags_then_value_source);
    }

    log_debug("Compiled option patterns", {{"flags", set.flag_names},
                                           {"values", set.value_names},
                                           {"flag_cluster", set.flag_cluster_source},
                                           {"flags_then_value", set.flags_then_value_source}});
    return set;
}

} // namespace claparse
