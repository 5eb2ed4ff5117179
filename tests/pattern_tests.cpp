#include "test_common.hpp"
#include <regex>

namespace {

OptionRegistry sample_registry() {
    OptionRegistry reg;
    reg.add(std::make_shared<Option>(ValueKind::Boolean, 'a', "all", "", false, false));
    reg.add(std::make_shared<Option>(ValueKind::Boolean, 'b', "", "", false, false));
    reg.add(std::make_shared<Option>(ValueKind::Integer, 's', "size", "", false, false));
    return reg;
}

} // namespace

TEST_CASE("Character classes escape regex syntax") {
    REQUIRE(make_char_class("ab") == "[ab]");
    REQUIRE(make_char_class("?@") == "[\\?@]");
    std::regex re(make_char_class("?@-") + "+");
    REQUIRE(std::regex_match("?-@", re));
    REQUIRE_FALSE(std::regex_match("a", re));
}

TEST_CASE("Long option rule matches the name only") {
    OptionRegistry reg = sample_registry();
    PatternSet p = compile_patterns(reg);
    std::smatch m;
    std::string arg = "--dry-run";
    REQUIRE(std::regex_match(arg, m, p.long_option));
    REQUIRE(m[1].str() == "dry-run");

    REQUIRE_FALSE(std::regex_match(std::string("--size=10"), p.long_option));
    REQUIRE_FALSE(std::regex_match(std::string("--x"), p.long_option));
    REQUIRE_FALSE(std::regex_match(std::string("--size-"), p.long_option));
    REQUIRE_FALSE(std::regex_match(std::string("--size"), p.short_option));
}

TEST_CASE("Flag cluster rule only accepts registered flags") {
    OptionRegistry reg = sample_registry();
    PatternSet p = compile_patterns(reg);
    REQUIRE(p.flag_cluster);
    REQUIRE(std::regex_match(std::string("-ab"), *p.flag_cluster));
    REQUIRE(std::regex_match(std::string("/ba"), *p.flag_cluster));
    REQUIRE_FALSE(std::regex_match(std::string("-as"), *p.flag_cluster));
    REQUIRE_FALSE(std::regex_match(std::string("-"), *p.flag_cluster));
}

TEST_CASE("Flags then value rule") {
    OptionRegistry reg = sample_registry();
    PatternSet p = compile_patterns(reg);
    REQUIRE(p.flags_then_value);
    REQUIRE(p.flag_names == "ab");
    REQUIRE(p.value_names == "s");
    std::smatch m;
    std::string arg = "-abs";
    REQUIRE(std::regex_match(arg, m, *p.flags_then_value));
    REQUIRE(m[1].str() == "ab");
    REQUIRE(m[2].str() == "s");

    arg = "/s";
    REQUIRE(std::regex_match(arg, m, *p.flags_then_value));
    REQUIRE(m[1].str().empty());

    REQUIRE_FALSE(std::regex_match(std::string("-sa"), *p.flags_then_value));
    REQUIRE_FALSE(std::regex_match(std::string("-abs10"), *p.flags_then_value));
}

TEST_CASE("Short option rule") {
    OptionRegistry reg = sample_registry();
    PatternSet p = compile_patterns(reg);
    std::smatch m;
    std::string arg = "-s";
    REQUIRE(std::regex_match(arg, m, p.short_option));
    REQUIRE(m[1].str() == "s");

    arg = "/?";
    REQUIRE(std::regex_match(arg, m, p.short_option));
    REQUIRE(m[1].str() == "?");

    REQUIRE_FALSE(std::regex_match(std::string("-_"), p.short_option));
}

TEST_CASE("Rules depending on missing option classes are omitted") {
    OptionRegistry flags_only;
    flags_only.add(std::make_shared<Option>(ValueKind::Boolean, 'v', "", "", false, true));
    PatternSet p = compile_patterns(flags_only);
    REQUIRE(p.flag_cluster);
    REQUIRE_FALSE(p.flags_then_value);

    OptionRegistry values_only;
    values_only.add(std::make_shared<Option>(ValueKind::String, 'o', "", "", false, false));
    PatternSet q = compile_patterns(values_only);
    REQUIRE_FALSE(q.flag_cluster);
    REQUIRE(q.flags_then_value);
    REQUIRE(std::regex_match(std::string("-o"), *q.flags_then_value));

    OptionRegistry empty;
    PatternSet r = compile_patterns(empty);
    REQUIRE_FALSE(r.flag_cluster);
    REQUIRE_FALSE(r.flags_then_value);
}
