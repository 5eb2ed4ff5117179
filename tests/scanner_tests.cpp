#include "test_common.hpp"
#include <stdexcept>

namespace {

ParseResult scan(const OptionRegistry& reg, const std::vector<std::string>& args) {
    PatternSet patterns = compile_patterns(reg);
    ArgScanner scanner(reg, patterns, std::locale::classic());
    return scanner.scan(args);
}

std::vector<int> ints(const ParseResult& res, const std::string& name) {
    return res.values<int>(name);
}

} // namespace

TEST_CASE("Separate and grouped flags are equivalent") {
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.add_boolean_option('b');
    parser.add_boolean_option('c');

    auto split = parser.parse({"-a", "-b", "-c"});
    REQUIRE(split.flag("a"));
    REQUIRE(split.flag("b"));
    REQUIRE(split.flag("c"));

    auto grouped = parser.parse({"-abc"});
    for (const char* name : {"a", "b", "c"})
        REQUIRE(grouped.values_of(name) == split.values_of(name));
    REQUIRE(grouped.non_option_arguments().empty());
}

TEST_CASE("Short option value spellings") {
    ArgParser parser;
    parser.add_integer_option('s', "size", "", false, false);
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"-s", "10"}, {"-s:10"}, {"-s=10"}, {"-s10"}, {"/s10"}}) {
        INFO("args: " << args.front());
        REQUIRE(ints(parser.parse(args), "s") == std::vector<int>{10});
    }
}

TEST_CASE("Long option value spellings") {
    ArgParser parser;
    parser.add_integer_option('s', "size", "", false, false);
    for (const auto& args : std::vector<std::vector<std::string>>{
             {"--size", "10"}, {"--size=10"}, {"--size:10"}}) {
        INFO("args: " << args.front());
        REQUIRE(ints(parser.parse(args), "size") == std::vector<int>{10});
    }
}

TEST_CASE("Double dash ends option processing") {
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.add_boolean_option('b');
    const auto& res = parser.parse({"-a", "--", "-b", "--"});
    REQUIRE(res.values<bool>("a") == std::vector<bool>{true});
    REQUIRE(res.values_of("b").empty());
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"-b", "--"});
}

TEST_CASE("Lone hyphen is a non-option argument") {
    ArgParser parser;
    const auto& res = parser.parse({"-"});
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"-"});
    REQUIRE(res.parsed_solitary_hyphen());

    parser.add_boolean_option('a');
    const auto& res2 = parser.parse({"in.txt", "-", "-a"});
    REQUIRE(res2.non_option_arguments() == std::vector<std::string>{"in.txt", "-"});
    REQUIRE(res2.flag("a"));
}

TEST_CASE("Mixed options and operands") {
    ArgParser parser;
    parser.add_integer_option('w', "width", "", false, false);
    parser.add_boolean_option('v', "verbose", "", true);
    const auto& res = parser.parse({"-w", "5", "-vv", "extra"});
    REQUIRE(ints(res, "w") == std::vector<int>{5});
    REQUIRE(res.values<bool>("v") == std::vector<bool>{true, true});
    REQUIRE(res.flag_count("verbose") == 2);
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"extra"});
}

TEST_CASE("Flags may precede a value option in one group") {
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.add_boolean_option('b');
    parser.add_string_option('o', "output");
    const auto& res = parser.parse({"-abofile.txt"});
    REQUIRE(res.flag("a"));
    REQUIRE(res.flag("b"));
    REQUIRE(res.values<std::string>("o") == std::vector<std::string>{"file.txt"});

    const auto& res2 = parser.parse({"-ao", "next.txt"});
    REQUIRE(res2.flag("a"));
    REQUIRE_FALSE(res2.flag("b"));
    REQUIRE(res2.values<std::string>("output") == std::vector<std::string>{"next.txt"});
}

TEST_CASE("Value option takes the next argument even if it looks like an option") {
    ArgParser parser;
    parser.add_integer_option('n', "", "", false, false);
    parser.add_boolean_option('a');
    const auto& res = parser.parse({"-n", "-3", "-a"});
    REQUIRE(ints(res, "n") == std::vector<int>{-3});
    REQUIRE(res.flag("a"));
}

TEST_CASE("Unknown options are rejected") {
    ArgParser parser;
    parser.add_boolean_option('a', "all");
    try {
        parser.parse({"--bogus"});
        FAIL("expected UnknownOption");
    } catch (const OptionError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownOption);
        REQUIRE(e.option_name() == "bogus");
    }
    REQUIRE(error_kind_of([&] { parser.parse({"-x"}); }) == ErrorKind::UnknownOption);
    REQUIRE_FALSE(parser.has_result());
}

TEST_CASE("A value option ends a group and takes the rest as its value") {
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.add_string_option('s', "size");
    parser.add_integer_option('t', "", "", false, false);
    const auto& res = parser.parse({"-ast5"});
    REQUIRE(res.flag("a"));
    REQUIRE(res.values<std::string>("s") == std::vector<std::string>{"t5"});
    REQUIRE(res.values_of("t").empty());
}

TEST_CASE("Missing value is reported") {
    ArgParser parser;
    parser.add_integer_option('s', "size", "", false, false);
    REQUIRE(error_kind_of([&] { parser.parse({"-s"}); }) == ErrorKind::IllegalValue);
    REQUIRE(error_kind_of([&] { parser.parse({"--size"}); }) == ErrorKind::IllegalValue);
    REQUIRE(error_kind_of([&] { parser.parse({"--size=ten"}); }) == ErrorKind::IllegalValue);
}

TEST_CASE("Flags do not take inline values") {
    ArgParser parser;
    parser.add_boolean_option('a', "all");
    REQUIRE(error_kind_of([&] { parser.parse({"--all=yes"}); }) == ErrorKind::IllegalValue);
}

TEST_CASE("Repeatable flags accept explicit values") {
    ArgParser parser;
    parser.add_boolean_option('v', "verbose", "", true);
    const auto& res = parser.parse({"--verbose=false", "-v"});
    REQUIRE(res.values<bool>("v") == std::vector<bool>{false, true});
    REQUIRE(res.flag_count("v") == 1);
}

TEST_CASE("Mandatory options must be present") {
    ArgParser parser;
    parser.add_integer_option('w', "width", "", true, false);
    try {
        parser.parse({"extra"});
        FAIL("expected a missing mandatory option");
    } catch (const OptionError& e) {
        REQUIRE(e.kind() == ErrorKind::IllegalValue);
        REQUIRE(e.option_name() == "-w,--width");
        REQUIRE_FALSE(e.has_value());
    }
}

TEST_CASE("Single valued options reject a second value") {
    ArgParser parser;
    parser.add_integer_option('s', "size", "", false, false);
    try {
        parser.parse({"-s", "1", "--size=2"});
        FAIL("expected DuplicateSingleValue");
    } catch (const OptionError& e) {
        REQUIRE(e.kind() == ErrorKind::DuplicateSingleValue);
        REQUIRE(e.value() == "2");
    }
}

TEST_CASE("Value limits and occurrence counts") {
    ArgParser parser;
    parser.add_string_option('i', "include", "", 2, 3);
    REQUIRE(error_kind_of([&] { parser.parse({"-ia", "-ib", "-ic", "-id"}); }) ==
            ErrorKind::ValueLimitExceeded);
    REQUIRE(error_kind_of([&] { parser.parse({"-ia"}); }) == ErrorKind::InvalidCount);
    const auto& res = parser.parse({"-ia", "-ib"});
    REQUIRE(res.values<std::string>("include") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Options with a zero maximum reject every value") {
    ArgParser parser;
    parser.add_string_option('x', "", "", 0, 0);
    REQUIRE(error_kind_of([&] { parser.parse({"-x", "v"}); }) == ErrorKind::IllegalValue);
    REQUIRE_NOTHROW(parser.parse({}));
}

TEST_CASE("Slash prefix and special short names") {
    ArgParser parser;
    parser.add_boolean_option('?', "help");
    parser.add_boolean_option('@', "version");
    const auto& res = parser.parse({"/?", "-@"});
    REQUIRE(res.flag("help"));
    REQUIRE(res.flag("version"));
}

TEST_CASE("Slash paths are read as short options") {
    ArgParser parser;
    parser.add_boolean_option('a');
    try {
        parser.parse({"/usr"});
        FAIL("expected UnknownOption");
    } catch (const OptionError& e) {
        REQUIRE(e.kind() == ErrorKind::UnknownOption);
        REQUIRE(e.option_name() == "u");
    }
    const auto& res = parser.parse({"-a", "--", "/usr"});
    REQUIRE(res.flag("a"));
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"/usr"});
    REQUIRE(parser.parse({"//srv"}).non_option_arguments() == std::vector<std::string>{"//srv"});
}

TEST_CASE("Very long values and operands are accepted") {
    const std::string big(100000, 'x');
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.add_string_option('s', "size");

    REQUIRE(parser.parse({"-s" + big}).values<std::string>("s") == std::vector<std::string>{big});
    REQUIRE(parser.parse({"-as=" + big}).values<std::string>("s") ==
            std::vector<std::string>{big});
    REQUIRE(parser.parse({"--size=" + big}).values<std::string>("s") ==
            std::vector<std::string>{big});

    const std::string spaced = "/tmp/" + big + " copy";
    const std::string slashes = "/" + std::string(100000, '/');
    const auto& res = parser.parse({spaced, slashes, big});
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{spaced, slashes, big});

    REQUIRE(error_kind_of([&] { parser.parse({"/" + big}); }) == ErrorKind::UnknownOption);
}

TEST_CASE("Over-long option heads are rejected") {
    ArgParser parser;
    parser.add_boolean_option('v', "verbose", "", true);
    const std::size_t n = kMaxOptionHeadLength + 1;
    REQUIRE(error_kind_of([&] { parser.parse({"-" + std::string(n, 'v')}); }) ==
            ErrorKind::IllegalValue);
    REQUIRE(error_kind_of([&] { parser.parse({"--" + std::string(n, 'n') + "=1"}); }) ==
            ErrorKind::IllegalValue);
    REQUIRE(error_kind_of([&] { parser.parse({"--" + std::string(100000, 'n')}); }) ==
            ErrorKind::IllegalValue);

    const std::string prose = "--" + std::string(100000, 'n') + " and more";
    REQUIRE(parser.parse({prose}).non_option_arguments() == std::vector<std::string>{prose});
}

TEST_CASE("Arguments that match no rule are operands") {
    ArgParser parser;
    parser.add_boolean_option('a');
    const auto& res = parser.parse({"file", "--", "--all"});
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"file", "--all"});
}

TEST_CASE("Each parse starts from a clean result") {
    OptionRegistry reg;
    reg.add(std::make_shared<Option>(ValueKind::Integer, 's', "size", "", false, false));
    ParseResult first = scan(reg, {"-s", "1"});
    ParseResult second = scan(reg, {"-s", "2"});
    REQUIRE(ints(first, "s") == std::vector<int>{1});
    REQUIRE(ints(second, "s") == std::vector<int>{2});
    REQUIRE(scan(reg, {}).values_of("size").empty());
}

TEST_CASE("Failed parse discards the previous result") {
    ArgParser parser;
    parser.add_boolean_option('a');
    parser.parse({"-a"});
    REQUIRE(parser.has_result());
    REQUIRE_THROWS_AS(parser.parse({"-z"}), OptionError);
    REQUIRE_FALSE(parser.has_result());
    REQUIRE_THROWS_AS(parser.result(), std::logic_error);
}

TEST_CASE("Parse from argc and argv skips the program name") {
    ArgParser parser;
    parser.add_boolean_option('v', "verbose");
    const char* argv[] = {"prog", "-v", "file"};
    const auto& res = parser.parse(3, const_cast<char**>(argv));
    REQUIRE(res.flag("verbose"));
    REQUIRE(res.non_option_arguments() == std::vector<std::string>{"file"});
}
