#include "test_common.hpp"
#include <stdexcept>

TEST_CASE("Option names are validated") {
    REQUIRE(is_valid_short_name('a'));
    REQUIRE(is_valid_short_name('Z'));
    REQUIRE(is_valid_short_name('7'));
    REQUIRE(is_valid_short_name('@'));
    REQUIRE(is_valid_short_name('?'));
    REQUIRE_FALSE(is_valid_short_name('-'));
    REQUIRE_FALSE(is_valid_short_name(' '));

    REQUIRE(is_valid_long_name("size"));
    REQUIRE(is_valid_long_name("dry-run"));
    REQUIRE(is_valid_long_name("x2"));
    REQUIRE_FALSE(is_valid_long_name("x"));
    REQUIRE_FALSE(is_valid_long_name("-size"));
    REQUIRE_FALSE(is_valid_long_name("size-"));
    REQUIRE_FALSE(is_valid_long_name("dry_run"));
    REQUIRE_FALSE(is_valid_long_name(""));
    REQUIRE(is_valid_long_name(std::string(kMaxLongNameLength, 'n')));
    REQUIRE_FALSE(is_valid_long_name(std::string(kMaxLongNameLength + 1, 'n')));
}

TEST_CASE("Option constructor rejects bad names") {
    REQUIRE_THROWS_AS(Option(ValueKind::Boolean, '-', "", "", false, false),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Option(ValueKind::Boolean, 'a', "a", "", false, false),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Option(ValueKind::Boolean, 'a', "bad name", "", false, false),
                      std::invalid_argument);
    REQUIRE_NOTHROW(Option(ValueKind::Boolean, 'a', "", "", false, false));
}

TEST_CASE("Option counts follow mandatory and allow-many") {
    Option single(ValueKind::Integer, 's', "size", "", false, false);
    REQUIRE(single.min_count() == 0);
    REQUIRE(single.max_count() == 1);
    REQUIRE_FALSE(single.is_mandatory());
    REQUIRE_FALSE(single.allows_many());

    Option many(ValueKind::Integer, 'm', "many", "", true, true);
    REQUIRE(many.min_count() == 1);
    REQUIRE(many.max_count() == kMaxCountLimit);
    REQUIRE(many.is_mandatory());
    REQUIRE(many.allows_many());
}

TEST_CASE("Option count bounds are checked") {
    REQUIRE_THROWS_AS(Option(ValueKind::String, 's', "", "", -1, 1), std::invalid_argument);
    REQUIRE_THROWS_AS(Option(ValueKind::String, 's', "", "", 3, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(Option(ValueKind::String, 's', "", "", 0, kMaxCountLimit + 1),
                      std::invalid_argument);
    Option o(ValueKind::String, 's', "", "", 0, 0);
    REQUIRE(o.max_count() == 0);
    o.set_counts(2, 5);
    REQUIRE(o.min_count() == 2);
    REQUIRE(o.max_count() == 5);
    REQUIRE_THROWS_AS(o.set_counts(5, 2), std::invalid_argument);
}

TEST_CASE("Only Boolean options are flags") {
    REQUIRE_FALSE(Option(ValueKind::Boolean, 'v', "", "", false, false).requires_value());
    REQUIRE(Option(ValueKind::Integer, 'i', "", "", false, false).requires_value());
    REQUIRE(Option(ValueKind::String, 's', "", "", false, false).requires_value());
    REQUIRE(Option(ValueKind::File, 'f', "", "", false, false).requires_value());
}

TEST_CASE("Kind specific setters check the kind") {
    Option str(ValueKind::String, 's', "", "", false, false);
    REQUIRE_THROWS_AS(str.set_allowed_values(std::vector<std::string>{"a"}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(str.set_allowed_values(std::vector<int>{1}), std::invalid_argument);
    REQUIRE_THROWS_AS(str.set_file_filter(FileExistence::Existing, FileType::File),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(str.set_date_format("%d.%m.%Y"), std::invalid_argument);

    Option en(ValueKind::EnumString, 'e', "", "", false, false);
    REQUIRE_THROWS_AS(en.set_allowed_values(std::vector<std::string>{}), std::invalid_argument);
    en.set_allowed_values({"jpg", "png"}, false);
    REQUIRE(en.allowed_strings().size() == 2);
    REQUIRE_FALSE(en.ignore_case());
}

TEST_CASE("Option display names") {
    REQUIRE(Option(ValueKind::Boolean, 'v', "", "", false, false).display_name() == "-v");
    REQUIRE(Option(ValueKind::Boolean, 'v', "verbose", "", false, false).display_name() ==
            "-v,--verbose");
}

TEST_CASE("Allowed values are listed") {
    Option en(ValueKind::EnumString, 'f', "format", "", false, false);
    en.set_allowed_values({"jpg", "png"});
    REQUIRE(en.allowed_values_string() == "\"jpg\", \"png\"");

    Option ei(ValueKind::EnumInteger, 'l', "level", "", false, false);
    ei.set_allowed_values(std::vector<int>{1, 2, 3});
    REQUIRE(ei.allowed_values_string() == "1, 2, 3");
}

TEST_CASE("Option can be hidden") {
    Option o(ValueKind::Boolean, 'x', "", "", false, false);
    REQUIRE_FALSE(o.is_hidden());
    REQUIRE(o.set_hidden().is_hidden());
    REQUIRE_FALSE(o.set_hidden(false).is_hidden());
}

TEST_CASE("OptionError carries the offending option") {
    Option o(ValueKind::Integer, 'w', "width", "", 1, 2);
    OptionError e(ErrorKind::ValueLimitExceeded, o, "3", true);
    REQUIRE(e.kind() == ErrorKind::ValueLimitExceeded);
    REQUIRE(e.option_name() == "-w,--width");
    REQUIRE(e.value() == "3");
    REQUIRE(e.has_value());
    REQUIRE(e.min_count() == 1);
    REQUIRE(e.max_count() == 2);
    REQUIRE(std::string(e.what()).find("-w,--width") != std::string::npos);

    OptionError unknown(ErrorKind::UnknownOption, "bogus");
    REQUIRE(std::string(unknown.what()) == "Unknown option: bogus");
    REQUIRE_FALSE(unknown.has_value());

    OptionError grouped(ErrorKind::NotAFlag, "-s,--size", 's');
    REQUIRE(grouped.flag() == 's');
    REQUIRE(std::string(to_string(ErrorKind::NotAFlag)) == "NotAFlag");
}
