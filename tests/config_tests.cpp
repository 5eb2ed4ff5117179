#include "test_common.hpp"

namespace {

ArgParser config_parser() {
    ArgParser parser;
    parser.add_integer_option('w', "width", "", false, false);
    parser.add_boolean_option('v', "verbose", "", true);
    parser.add_boolean_option('q', "quiet");
    parser.add_string_option('i', "include", "", false, true);
    parser.add_double_option('r', "ratio", "", false, false);
    return parser;
}

void write_file(const fs::path& p, const std::string& text) {
    std::ofstream ofs(p);
    ofs << text;
}

} // namespace

TEST_CASE("YAML config becomes argument tokens") {
    fs::path cfg = temp_path("cfg.yaml");
    write_file(cfg, "width: 42\n"
                    "verbose: 2\n"
                    "quiet: false\n"
                    "include:\n  - a.h\n  - b.h\n"
                    "r: 0.5\n");
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    REQUIRE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args == std::vector<std::string>{"--width", "42", "--verbose", "--verbose",
                                             "--include", "a.h", "--include", "b.h", "-r",
                                             "0.5"});

    const auto& res = parser.parse(args);
    REQUIRE(res.value<int>("width", 0) == 42);
    REQUIRE(res.flag_count("verbose") == 2);
    REQUIRE_FALSE(res.flag("quiet"));
    REQUIRE(res.values<std::string>("include") == std::vector<std::string>{"a.h", "b.h"});
    FS_REMOVE(cfg);
}

TEST_CASE("YAML flags accept booleans") {
    fs::path cfg = temp_path("cfg_flags.yaml");
    write_file(cfg, "quiet: true\nverbose: ~\n");
    ArgParser parser = config_parser();
    std::vector<std::string> args{"existing"};
    std::string err;
    REQUIRE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args == std::vector<std::string>{"existing", "--quiet"});
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config rejects unknown keys") {
    fs::path cfg = temp_path("cfg_unknown.yaml");
    write_file(cfg, "width: 1\ncolour: red\n");
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    REQUIRE_FALSE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(err.find("colour") != std::string::npos);
    REQUIRE(args.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config errors") {
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    REQUIRE_FALSE(load_yaml_args(temp_path("cfg_missing.yaml").string(), parser.registry(), args,
                                 err));
    REQUIRE(err == "Failed to open file");

    fs::path cfg = temp_path("cfg_list.yaml");
    write_file(cfg, "- width\n- 3\n");
    REQUIRE_FALSE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(err == "Root YAML node is not a map");

    write_file(cfg, "quiet: loud\n");
    REQUIRE_FALSE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(err.find("--quiet") != std::string::npos);

    write_file(cfg, "width: {a: 1}\n");
    REQUIRE_FALSE(load_yaml_args(cfg.string(), parser.registry(), args, err));
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config becomes argument tokens in file order") {
    fs::path cfg = temp_path("cfg.json");
    write_file(cfg, "{\n  \"width\": 42,\n  \"include\": [\"z.h\", \"a.h\"],\n"
                    "  \"v\": 3,\n  \"quiet\": true,\n  \"ratio\": null\n}");
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    REQUIRE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args == std::vector<std::string>{"--width", "42", "--include", "z.h", "--include",
                                             "a.h", "-v", "-v", "-v", "--quiet"});
    const auto& res = parser.parse(args);
    REQUIRE(res.flag_count("verbose") == 3);
    REQUIRE(res.flag("quiet"));
    FS_REMOVE(cfg);
}

TEST_CASE("JSON floating values keep every digit") {
    fs::path cfg = temp_path("cfg_double.json");
    write_file(cfg, "{\"ratio\": 3.14159265358979}");
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    REQUIRE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args.size() == 2);
    REQUIRE(args[1] == "3.14159265358979");
    REQUIRE(parser.parse(args).value<double>("ratio", 0.0) == 3.14159265358979);

    write_file(cfg, "{\"ratio\": 1234567.5}");
    args.clear();
    REQUIRE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args == std::vector<std::string>{"--ratio", "1234567.5"});
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config errors") {
    ArgParser parser = config_parser();
    std::vector<std::string> args;
    std::string err;
    fs::path cfg = temp_path("cfg_bad.json");

    write_file(cfg, "{ \"width\": ");
    REQUIRE_FALSE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE_FALSE(err.empty());

    write_file(cfg, "[1, 2]");
    REQUIRE_FALSE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(err == "Root JSON value is not an object");

    write_file(cfg, "{\"height\": 3}");
    REQUIRE_FALSE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(err.find("height") != std::string::npos);

    write_file(cfg, "{\"quiet\": \"yes\"}");
    REQUIRE_FALSE(load_json_args(cfg.string(), parser.registry(), args, err));
    REQUIRE(args.empty());
    FS_REMOVE(cfg);
}
