#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "claparse/arg_parser.hpp"
#include "claparse/config_utils.hpp"
#include "claparse/logger.hpp"
#include "claparse/version.hpp"

using namespace claparse;

static const char* APP = "resize";

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool wants_help(const std::vector<std::string>& args) {
    return std::find(args.begin(), args.end(), "--help") != args.end() ||
           std::find(args.begin(), args.end(), "-?") != args.end();
}

int main(int argc, char* argv[]) {
    ArgParser parser;
    parser.add_integer_option('w', "width", "Width of resized images.", true, false);
    parser.add_integer_option('h', "height", "Height of resized images.", false, false);
    parser.add_directory_existing_option('d', "dest", "Destination directory.", false, false);
    parser.add_enum_string_option('f', "format", "Output image format.", false, false,
                                  {"jpg", "png"});
    parser.add_boolean_option('v', "verbose", "Displays extra runtime information.", true);
    parser.add_file_existing_option('c', "config",
                                    "Read additional options from a YAML or JSON file.", false,
                                    false);
    parser.add_string_option('l', "log-file", "Write a log to this file.");
    parser.add_boolean_option('@', "version", "Print the version and exit.");
    parser.add_boolean_option('?', "help", "Show this help message.");

    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        parser.parse(args);
        if (parser.flag("help")) {
            parser.print_usage(std::cout, true, APP, "<image> ...",
                               "Images are resized in place unless --dest is given.");
            return 0;
        }
        if (parser.flag("version")) {
            std::cout << APP << " (claparse " << VERSION << ")\n";
            return 0;
        }

        std::string log_file = parser.value<std::string>("log-file", "");
        if (!log_file.empty()) {
            LogLevel level = parser.flag_count("verbose") > 1 ? LogLevel::DEBUG : LogLevel::INFO;
            if (!init_logger(log_file, level))
                return 1;
        }

        std::filesystem::path config = parser.result().file_value("config");
        if (!config.empty()) {
            std::vector<std::string> from_file;
            std::string error;
            bool ok = ends_with(config.string(), ".json")
                          ? load_json_args(config.string(), parser.registry(), from_file, error)
                          : load_yaml_args(config.string(), parser.registry(), from_file, error);
            if (!ok) {
                std::cerr << "Failed to load " << config.string() << ": " << error << "\n";
                return 1;
            }
            from_file.insert(from_file.end(), args.begin(), args.end());
            parser.parse(from_file);
        }
    } catch (const OptionError& e) {
        // -w is mandatory, so a bare --help is rejected by the parser.
        if (wants_help(args)) {
            parser.print_usage(std::cout, true, APP, "<image> ...");
            return 0;
        }
        std::cerr << e.what() << "\n";
        parser.print_usage(std::cerr, false, APP, "<image> ...");
        return 1;
    }

    const ParseResult& res = parser.result();
    int width = res.value<int>("width", 0);
    int height = res.value<int>("height", width);
    std::string format = res.value<std::string>("format", "jpg");
    std::size_t verbosity = res.flag_count("verbose");

    log_info("Resizing", {{"width", std::to_string(width)},
                          {"height", std::to_string(height)},
                          {"format", format}});
    if (verbosity > 0) {
        std::cout << "Target size: " << width << "x" << height << " (" << format << ")\n";
        std::cout << "Destination: "
                  << (res.count(*parser.registry().find("dest")) > 0
                          ? res.file_value("dest").string()
                          : std::string("<in place>"))
                  << "\n";
    }
    for (const auto& image : res.non_option_arguments())
        std::cout << "Would resize " << image << "\n";
    shutdown_logger();
    return 0;
}
