#include "claparse/arg_parser.hpp"
#include <ostream>
#include <stdexcept>
#include "claparse/arg_scanner.hpp"
#include "claparse/logger.hpp"
#include "claparse/pattern_set.hpp"
#include "claparse/usage_formatter.hpp"

namespace claparse {

namespace {

std::shared_ptr<Option> file_option(char short_name, const std::string& long_name,
                                    const std::string& description, bool mandatory,
                                    bool allow_many, FileExistence existence, FileType type) {
    auto opt = std::make_shared<Option>(ValueKind::File, short_name, long_name, description,
                                        mandatory, allow_many);
    opt->set_file_filter(existence, type);
    return opt;
}

} // namespace

ArgParser::ArgParser(const std::locale& locale) : locale_(locale) {}

std::shared_ptr<Option> ArgParser::add_option(std::shared_ptr<Option> option) {
    return registry_.add(std::move(option));
}

std::shared_ptr<Option> ArgParser::add_boolean_option(char short_name,
                                                      const std::string& long_name,
                                                      const std::string& description,
                                                      bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Boolean, short_name, long_name,
                                               description, false, allow_many));
}

std::shared_ptr<Option> ArgParser::add_boolean_option(char short_name,
                                                      const std::string& long_name,
                                                      const std::string& description,
                                                      int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Boolean, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_integer_option(char short_name,
                                                      const std::string& long_name,
                                                      const std::string& description,
                                                      bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Integer, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_integer_option(char short_name,
                                                      const std::string& long_name,
                                                      const std::string& description,
                                                      int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Integer, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_long_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Long, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_long_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Long, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_float_option(char short_name,
                                                    const std::string& long_name,
                                                    const std::string& description,
                                                    bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Float, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_float_option(char short_name,
                                                    const std::string& long_name,
                                                    const std::string& description,
                                                    int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Float, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_double_option(char short_name,
                                                     const std::string& long_name,
                                                     const std::string& description,
                                                     bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Double, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_double_option(char short_name,
                                                     const std::string& long_name,
                                                     const std::string& description,
                                                     int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Double, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_string_option(char short_name,
                                                     const std::string& long_name,
                                                     const std::string& description,
                                                     bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::String, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_string_option(char short_name,
                                                     const std::string& long_name,
                                                     const std::string& description,
                                                     int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::String, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_date_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   bool mandatory, bool allow_many) {
    return add_option(std::make_shared<Option>(ValueKind::Date, short_name, long_name,
                                               description, mandatory, allow_many));
}

std::shared_ptr<Option> ArgParser::add_date_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   int min_count, int max_count) {
    return add_option(std::make_shared<Option>(ValueKind::Date, short_name, long_name,
                                               description, min_count, max_count));
}

std::shared_ptr<Option> ArgParser::add_file_option(char short_name, const std::string& long_name,
                                                   const std::string& description,
                                                   bool mandatory, bool allow_many) {
    return add_option(file_option(short_name, long_name, description, mandatory, allow_many,
                                  FileExistence::Any, FileType::Any));
}

std::shared_ptr<Option> ArgParser::add_file_new_option(char short_name,
                                                       const std::string& long_name,
                                                       const std::string& description,
                                                       bool mandatory, bool allow_many) {
    return add_option(file_option(short_name, long_name, description, mandatory, allow_many,
                                  FileExistence::NonExisting, FileType::Any));
}

std::shared_ptr<Option> ArgParser::add_file_existing_option(char short_name,
                                                            const std::string& long_name,
                                                            const std::string& description,
                                                            bool mandatory, bool allow_many) {
    return add_option(file_option(short_name, long_name, description, mandatory, allow_many,
                                  FileExistence::Existing, FileType::File));
}

std::shared_ptr<Option> ArgParser::add_directory_existing_option(char short_name,
                                                                 const std::string& long_name,
                                                                 const std::string& description,
                                                                 bool mandatory,
                                                                 bool allow_many) {
    return add_option(file_option(short_name, long_name, description, mandatory, allow_many,
                                  FileExistence::Existing, FileType::Directory));
}

std::shared_ptr<Option> ArgParser::add_enum_string_option(char short_name,
                                                          const std::string& long_name,
                                                          const std::string& description,
                                                          bool mandatory, bool allow_many,
                                                          const std::vector<std::string>& allowed,
                                                          bool ignore_case) {
    auto opt = std::make_shared<Option>(ValueKind::EnumString, short_name, long_name,
                                        description, mandatory, allow_many);
    opt->set_allowed_values(allowed, ignore_case);
    return add_option(opt);
}

std::shared_ptr<Option> ArgParser::add_enum_integer_option(char short_name,
                                                           const std::string& long_name,
                                                           const std::string& description,
                                                           bool mandatory, bool allow_many,
                                                           const std::vector<int>& allowed) {
    auto opt = std::make_shared<Option>(ValueKind::EnumInteger, short_name, long_name,
                                        description, mandatory, allow_many);
    opt->set_allowed_values(allowed);
    return add_option(opt);
}

bool ArgParser::remove_option(const std::shared_ptr<Option>& option) {
    return registry_.remove(option);
}

bool ArgParser::remove_option(const std::string& name) { return registry_.remove(name); }

void ArgParser::set_hidden(const std::string& name) { registry_.set_hidden(name); }

const ParseResult& ArgParser::parse(const std::vector<std::string>& args) {
    result_.reset();
    log_debug("Parsing arguments", {{"count", std::to_string(args.size())}});
    const PatternSet patterns = compile_patterns(registry_);
    ArgScanner scanner(registry_, patterns, locale_);
    try {
        result_ = scanner.scan(args);
    } catch (const OptionError& e) {
        log_warning("Command line rejected",
                    {{"kind", to_string(e.kind())}, {"option", e.option_name()}});
        throw;
    }
    log_debug("Parse complete",
              {{"non_options", std::to_string(result_->non_option_arguments().size())}});
    return *result_;
}

const ParseResult& ArgParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);
    return parse(args);
}

const ParseResult& ArgParser::result() const {
    if (!result_)
        throw std::logic_error("No command line has been parsed");
    return *result_;
}

void ArgParser::print_usage(std::ostream& os, bool long_usage, const std::string& app,
                            const std::string& suffix_args, const std::string& extra_info) const {
    UsageFormatter fmt(registry_, locale_);
    fmt.set_show_long_names(show_long_names_);
    os << (long_usage ? fmt.long_usage(app, suffix_args, extra_info)
                      : fmt.short_usage(app, suffix_args, extra_info));
}

} // namespace claparse
