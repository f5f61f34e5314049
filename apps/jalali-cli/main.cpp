// =============================================================================
// Jalali Calendar Engine - Command Line Host
// Version: 1.2.0
// Usage: jalali-cli [options] <function> [args...]
// =============================================================================

#include <iostream>
#include <algorithm>
#include <iomanip>
#include <string>

#include "jalali/common/types.hpp"
#include "jalali/common/error.hpp"
#include "jalali/common/logging.hpp"
#include "jalali/common/cli.hpp"
#include "jalali/config/config.hpp"
#include "jalali/functions/date_functions.hpp"
#include "jalali/functions/registry.hpp"
#include "jalali/functions/settings.hpp"

namespace cfg = jalali::config;
namespace fn = jalali::functions;
namespace jlog = jalali::logging;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RESULT = 1;
constexpr int EXIT_USAGE = 2;

constexpr const char* CONFIG_ENV = "JALALI_CONFIG";

int usage_error(const jalali::cli::ArgParser& parser, const std::string& message) {
    std::cerr << "jalali-cli: " << message << "\n\n";
    parser.show_help(std::cerr);
    return EXIT_USAGE;
}

jalali::Result<fn::EngineSettings> load_settings(const jalali::cli::ArgParser& parser) {
    jalali::Optional<jalali::String> path;
    if (parser.is_set("config")) {
        path = parser.get("config");
    } else {
        path = cfg::get_env(CONFIG_ENV);
    }
    
    if (!path || path->empty()) {
        return fn::EngineSettings{};
    }
    
    auto config = cfg::load_config(*path);
    if (config.is_error()) {
        return config.error();
    }
    return fn::EngineSettings::from_config(config.value());
}

void print_functions(const fn::FunctionRegistry& registry) {
    for (const auto& name : registry.list_functions()) {
        const auto* descriptor = registry.find(name);
        std::cout << std::left << std::setw(56) << descriptor->signature()
                  << descriptor->description << "\n";
    }
}

int run(int argc, char* argv[]) {
    jalali::cli::ArgParser parser("jalali-cli",
        "Jalali Calendar Engine " + jalali::LIBRARY_VERSION.to_string() +
        " - Jalali/Gregorian conversion and date arithmetic");
    
    parser
        .add_option("config", 'c', "INI configuration file (default: $" + std::string(CONFIG_ENV) + ")")
        .add_option("log-level", 'l', "trace, debug, info, warn, error or off")
        .add_flag("list", 0, "List the available functions")
        .add_flag("version", 'V', "Print the version")
        .add_positional("function", "Function to invoke, see --list");
    
    if (!parser.parse(argc, argv)) {
        if (parser.help_requested()) {
            return EXIT_OK;
        }
        return usage_error(parser, parser.error());
    }
    
    if (parser.flag("version")) {
        std::cout << "jalali-cli " << jalali::LIBRARY_VERSION.to_string() << "\n";
        return EXIT_OK;
    }
    
    auto settings = load_settings(parser);
    if (settings.is_error()) {
        std::cerr << "jalali-cli: " << settings.error().to_string() << "\n";
        return EXIT_USAGE;
    }
    
    if (auto level_text = parser.get("log-level")) {
        auto level = jlog::parse_level(*level_text);
        if (!level) {
            return usage_error(parser, "Unknown log level: " + *level_text);
        }
        settings->log_level = *level;
    }
    
    auto& log_manager = jlog::LogManager::instance();
    log_manager.configure_default(settings->log_level, settings->log_file, jlog::LogLevel::DBG, true);
    log_manager.set_global_level(settings->log_file ? std::min(settings->log_level, jlog::LogLevel::DBG)
                                                    : settings->log_level);
    auto logger = log_manager.get_logger("cli");
    logger->debug("Settings: {}", settings->to_string());
    
    auto rule = settings->make_rule();
    if (rule.is_error()) {
        std::cerr << "jalali-cli: " << rule.error().to_string() << "\n";
        return EXIT_USAGE;
    }
    
    auto converter = std::make_shared<const jalali::calendar::CalendarConverter>(rule.value());
    auto functions = std::make_shared<const fn::DateFunctions>(converter);
    
    fn::FunctionRegistry registry;
    auto registered = fn::register_date_functions(registry, functions, settings->anchor_day);
    if (registered.is_error()) {
        std::cerr << "jalali-cli: " << registered.error().to_string() << "\n";
        return EXIT_FAILURE_RESULT;
    }
    
    if (parser.flag("list")) {
        print_functions(registry);
        return EXIT_OK;
    }
    
    if (!parser.check_positionals()) {
        return usage_error(parser, parser.error());
    }
    
    const auto name = *parser.positional(0);
    jalali::Result<jalali::String> result = jalali::String{};
    {
        jlog::ScopedTimer timer(logger, name);
        result = registry.invoke(name, parser.extra_args());
    }

    log_manager.shutdown();
    
    if (result.is_error()) {
        std::cerr << "jalali-cli: " << result.error().to_string() << "\n";
        return EXIT_FAILURE_RESULT;
    }
    std::cout << result.value() << "\n";
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "jalali-cli: " << e.what() << std::endl;
        return EXIT_FAILURE_RESULT;
    }
}
