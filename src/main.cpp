#include <iostream>
#include <string>
#include <vector>
#include "uplift/core/logger.hpp"
#include "uplift/core/config.hpp"
#include "uplift/core/cli.hpp"
#include "uplift/core/utils.hpp"
#include "uplift/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    uplift::core::CommandLineParser parser("uplift");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        uplift::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = uplift::core::Config::instance();
    config.set_defaults();
    
    auto config_file = uplift::core::utils::FileUtils::expand_user(parser.get_option("config", "~/.uplift.conf"));
    if (uplift::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }
    
    // Command line wins over the config file
    if (parser.has_option("database")) {
        config.set("store.database", parser.get_option("database"));
    }
    if (parser.has_option("base-url")) {
        config.set("backend.base_url", parser.get_option("base-url"));
    }
    
    auto log_level = parser.has_option("verbose") ?
        uplift::core::LogLevel::Debug :
        uplift::core::Logger::parse_level(config.get_string("log.level", "info"));
    auto log_file = uplift::core::utils::FileUtils::expand_user(config.get_string("log.file", "uplift.log"));
    uplift::core::Logger::initialize(log_file.string(), log_level);
    
    LOG_INFO("uplift {} starting up", uplift::core::CommandLineParser::VERSION);
    
    uplift::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    uplift::core::Logger::shutdown();
    return result.exit_code;
}
