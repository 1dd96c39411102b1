#include "fedtrust/core/cli.hpp"
#include "fedtrust/core/command_registry.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace {

// Defaults, then the config file if present, then command line overrides
bool load_configuration(const fedtrust::core::Invocation& invocation, fedtrust::core::Config& config) {
    config.set_defaults();
    
    auto path = fedtrust::core::utils::FileUtils::expand_home(invocation.config_path);
    if (fedtrust::core::utils::FileUtils::exists(path) && !config.load_from_file(path.string())) {
        std::cerr << "Error: cannot read configuration " << path.string() << "\n";
        return false;
    }
    
    if (invocation.server_name) {
        config.set("server.name", *invocation.server_name);
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    fedtrust::core::CommandLineParser parser("fedtrust");
    fedtrust::core::Invocation invocation;
    
    if (!parser.parse(argc, argv, invocation)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }
    
    if (invocation.show_version) {
        parser.print_version(std::cout);
        return 0;
    }
    
    auto& config = fedtrust::core::Config::instance();
    if (!load_configuration(invocation, config)) {
        return 1;
    }
    
    auto log_options = fedtrust::core::LogOptions::from_config(config);
    if (invocation.verbose) {
        log_options.level = fedtrust::core::LogLevel::Debug;
    }
    fedtrust::core::Logger::initialize(log_options);
    
    auto server_name = config.get_string("server.name", "localhost");
    LOG_DEBUG("fedtrust starting for {}", server_name);
    
    auto context = std::make_shared<fedtrust::core::CommandContext>(config, server_name);
    fedtrust::core::CommandRegistry registry(context);
    
    if (invocation.show_help || invocation.command.empty()) {
        parser.print_help(std::cout);
        registry.print_help(std::cout);
        fedtrust::core::Logger::shutdown();
        return 0;
    }
    
    auto result = registry.execute(invocation);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!registry.has_command(invocation.command)) {
            registry.print_help(std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    fedtrust::core::Logger::shutdown();
    return result.exit_code;
}
