#include "fedtrust/core/cli.hpp"
#include <iomanip>
#include <ostream>

namespace fedtrust::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
}

const std::vector<CommandLineParser::OptionSpec>& CommandLineParser::option_specs() {
    static const std::vector<OptionSpec> specs = {
        {OptionId::Help, 'h', "help", "", "Show this help message"},
        {OptionId::Version, 'v', "version", "", "Show version information"},
        {OptionId::Config, 'c', "config", "file", "Configuration file (default: fedtrust.conf)"},
        {OptionId::Verbose, '\0', "verbose", "", "Log debug output to the console"},
        {OptionId::ServerName, '\0', "server-name", "name", "Name of this homeserver (overrides server.name)"}
    };
    return specs;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(std::string_view name) {
    for (const auto& spec : option_specs()) {
        if (spec.long_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(char name) {
    for (const auto& spec : option_specs()) {
        if (spec.short_name != '\0' && spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

void CommandLineParser::apply(const OptionSpec& spec, const std::string& value, Invocation& invocation) {
    switch (spec.id) {
        case OptionId::Help: invocation.show_help = true; break;
        case OptionId::Version: invocation.show_version = true; break;
        case OptionId::Config: invocation.config_path = value; break;
        case OptionId::Verbose: invocation.verbose = true; break;
        case OptionId::ServerName: invocation.server_name = value; break;
    }
}

bool CommandLineParser::parse(int argc, char* argv[], Invocation& out_invocation) {
    out_invocation = Invocation{};
    error_.clear();
    
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (!options_done && arg == "--") {
            options_done = true;
            continue;
        }
        
        // Options are only recognised before the command name
        bool is_option = !options_done && out_invocation.args.empty() && arg.size() > 1 && arg[0] == '-';
        if (!is_option) {
            out_invocation.args.push_back(arg);
            continue;
        }
        
        const OptionSpec* spec = nullptr;
        std::optional<std::string> inline_value;
        std::string shown;
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
            }
            shown = "--" + name;
            spec = find_long(name);
        } else {
            shown = arg.substr(0, 2);
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
            }
            spec = find_short(arg[1]);
        }
        
        if (!spec) {
            error_ = "Unknown option: " + shown;
            return false;
        }
        
        if (spec->value_name.empty()) {
            if (inline_value) {
                error_ = "Option " + shown + " takes no value";
                return false;
            }
            apply(*spec, "", out_invocation);
            continue;
        }
        
        if (!inline_value) {
            if (i + 1 >= argc) {
                error_ = "Option " + shown + " requires a value";
                return false;
            }
            inline_value = argv[++i];
        }
        apply(*spec, *inline_value, out_invocation);
    }
    
    if (!out_invocation.args.empty()) {
        out_invocation.command = out_invocation.args.front();
    }
    return true;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";
    
    for (const auto& spec : option_specs()) {
        std::string flags = spec.short_name != '\0' ? std::string("-") + spec.short_name + ", " : "    ";
        flags += "--";
        flags += spec.long_name;
        if (!spec.value_name.empty()) {
            flags += " <" + std::string(spec.value_name) + ">";
        }
        out << "  " << std::left << std::setw(28) << flags << spec.description << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version 1.0.0\n";
    out << "Matrix federation trust core, built with C++20\n";
}

}
