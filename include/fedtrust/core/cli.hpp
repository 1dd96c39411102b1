#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fedtrust::core {

// One run of the fedtrust tool: global options plus the command and its arguments
struct Invocation {
    std::string command;
    std::vector<std::string> args;   // args[0] is the command itself
    std::string config_path = "fedtrust.conf";
    std::optional<std::string> server_name;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);
    
    bool parse(int argc, char* argv[], Invocation& out_invocation);
    
    const std::string& get_error() const { return error_; }
    
    void print_help(std::ostream& out) const;
    void print_version(std::ostream& out) const;

private:
    enum class OptionId {
        Help,
        Version,
        Config,
        Verbose,
        ServerName
    };
    
    struct OptionSpec {
        OptionId id;
        char short_name;            // '\0' when the option has no short form
        std::string_view long_name;
        std::string_view value_name; // empty for flags
        std::string_view description;
    };
    
    static const std::vector<OptionSpec>& option_specs();
    static const OptionSpec* find_long(std::string_view name);
    static const OptionSpec* find_short(char name);
    static void apply(const OptionSpec& spec, const std::string& value, Invocation& invocation);
    
    std::string program_name_;
    std::string error_;
};

}
