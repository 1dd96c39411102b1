#pragma once

#include "fedtrust/core/cli.hpp"
#include "fedtrust/core/command_handler.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace fedtrust::core {

class CommandRegistry {
public:
    // Registers the built-in commands against one shared context
    explicit CommandRegistry(std::shared_ptr<CommandContext> context);
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    CommandResult execute(const Invocation& invocation);
    
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const;
    void print_help(std::ostream& out) const;

private:
    struct Entry {
        std::string name;
        std::unique_ptr<CommandHandler> handler;
    };
    
    CommandHandler* find(const std::string& command) const;
    
    // Kept in registration order so help lists commands the way they are used
    std::vector<Entry> commands_;
};

}
