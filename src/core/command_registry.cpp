#include "fedtrust/core/command_registry.hpp"
#include "fedtrust/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>

namespace fedtrust::core {

CommandRegistry::CommandRegistry(std::shared_ptr<CommandContext> context) {
    register_command("resolve", std::make_unique<ResolveCommandHandler>(context));
    register_command("server-key", std::make_unique<ServerKeyCommandHandler>(context));
    register_command("keys", std::make_unique<KeysCommandHandler>(context));
    register_command("hash", std::make_unique<HashCommandHandler>(context));
    register_command("redact", std::make_unique<RedactCommandHandler>(context));
    register_command("sign", std::make_unique<SignCommandHandler>(context));
    register_command("verify", std::make_unique<VerifyCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&name](const Entry& entry) { return entry.name == name; });
    if (it != commands_.end()) {
        it->handler = std::move(handler);
        return;
    }
    commands_.push_back(Entry{name, std::move(handler)});
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& entry : commands_) {
        if (entry.name == command) {
            return entry.handler.get();
        }
    }
    return nullptr;
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto* handler = find(command);
    if (!handler) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    LOG_DEBUG("Running command '{}' with {} argument(s)", command, args.empty() ? 0 : args.size() - 1);
    
    // Services are built lazily, so opening the key database can fail here
    try {
        return handler->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' failed: {}", command, e.what());
        return CommandResult::error(command + " failed: " + e.what());
    }
}

CommandResult CommandRegistry::execute(const Invocation& invocation) {
    if (invocation.command.empty()) {
        return CommandResult::error("No command given");
    }
    return execute_command(invocation.command, invocation.args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& entry : commands_) {
        names.push_back(entry.name);
    }
    return names;
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    
    for (const auto& entry : commands_) {
        out << "  " << std::left << std::setw(12) << entry.name
            << entry.handler->get_description() << "\n";
        out << "  " << std::setw(12) << " "
            << "Usage: " << entry.handler->get_usage() << "\n";
    }
}

}
