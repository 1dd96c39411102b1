#pragma once

#include "fedtrust/json/canonical_json.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fedtrust::federation {
class ServerResolver;
}

namespace fedtrust::keys {
class KeyStore;
}

namespace fedtrust::core {

class Config;

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// Services shared by the command handlers. The resolver and key store are
// built from the configuration on first use, so commands that work on local
// files never open the key database.
class CommandContext {
public:
    CommandContext(const Config& config, std::string server_name, std::ostream& out = std::cout);
    
    // Pre-built services, for embedding and tests
    CommandContext(std::string server_name,
                   std::shared_ptr<federation::ServerResolver> resolver,
                   std::shared_ptr<keys::KeyStore> key_store,
                   std::ostream& out = std::cout);
    
    const std::string& server_name() const { return server_name_; }
    std::ostream& out() { return out_; }
    
    // Throws std::runtime_error when the key database cannot be opened
    std::shared_ptr<federation::ServerResolver> resolver();
    std::shared_ptr<keys::KeyStore> key_store();

private:
    const Config* config_ = nullptr;
    std::string server_name_;
    std::ostream& out_;
    std::shared_ptr<federation::ServerResolver> resolver_;
    std::shared_ptr<keys::KeyStore> key_store_;
};

class CommandHandler {
public:
    explicit CommandHandler(std::shared_ptr<CommandContext> context) : context_(std::move(context)) {}
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    std::shared_ptr<CommandContext> context_;
};

class ResolveCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resolve a server name to a connection target"; }
    std::string get_usage() const override { return "fedtrust resolve <server_name>"; }
};

class ServerKeyCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Fetch a remote server's verify key"; }
    std::string get_usage() const override { return "fedtrust server-key <server_name> <key_id>"; }
};

class KeysCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print this server's signed key document"; }
    std::string get_usage() const override { return "fedtrust keys"; }
};

class HashCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Compute an event's content hash"; }
    std::string get_usage() const override { return "fedtrust hash <event.json>"; }
};

class RedactCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the canonical redacted form of an event"; }
    std::string get_usage() const override { return "fedtrust redact <event.json> <room_version>"; }
};

class SignCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Hash and sign an event with the local key"; }
    std::string get_usage() const override { return "fedtrust sign <event.json>"; }
};

class VerifyCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Check an event's signatures and content hash"; }
    std::string get_usage() const override { return "fedtrust verify <event.json> <server_name>..."; }
};

// Reads and parses a JSON document, reporting failures in `error`
bool load_json_file(const std::string& path, json::Value& out_value, std::string& error);

}
