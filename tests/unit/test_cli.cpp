#include <gtest/gtest.h>
#include "fedtrust/core/cli.hpp"
#include "fedtrust/core/command_registry.hpp"
#include "fedtrust/core/utils.hpp"
#include "fedtrust/federation/server_resolver.hpp"
#include "fedtrust/keys/key_store.hpp"
#include "fedtrust/storage/memory_key_cache_store.hpp"
#include "../support/fakes.hpp"
#include <filesystem>
#include <sstream>

using namespace fedtrust::core;

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "fedtrust");
        argv_storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : argv_storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data(), invocation_);
    }
    
    CommandLineParser parser_{"fedtrust"};
    Invocation invocation_;
    std::vector<std::string> argv_storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, CommandAndArguments) {
    ASSERT_TRUE(parse({"resolve", "matrix.org"}));
    
    EXPECT_EQ(invocation_.command, "resolve");
    EXPECT_EQ(invocation_.args, (std::vector<std::string>{"resolve", "matrix.org"}));
}

TEST_F(CommandLineParserTest, OptionsWithValues) {
    ASSERT_TRUE(parse({"-c", "/etc/fedtrust.conf", "--server-name=example.org", "keys"}));
    
    EXPECT_EQ(invocation_.config_path, "/etc/fedtrust.conf");
    EXPECT_EQ(invocation_.server_name, "example.org");
    EXPECT_EQ(invocation_.command, "keys");
    EXPECT_EQ(invocation_.args, std::vector<std::string>{"keys"});
    
    ASSERT_TRUE(parse({"-c/tmp/other.conf", "--server-name", "matrix.example.org:8448", "keys"}));
    EXPECT_EQ(invocation_.config_path, "/tmp/other.conf");
    EXPECT_EQ(invocation_.server_name, "matrix.example.org:8448");
}

TEST_F(CommandLineParserTest, DefaultsAndFlags) {
    ASSERT_TRUE(parse({"--verbose", "keys"}));
    
    EXPECT_TRUE(invocation_.verbose);
    EXPECT_FALSE(invocation_.show_help);
    EXPECT_FALSE(invocation_.server_name.has_value());
    EXPECT_EQ(invocation_.config_path, "fedtrust.conf");
    
    ASSERT_TRUE(parse({"-h"}));
    EXPECT_TRUE(invocation_.show_help);
    EXPECT_FALSE(invocation_.show_version);
    
    EXPECT_FALSE(parse({"-hv"}));
    EXPECT_EQ(parser_.get_error(), "Option -h takes no value");
    
    ASSERT_TRUE(parse({"-v"}));
    EXPECT_TRUE(invocation_.show_version);
    EXPECT_TRUE(invocation_.command.empty());
}

TEST_F(CommandLineParserTest, OptionsStopAtCommand) {
    ASSERT_TRUE(parse({"verify", "-event.json", "example.org", "--verbose"}));
    
    EXPECT_FALSE(invocation_.verbose);
    EXPECT_EQ(invocation_.args, (std::vector<std::string>{"verify", "-event.json", "example.org", "--verbose"}));
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"--", "-odd-command"}));
    EXPECT_EQ(invocation_.command, "-odd-command");
    
    ASSERT_TRUE(parse({"verify", "--", "-event.json", "example.org"}));
    ASSERT_EQ(invocation_.args.size(), 3u);
    EXPECT_EQ(invocation_.args[1], "-event.json");
}

TEST_F(CommandLineParserTest, Errors) {
    EXPECT_FALSE(parse({"--bogus"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --bogus");
    
    EXPECT_FALSE(parse({"--server-name"}));
    EXPECT_EQ(parser_.get_error(), "Option --server-name requires a value");
    
    EXPECT_FALSE(parse({"--verbose=yes", "keys"}));
    EXPECT_EQ(parser_.get_error(), "Option --verbose takes no value");
    
    EXPECT_FALSE(parse({"-x"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: -x");
}

TEST_F(CommandLineParserTest, HelpListsOptions) {
    std::ostringstream out;
    parser_.print_help(out);
    
    EXPECT_EQ(out.str().rfind("Usage: fedtrust [options] <command> [args...]\n", 0), 0u);
    EXPECT_NE(out.str().find("-c, --config <file>"), std::string::npos);
    EXPECT_NE(out.str().find("    --server-name <name>"), std::string::npos);
}

namespace {
    const std::string LOCAL = "example.org:8448";
    const std::string LOCAL_KEY_URL = "https://example.org:8448/_matrix/key/v2/server";
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dns_ = std::make_shared<fedtrust::test::FakeDnsClient>();
        dns_->addresses["example.org"] = {"192.0.2.20"};
        http_ = std::make_shared<fedtrust::test::FakeHttpClient>();
        
        resolver_ = std::make_shared<fedtrust::federation::ServerResolver>(dns_, http_);
        key_store_ = std::make_shared<fedtrust::keys::KeyStore>(
            std::make_shared<fedtrust::storage::MemoryKeyCacheStore>(), resolver_, http_);
        
        context_ = std::make_shared<CommandContext>(LOCAL, resolver_, key_store_, out_);
        registry_ = std::make_unique<CommandRegistry>(context_);
        
        event_file_ = (std::filesystem::temp_directory_path() / "fedtrust_cli_event.json").string();
    }
    
    void TearDown() override {
        std::filesystem::remove(event_file_);
    }
    
    CommandResult run(const std::vector<std::string>& args) {
        out_.str("");
        return registry_->execute_command(args[0], args);
    }
    
    void write_event(const std::string& sender) {
        fedtrust::json::Value event = {
            {"room_id", "!room:example.org"},
            {"sender", sender},
            {"type", "m.room.message"},
            {"content", {{"body", "hello"}, {"msgtype", "m.text"}}},
            {"origin_server_ts", 1700000000000},
            {"prev_events", fedtrust::json::Value::array({"$prev"})},
            {"auth_events", fedtrust::json::Value::array({"$create"})},
            {"depth", 5}
        };
        ASSERT_TRUE(utils::FileUtils::write_file(event_file_, event.dump()));
    }
    
    std::shared_ptr<fedtrust::test::FakeDnsClient> dns_;
    std::shared_ptr<fedtrust::test::FakeHttpClient> http_;
    std::shared_ptr<fedtrust::federation::ServerResolver> resolver_;
    std::shared_ptr<fedtrust::keys::KeyStore> key_store_;
    std::ostringstream out_;
    std::shared_ptr<CommandContext> context_;
    std::unique_ptr<CommandRegistry> registry_;
    std::string event_file_;
};

TEST_F(CommandRegistryTest, RegistersEveryCommand) {
    for (const char* command : {"resolve", "server-key", "keys", "hash", "redact", "sign", "verify"}) {
        EXPECT_TRUE(registry_->has_command(command)) << command;
    }
    EXPECT_FALSE(registry_->has_command("share"));
    
    auto result = run({"share"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown command: share");
}

TEST_F(CommandRegistryTest, MissingArgumentsPrintUsage) {
    auto result = run({"resolve"});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.message, "Usage: fedtrust resolve <server_name>");
}

TEST_F(CommandRegistryTest, Resolve) {
    auto result = run({"resolve", "192.0.2.1:8008"});
    
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_NE(out_.str().find("Address:      192.0.2.1:8008"), std::string::npos);
    EXPECT_NE(out_.str().find("Host header:  192.0.2.1:8008"), std::string::npos);
}

TEST_F(CommandRegistryTest, ResolveFailure) {
    auto result = run({"resolve", "not a server"});
    
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("INVALID_SERVER_NAME"), std::string::npos);
}

TEST_F(CommandRegistryTest, HashReportsContentHash) {
    write_event("@alice:example.org:8448");
    
    ASSERT_TRUE(run({"hash", event_file_}).success);
    EXPECT_EQ(out_.str(), "sha256: gJrVBpxHLdpHr1+jmaZBqtRVRVxJuukqByq2Cr3IbkE\n");
}

TEST_F(CommandRegistryTest, HashOfMissingFile) {
    auto result = run({"hash", "/nonexistent/event.json"});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Cannot read /nonexistent/event.json");
}

TEST_F(CommandRegistryTest, RedactStripsContent) {
    write_event("@alice:example.org:8448");
    
    ASSERT_TRUE(run({"redact", event_file_, "11"}).success);
    EXPECT_EQ(out_.str().find("hello"), std::string::npos);
    EXPECT_NE(out_.str().find("\"room_id\":\"!room:example.org\""), std::string::npos);
}

TEST_F(CommandRegistryTest, SignThenVerify) {
    write_event("@alice:example.org:8448");
    
    ASSERT_TRUE(run({"sign", event_file_}).success);
    std::string signed_event = out_.str();
    EXPECT_NE(signed_event.find("\"signatures\":{\"example.org:8448\""), std::string::npos);
    ASSERT_TRUE(utils::FileUtils::write_file(event_file_, signed_event));
    
    fedtrust::json::Value bundle;
    ASSERT_TRUE(key_store_->build_local_key_bundle(LOCAL, bundle));
    http_->respond(LOCAL_KEY_URL, 200, bundle.dump());
    
    auto result = run({"verify", event_file_, LOCAL});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(out_.str(), "OK: signed by example.org:8448, content hash matches\n");
}

TEST_F(CommandRegistryTest, SignRefusesForeignEventWithoutThrowing) {
    write_event("@mallory:evil.org");
    
    auto result = run({"sign", event_file_});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message.rfind("sign failed: ", 0), 0u);
}

TEST_F(CommandRegistryTest, VerifyFailureExitCode) {
    write_event("@alice:example.org:8448");
    
    auto result = run({"verify", event_file_, LOCAL});
    
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 2);
}

TEST_F(CommandRegistryTest, KeysPrintsSignedDocument) {
    ASSERT_TRUE(run({"keys"}).success);
    
    auto document = fedtrust::json::try_parse(out_.str());
    ASSERT_TRUE(document.has_value());
    EXPECT_EQ((*document)["server_name"], LOCAL);
    EXPECT_TRUE((*document)["signatures"].contains(LOCAL));
}

TEST_F(CommandRegistryTest, ExecuteInvocation) {
    Invocation invocation;
    auto result = registry_->execute(invocation);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "No command given");
    
    invocation.command = "resolve";
    invocation.args = {"resolve", "192.0.2.1:8008"};
    out_.str("");
    EXPECT_TRUE(registry_->execute(invocation).success);
    EXPECT_NE(out_.str().find("192.0.2.1:8008"), std::string::npos);
}

TEST_F(CommandRegistryTest, HelpFollowsRegistrationOrder) {
    EXPECT_EQ(registry_->command_names(),
              (std::vector<std::string>{"resolve", "server-key", "keys", "hash", "redact", "sign", "verify"}));
    
    std::ostringstream help;
    registry_->print_help(help);
    auto resolve = help.str().find("  resolve");
    auto verify = help.str().find("  verify");
    ASSERT_NE(resolve, std::string::npos);
    ASSERT_NE(verify, std::string::npos);
    EXPECT_LT(resolve, verify);
    EXPECT_NE(help.str().find("Usage: fedtrust resolve <server_name>"), std::string::npos);
}
