#include "fedtrust/core/command_handler.hpp"
#include "fedtrust/core/config.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include "fedtrust/events/content_hasher.hpp"
#include "fedtrust/events/event.hpp"
#include "fedtrust/events/redactor.hpp"
#include "fedtrust/events/room_version.hpp"
#include "fedtrust/federation/dns_client.hpp"
#include "fedtrust/federation/http_client.hpp"
#include "fedtrust/federation/server_resolver.hpp"
#include "fedtrust/keys/key_store.hpp"
#include "fedtrust/signing/event_signer.hpp"
#include "fedtrust/signing/event_verifier.hpp"
#include "fedtrust/storage/sqlite_key_cache_store.hpp"
#include <stdexcept>

namespace fedtrust::core {

bool load_json_file(const std::string& path, json::Value& out_value, std::string& error) {
    auto text = utils::FileUtils::read_file(path);
    if (!text) {
        error = "Cannot read " + path;
        return false;
    }
    
    auto parsed = json::try_parse(*text);
    if (!parsed) {
        error = path + " is not valid JSON";
        return false;
    }
    
    out_value = std::move(*parsed);
    return true;
}

// CommandContext Implementation
CommandContext::CommandContext(const Config& config, std::string server_name, std::ostream& out)
    : config_(&config), server_name_(std::move(server_name)), out_(out) {
}

CommandContext::CommandContext(std::string server_name,
                               std::shared_ptr<federation::ServerResolver> resolver,
                               std::shared_ptr<keys::KeyStore> key_store,
                               std::ostream& out)
    : server_name_(std::move(server_name)), out_(out),
      resolver_(std::move(resolver)), key_store_(std::move(key_store)) {
}

std::shared_ptr<federation::ServerResolver> CommandContext::resolver() {
    if (!resolver_) {
        if (!config_) {
            throw std::runtime_error("No resolver configured");
        }
        
        auto http = std::make_shared<federation::CurlHttpClient>(
            federation::HttpClientConfig::from_config(*config_));
        resolver_ = std::make_shared<federation::ServerResolver>(
            std::make_shared<federation::SystemDnsClient>(),
            http,
            federation::ResolverConfig::from_config(*config_));
    }
    return resolver_;
}

std::shared_ptr<keys::KeyStore> CommandContext::key_store() {
    if (!key_store_) {
        if (!config_) {
            throw std::runtime_error("No key store configured");
        }
        
        auto db_path = utils::FileUtils::expand_home(config_->get_string("keys.database", "fedtrust.db"));
        auto store = std::make_shared<storage::SqliteKeyCacheStore>(db_path);
        if (!store->initialize()) {
            throw std::runtime_error("Failed to open key database " + db_path.string());
        }
        
        key_store_ = std::make_shared<keys::KeyStore>(
            store,
            resolver(),
            std::make_shared<federation::CurlHttpClient>(federation::HttpClientConfig::from_config(*config_)),
            keys::KeyStoreConfig::from_config(*config_));
    }
    return key_store_;
}

// ResolveCommandHandler Implementation
CommandResult ResolveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& server_name = args[1];
    LOG_INFO("Resolving {}", server_name);
    
    federation::ResolvedServer server;
    auto result = context_->resolver()->resolve(server_name, server);
    if (!result) {
        return CommandResult::error("Cannot resolve " + server_name + ": " + result.describe());
    }
    
    auto& out = context_->out();
    out << "Server:       " << server_name << "\n";
    out << "Address:      " << server.endpoint() << "\n";
    out << "Host header:  " << server.host_header << "\n";
    out << "TLS name:     " << server.tls_hostname << "\n";
    out << "Method:       " << federation::to_string(server.resolution_method) << "\n";
    
    return CommandResult::ok();
}

// ServerKeyCommandHandler Implementation
CommandResult ServerKeyCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const auto& server_name = args[1];
    const auto& key_id = args[2];
    
    std::string public_key;
    auto result = context_->key_store()->get_server_public_key(server_name, key_id, public_key);
    if (!result) {
        return CommandResult::error("No trusted key " + key_id + " for " + server_name + ": " + result.describe());
    }
    
    context_->out() << server_name << " " << key_id << " " << public_key << "\n";
    return CommandResult::ok();
}

// KeysCommandHandler Implementation
CommandResult KeysCommandHandler::execute(const std::vector<std::string>&) {
    json::Value document;
    auto result = context_->key_store()->build_local_key_bundle(context_->server_name(), document);
    if (!result) {
        return CommandResult::error("Cannot build key document: " + result.describe());
    }
    
    context_->out() << document.dump(2) << "\n";
    return CommandResult::ok();
}

// HashCommandHandler Implementation
CommandResult HashCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    json::Value document;
    std::string error;
    if (!load_json_file(args[1], document, error)) {
        return CommandResult::error(error);
    }
    if (!document.is_object()) {
        return CommandResult::error(args[1] + " does not hold a JSON object");
    }
    
    auto hash = events::ContentHasher::calculate_content_hash(document);
    auto& out = context_->out();
    out << "sha256: " << hash << "\n";
    
    auto hashes = document.find("hashes");
    if (hashes != document.end() && hashes->is_object()) {
        auto claimed = hashes->find("sha256");
        if (claimed != hashes->end() && claimed->is_string()) {
            out << "claimed: " << claimed->get<std::string>()
                << (claimed->get<std::string>() == hash ? " (matches)" : " (MISMATCH)") << "\n";
        }
    }
    
    return CommandResult::ok();
}

// RedactCommandHandler Implementation
CommandResult RedactCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    json::Value document;
    std::string error;
    if (!load_json_file(args[1], document, error)) {
        return CommandResult::error(error);
    }
    if (!document.is_object()) {
        return CommandResult::error(args[1] + " does not hold a JSON object");
    }
    
    auto version = events::RoomVersion::parse(args[2]);
    if (!version.is_known()) {
        LOG_WARN("Unknown room version {}, applying version {} rules", args[2], events::NEWEST_ROOM_VERSION);
    }
    
    auto& out = context_->out();
    out << json::encode_canonical(events::Redactor::redact(document, version)) << "\n";
    
    if (version.derives_event_id()) {
        auto event = events::Event::from_json(document);
        if (auto event_id = events::ContentHasher::compute_event_id(event, version)) {
            LOG_INFO("Event id in room version {}: {}", version.id(), *event_id);
        }
    }
    
    return CommandResult::ok();
}

// SignCommandHandler Implementation
CommandResult SignCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    json::Value document;
    std::string error;
    if (!load_json_file(args[1], document, error)) {
        return CommandResult::error(error);
    }
    
    auto key_store = context_->key_store();
    storage::ServerSigningKey key;
    auto result = key_store->get_server_signing_key(context_->server_name(), key);
    if (!result) {
        return CommandResult::error("No signing key: " + result.describe());
    }
    
    auto event = events::Event::from_json(document);
    signing::EventSigner signer(key_store, context_->server_name());
    signer.sign_event(event, key.key_id);
    
    context_->out() << json::encode_canonical(event.to_json()) << "\n";
    return CommandResult::ok();
}

// VerifyCommandHandler Implementation
CommandResult VerifyCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    json::Value document;
    std::string error;
    if (!load_json_file(args[1], document, error)) {
        return CommandResult::error(error);
    }
    
    std::vector<std::string> servers(args.begin() + 2, args.end());
    signing::EventVerifier verifier(context_->key_store());
    auto result = verifier.validate_event_crypto(document, servers);
    if (!result) {
        return CommandResult::error("Verification failed: " + result.describe(), 2);
    }
    
    context_->out() << "OK: signed by";
    for (const auto& server : servers) {
        context_->out() << " " << server;
    }
    context_->out() << ", content hash matches\n";
    return CommandResult::ok();
}

}
