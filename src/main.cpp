#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "config/messenger_config.hpp"
#include "core/address_book.hpp"
#include "crypto/identity_provider.hpp"
#include "discovery/peer_discovery.hpp"
#include "network/delivery_manager.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

std::atomic<bool> g_stopRequested(false);

void onSignal(int) {
    g_stopRequested = true;
}

}  // namespace

int main(int argc, char** argv) {
    using veilchat::util::logger::Logger;

    Logger::getInstance().info("[main] VeilChat node starting...");

    // 1. Parse configuration
    veilchat::config::MessengerConfig config;
    veilchat::util::ConfigParser configParser(config);

    std::string configPath = "veilchat.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        if (!configParser.loadFromFile(configPath)) {
            Logger::getInstance().info("[main] No config at " + configPath + ", using defaults.");
        }
        Logger::getInstance().setLogLevel(veilchat::util::logger::parseLogLevel(config.logLevel));
    } catch (const std::exception& ex) {
        Logger::getInstance().critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!config.logFile.empty() && !veilchat::util::logger::enableFileOutput(config.logFile)) {
        Logger::getInstance().warn("[main] Cannot open log file " + config.logFile);
    }

    // 2. Identity and collaborators
    std::shared_ptr<veilchat::crypto::Ed25519Identity> identity;
    try {
        identity = veilchat::crypto::Ed25519Identity::generate();
    } catch (const std::exception& ex) {
        Logger::getInstance().critical(std::string("[main] Cannot create identity: ") + ex.what());
        return 1;
    }
    if (config.peerId.empty()) {
        config.peerId = identity->peerId();
    }
    auto addressBook = std::make_shared<veilchat::core::StaticAddressBook>();

    // 3. Delivery manager
    veilchat::network::DeliveryManager manager(config, identity, addressBook);
    manager.subscribe([](const veilchat::network::Event& event) {
        if (auto* received = std::get_if<veilchat::network::MessageReceived>(&event)) {
            Logger::getInstance().info("[main] " + received->message.from + ": " +
                                       received->message.content);
        } else if (auto* error = std::get_if<veilchat::network::ErrorEvent>(&event)) {
            Logger::getInstance().warn("[main] " + error->context + ": " + error->error);
        }
    });

    uint16_t port = 0;
    try {
        port = manager.startServer(config.listenPort);
    } catch (const std::exception& ex) {
        Logger::getInstance().critical(std::string("[main] ") + ex.what());
        return 1;
    }

    // 4. LAN discovery
    veilchat::discovery::PeerDiscovery discovery(config, manager.localId(), identity->publicKey(),
                                                 port);
    try {
        discovery.startDiscovery();
    } catch (const std::exception& ex) {
        Logger::getInstance().warn(std::string("[main] Discovery disabled: ") + ex.what());
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    Logger::getInstance().info("[main] Node " + config.nodeName + " (" + manager.localId() +
                               ") running on port " + std::to_string(port) +
                               ". Press Ctrl+C to stop.");

    // 5. Run until signalled, expiring silent peers once a minute
    auto lastCleanup = std::chrono::steady_clock::now();
    const uint64_t peerMaxAge = 10ULL * config.announceIntervalSeconds;
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() - lastCleanup >= std::chrono::minutes(1)) {
            size_t removed = discovery.cleanupOldPeers(peerMaxAge);
            if (removed > 0) {
                Logger::getInstance().info("[main] Expired " + std::to_string(removed) +
                                           " silent peer(s).");
            }
            lastCleanup = std::chrono::steady_clock::now();
        }
    }

    // 6. Shutdown
    Logger::getInstance().info("[main] Shutting down...");
    discovery.stopDiscovery();
    manager.shutdown();
    Logger::getInstance().info("[main] VeilChat node exited cleanly.");
    return 0;
}
