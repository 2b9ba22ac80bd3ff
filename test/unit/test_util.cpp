// test/unit/test_util.cpp
// -----------------------------------------------------------
// Configuration parsing, logging levels, hashing helpers, the worker pool,
// the deferred scheduler, the event bus and the Ed25519 identity.

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>
#include <gtest/gtest.h>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "config/messenger_config.hpp"
#include "crypto/identity_provider.hpp"
#include "network/events.hpp"
#include "util/config_parser.hpp"
#include "util/deferred_scheduler.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"
#include "util/thread_pool.hpp"
#include "test_helpers.hpp"

namespace {

using veilchat::config::MessengerConfig;
using veilchat::util::ConfigParser;
namespace hashing = veilchat::util::hashing;
namespace logger = veilchat::util::logger;

// ---------------------------------------------------------------------------
// ConfigParser
// ---------------------------------------------------------------------------

TEST(ConfigParserTest, DefaultsMatchDeployment) {
    MessengerConfig cfg;
    EXPECT_EQ(cfg.listenPort, 8080);
    EXPECT_EQ(cfg.discoveryPort, 9999);
    EXPECT_EQ(cfg.announceIntervalSeconds, 30u);
    EXPECT_EQ(cfg.ackTimeoutSeconds, 30u);
    EXPECT_FALSE(cfg.useMasking);
    EXPECT_EQ(cfg.fallbackPorts, (std::vector<uint16_t>{443, 80, 8080, 8443, 8000, 9000, 3000}));
}

TEST(ConfigParserTest, ParsesKeysListsAndComments) {
    MessengerConfig cfg;
    ConfigParser parser(cfg);
    parser.loadFromString(
        "# node settings\n"
        "nodeName = alice\n"
        "\n"
        "listenPort=9000\n"
        "useMasking=yes\n"
        "maskDomain=cdn.example.net\n"
        "fallbackPorts=443, 80\n"
        "broadcastTargets=192.168.0.255,10.0.0.255\n"
        "ackTimeoutSeconds=12\n"
        "workerThreads=2\n"
        "logLevel=debug\n"
        "someFutureKey=ignored\n");

    EXPECT_EQ(cfg.nodeName, "alice");
    EXPECT_EQ(cfg.listenPort, 9000);
    EXPECT_TRUE(cfg.useMasking);
    EXPECT_EQ(cfg.maskDomain, "cdn.example.net");
    EXPECT_EQ(cfg.fallbackPorts, (std::vector<uint16_t>{443, 80}));
    EXPECT_EQ(cfg.broadcastTargets, (std::vector<std::string>{"192.168.0.255", "10.0.0.255"}));
    EXPECT_EQ(cfg.ackTimeoutSeconds, 12u);
    EXPECT_EQ(cfg.workerThreads, 2);
    EXPECT_EQ(cfg.logLevel, "debug");
}

TEST(ConfigParserTest, MalformedValuesThrow) {
    MessengerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("listenPort=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("listenPort=70000\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("ackTimeoutSeconds=-1\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("connectTimeoutMs=12abc\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("useMasking=maybe\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("workerThreads=0\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("logLevel=loud\n"), std::runtime_error);
    EXPECT_THROW(parser.loadFromString("just some words\n"), std::runtime_error);
}

TEST(ConfigParserTest, ZeroAnnounceIntervalRejected) {
    MessengerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.loadFromString("announceIntervalSeconds=0\n"), std::runtime_error);
    EXPECT_EQ(cfg.announceIntervalSeconds, 30u);

    parser.loadFromString("announceIntervalSeconds=5\n");
    EXPECT_EQ(cfg.announceIntervalSeconds, 5u);
}

TEST(ConfigParserTest, InboundConnectionCap) {
    MessengerConfig cfg;
    EXPECT_EQ(cfg.maxInboundConnections, 64u);
    ConfigParser parser(cfg);
    parser.loadFromString("maxInboundConnections=3\n");
    EXPECT_EQ(cfg.maxInboundConnections, 3u);
    EXPECT_THROW(parser.loadFromString("maxInboundConnections=0\n"), std::runtime_error);
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    MessengerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("/nonexistent/veilchat.conf"));
    EXPECT_EQ(cfg.nodeName, "veilchat_node");
}

TEST(ConfigParserTest, LoadsFromFile) {
    const std::string path = "veilchat_test_config.conf";
    {
        std::ofstream out(path);
        out << "nodeName=bob\ndiscoveryPort=4000\n";
    }
    MessengerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(path));
    EXPECT_EQ(cfg.nodeName, "bob");
    EXPECT_EQ(cfg.discoveryPort, 4000);
    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(logger::parseLogLevel("debug"), logger::LogLevel::DEBUG);
    EXPECT_EQ(logger::parseLogLevel("INFO"), logger::LogLevel::INFO);
    EXPECT_EQ(logger::parseLogLevel("warning"), logger::LogLevel::WARN);
    EXPECT_EQ(logger::parseLogLevel("Error"), logger::LogLevel::ERROR);
    EXPECT_EQ(logger::parseLogLevel("critical"), logger::LogLevel::CRITICAL);
    EXPECT_THROW(logger::parseLogLevel("verbose"), std::runtime_error);
}

TEST(LoggerTest, LevelFiltersFileOutput) {
    auto& log = logger::Logger::getInstance();
    const logger::LogLevel previous = log.getLogLevel();
    const std::string path = "veilchat_test_log.txt";
    std::remove(path.c_str());

    ASSERT_TRUE(logger::enableFileOutput(path, false));
    log.setLogLevel(logger::LogLevel::WARN);
    EXPECT_FALSE(log.isEnabled(logger::LogLevel::INFO));
    EXPECT_TRUE(log.isEnabled(logger::LogLevel::ERROR));
    logger::info("[LoggerTest] filtered line");
    logger::warn("[LoggerTest] kept line");
    logger::disableFileOutput();
    log.setLogLevel(previous);

    std::ifstream in(path);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(contents.find("filtered line"), std::string::npos);
    EXPECT_NE(contents.find("[LoggerTest] kept line"), std::string::npos);
    EXPECT_NE(contents.find("WARN"), std::string::npos);
    std::remove(path.c_str());
}

// ---------------------------------------------------------------------------
// Hashing helpers
// ---------------------------------------------------------------------------

TEST(HashingTest, Sha256KnownVector) {
    EXPECT_EQ(hashing::sha256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(hashing::sha256(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashingTest, Base64) {
    std::vector<uint8_t> data = {'f', 'o', 'o', 'b', 'a'};
    EXPECT_EQ(hashing::base64Encode(data), "Zm9vYmE=");
    EXPECT_EQ(hashing::base64Decode("Zm9vYmE="), data);
    EXPECT_EQ(hashing::base64Decode("Zm9vYg=="), (std::vector<uint8_t>{'f', 'o', 'o', 'b'}));
    EXPECT_EQ(hashing::base64Encode({}), "");
    EXPECT_TRUE(hashing::base64Decode("").empty());
    EXPECT_THROW(hashing::base64Decode("abc"), std::runtime_error);
    EXPECT_THROW(hashing::base64Decode("a*c="), std::runtime_error);
}

TEST(HashingTest, UuidV4Format) {
    std::string id = hashing::uuidV4();
    ASSERT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[14], '4');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_NE(hashing::uuidV4(), id);
}

// ---------------------------------------------------------------------------
// ThreadPool
// ---------------------------------------------------------------------------

TEST(ThreadPoolTest, EnqueueReturnsResults) {
    veilchat::util::ThreadPool pool(4);
    EXPECT_EQ(pool.size(), 4u);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.enqueue([](int x) { return x * x; }, i));
    }
    int sum = 0;
    for (auto& f : results) {
        sum += f.get();
    }
    EXPECT_EQ(sum, 2470);
}

TEST(ThreadPoolTest, PostedExceptionDoesNotKillWorker) {
    veilchat::util::ThreadPool pool(1);
    std::atomic<int> ran(0);
    pool.post([]() { throw std::runtime_error("boom"); });
    pool.post([&ran]() { ++ran; });
    EXPECT_TRUE(veilchat::test::waitFor([&]() { return ran.load() == 1; }));
}

// ---------------------------------------------------------------------------
// DeferredScheduler
// ---------------------------------------------------------------------------

TEST(DeferredSchedulerTest, RunsAfterDelay) {
    veilchat::util::DeferredScheduler scheduler;
    scheduler.Start();
    std::atomic<bool> fired(false);
    auto start = std::chrono::steady_clock::now();
    scheduler.Schedule("m-1", std::chrono::milliseconds(100), [&fired]() { fired = true; });
    EXPECT_TRUE(scheduler.IsScheduled("m-1"));

    ASSERT_TRUE(veilchat::test::waitFor([&]() { return fired.load(); }));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(100));
    EXPECT_FALSE(scheduler.IsScheduled("m-1"));
    scheduler.Stop();
}

TEST(DeferredSchedulerTest, CancelPreventsRun) {
    veilchat::util::DeferredScheduler scheduler;
    scheduler.Start();
    std::atomic<bool> fired(false);
    scheduler.Schedule("m-1", std::chrono::milliseconds(200), [&fired]() { fired = true; });
    EXPECT_TRUE(scheduler.Cancel("m-1"));
    EXPECT_FALSE(scheduler.Cancel("m-1"));
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_FALSE(fired.load());
    scheduler.Stop();
}

TEST(DeferredSchedulerTest, RescheduleReplacesTask) {
    veilchat::util::DeferredScheduler scheduler;
    scheduler.Start();
    std::atomic<int> which(0);
    EXPECT_FALSE(scheduler.Schedule("k", std::chrono::milliseconds(50), [&which]() { which = 1; }));
    EXPECT_TRUE(scheduler.Schedule("k", std::chrono::milliseconds(50), [&which]() { which = 2; }));
    EXPECT_EQ(scheduler.PendingCount(), 1u);
    ASSERT_TRUE(veilchat::test::waitFor([&]() { return which.load() != 0; }));
    EXPECT_EQ(which.load(), 2);
    scheduler.Stop();
}

TEST(DeferredSchedulerTest, EarlierDeadlineRunsFirst) {
    veilchat::util::DeferredScheduler scheduler;
    scheduler.Start();
    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        return [&mutex, &order, name]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(name);
        };
    };
    scheduler.Schedule("late", std::chrono::milliseconds(300), record("late"));
    scheduler.Schedule("early", std::chrono::milliseconds(50), record("early"));
    ASSERT_TRUE(veilchat::test::waitFor([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return order.size() == 2;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(order, (std::vector<std::string>{"early", "late"}));
    scheduler.Stop();
}

TEST(DeferredSchedulerTest, StopDiscardsPendingTasks) {
    std::atomic<bool> fired(false);
    {
        veilchat::util::DeferredScheduler scheduler;
        scheduler.Start();
        scheduler.Schedule("m-1", std::chrono::milliseconds(100), [&fired]() { fired = true; });
        scheduler.Stop();
        EXPECT_EQ(scheduler.PendingCount(), 0u);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(fired.load());
}

// ---------------------------------------------------------------------------
// EventBus
// ---------------------------------------------------------------------------

TEST(EventBusTest, FanOutAndUnsubscribe) {
    veilchat::network::EventBus bus;
    int first = 0;
    int second = 0;
    size_t a = bus.subscribe([&first](const veilchat::network::Event&) { ++first; });
    bus.subscribe([&second](const veilchat::network::Event& e) {
        if (std::holds_alternative<veilchat::network::ServerStarted>(e)) {
            ++second;
        }
    });

    bus.emit(veilchat::network::ServerStarted{8080});
    bus.emit(veilchat::network::ServerStopped{});
    EXPECT_EQ(first, 2);
    EXPECT_EQ(second, 1);

    EXPECT_TRUE(bus.unsubscribe(a));
    EXPECT_FALSE(bus.unsubscribe(a));
    bus.emit(veilchat::network::ServerStarted{8080});
    EXPECT_EQ(first, 2);
    EXPECT_EQ(second, 2);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    veilchat::network::EventBus bus;
    int calls = 0;
    bus.subscribe([](const veilchat::network::Event&) { throw std::runtime_error("ui gone"); });
    bus.subscribe([&calls](const veilchat::network::Event&) { ++calls; });
    EXPECT_NO_THROW(bus.emit(veilchat::network::ErrorEvent{"x", "send:refused"}));
    EXPECT_EQ(calls, 1);
}

// ---------------------------------------------------------------------------
// Ed25519Identity
// ---------------------------------------------------------------------------

TEST(IdentityTest, SignAndVerify) {
    auto alice = veilchat::crypto::Ed25519Identity::generate();
    auto bob = veilchat::crypto::Ed25519Identity::generate();
    ASSERT_EQ(alice->publicKey().size(), 32u);
    EXPECT_NE(alice->publicKey(), bob->publicKey());
    EXPECT_EQ(alice->peerId().size(), 32u);
    EXPECT_EQ(alice->peerId(), hashing::sha256(alice->publicKey()).substr(0, 32));

    std::vector<uint8_t> data = {'h', 'i'};
    std::vector<uint8_t> sig = alice->sign(data);
    EXPECT_EQ(sig.size(), 64u);
    EXPECT_TRUE(bob->verify(data, sig, alice->publicKey()));
    EXPECT_FALSE(bob->verify(data, sig, bob->publicKey()));

    std::vector<uint8_t> tampered = data;
    tampered.push_back('!');
    EXPECT_FALSE(bob->verify(tampered, sig, alice->publicKey()));
    EXPECT_FALSE(bob->verify(data, sig, {1, 2, 3}));
    EXPECT_FALSE(bob->verify(data, {}, alice->publicKey()));
}

}  // namespace
