#ifndef VEILCHAT_UTIL_CONFIG_PARSER_HPP
#define VEILCHAT_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../../config/messenger_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Parser for VeilChat's plain "key=value" node configuration.
 *
 * DESIGN GOALS:
 *   - One setting per line, '#' starts a comment line, blank lines ignored.
 *   - List settings are comma separated: fallbackPorts=443,80,8080
 *   - Unknown keys only warn, malformed values throw.
 *   - A missing file is not an error: defaults stay in place.
 *
 * USAGE:
 *   @code
 *   veilchat::config::MessengerConfig cfg;
 *   veilchat::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("veilchat.conf");
 *   @endcode
 */

namespace veilchat {
namespace util {

/**
 * @class ConfigParser
 * @brief Reads key=value text and updates the referenced MessengerConfig.
 */
class ConfigParser
{
public:
    explicit ConfigParser(veilchat::config::MessengerConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Read the given file, parse line by line, storing recognized keys.
     * @return false if the file does not exist (defaults kept).
     * @throw std::runtime_error if a line is malformed.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        parseStream(inFile);
        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Parse configuration text held in memory.
     * @throw std::runtime_error if a line is malformed.
     */
    inline void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::istringstream in(text);
        parseStream(in);
    }

private:
    veilchat::config::MessengerConfig &config_;
    std::mutex mutex_;

    inline void parseStream(std::istream &in)
    {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "nodeName") {
            config_.nodeName = val;
        }
        else if (key == "peerId") {
            config_.peerId = val;
        }
        else if (key == "bindAddress") {
            config_.bindAddress = val;
        }
        else if (key == "listenPort") {
            config_.listenPort = parsePort(val);
        }
        else if (key == "useMasking") {
            config_.useMasking = parseBool(val);
        }
        else if (key == "maskDomain") {
            config_.maskDomain = val;
        }
        else if (key == "discoveryPort") {
            config_.discoveryPort = parsePort(val);
        }
        else if (key == "announceIntervalSeconds") {
            uint32_t seconds = parseUInt32(val);
            if (seconds == 0) {
                throw std::runtime_error("ConfigParser: announceIntervalSeconds out of range: " + val);
            }
            config_.announceIntervalSeconds = seconds;
        }
        else if (key == "broadcastTargets") {
            config_.broadcastTargets = splitList(val);
        }
        else if (key == "capabilities") {
            config_.capabilities = splitList(val);
        }
        else if (key == "connectTimeoutMs") {
            config_.connectTimeoutMs = parseUInt32(val);
        }
        else if (key == "writeTimeoutMs") {
            config_.writeTimeoutMs = parseUInt32(val);
        }
        else if (key == "ackReadTimeoutMs") {
            config_.ackReadTimeoutMs = parseUInt32(val);
        }
        else if (key == "inboundReadTimeoutMs") {
            config_.inboundReadTimeoutMs = parseUInt32(val);
        }
        else if (key == "ackTimeoutSeconds") {
            config_.ackTimeoutSeconds = parseUInt32(val);
        }
        else if (key == "shutdownTimeoutMs") {
            config_.shutdownTimeoutMs = parseUInt32(val);
        }
        else if (key == "fallbackPorts") {
            std::vector<uint16_t> ports;
            for (const auto &item : splitList(val)) {
                ports.push_back(parsePort(item));
            }
            config_.fallbackPorts = ports;
        }
        else if (key == "workerThreads") {
            uint64_t n = parseUInt(val);
            if (n == 0 || n > 256) {
                throw std::runtime_error("ConfigParser: workerThreads out of range: " + val);
            }
            config_.workerThreads = static_cast<uint16_t>(n);
        }
        else if (key == "maxInboundConnections") {
            uint32_t n = parseUInt32(val);
            if (n == 0) {
                throw std::runtime_error("ConfigParser: maxInboundConnections out of range: " + val);
            }
            config_.maxInboundConnections = n;
        }
        else if (key == "externalIpServices") {
            config_.externalIpServices = splitList(val);
        }
        else if (key == "externalIpTimeoutSeconds") {
            config_.externalIpTimeoutSeconds = parseUInt32(val);
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val); // validate now, applied by the caller
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    static inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    static inline std::vector<std::string> splitList(const std::string &val)
    {
        std::vector<std::string> out;
        std::istringstream in(val);
        std::string item;
        while (std::getline(in, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

    static inline uint64_t parseUInt(const std::string &val)
    {
        try {
            if (val.empty() || val[0] == '-') {
                throw std::runtime_error("not an unsigned number");
            }
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    static inline uint32_t parseUInt32(const std::string &val)
    {
        uint64_t n = parseUInt(val);
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("ConfigParser: value out of range: " + val);
        }
        return static_cast<uint32_t>(n);
    }

    static inline uint16_t parsePort(const std::string &val)
    {
        uint64_t n = parseUInt(val);
        if (n == 0 || n > 65535) {
            throw std::runtime_error("ConfigParser: invalid port: " + val);
        }
        return static_cast<uint16_t>(n);
    }

    static inline bool parseBool(const std::string &val)
    {
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: invalid boolean: " + val);
    }
};

} // namespace util
} // namespace veilchat

#endif // VEILCHAT_UTIL_CONFIG_PARSER_HPP
