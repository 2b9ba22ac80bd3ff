#include "discovery/external_ip.hpp"
#include "network/errors.hpp"
#include "util/logger.hpp"

#include <arpa/inet.h>
#include <curl/curl.h>
#include <mutex>
#include <nlohmann/json.hpp>

namespace veilchat {
namespace discovery {

namespace {

// Response bodies larger than this are not IP echoes.
constexpr size_t kMaxResponseSize = 4096;

std::string trim(const std::string &s)
{
    static const char *whitespace = " \t\r\n";
    auto start = s.find_first_not_of(whitespace);
    if (start == std::string::npos)
    {
        return std::string();
    }
    auto end = s.find_last_not_of(whitespace);
    return s.substr(start, end - start + 1);
}

bool isIpAddress(const std::string &text)
{
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, text.c_str(), buf) == 1 || inet_pton(AF_INET6, text.c_str(), buf) == 1;
}

} // namespace

ExternalIpResolver::ExternalIpResolver(std::vector<std::string> services, uint32_t timeoutSeconds)
    : services_(std::move(services))
    , timeoutSeconds_(timeoutSeconds)
{
    initCurl();
}

std::string ExternalIpResolver::resolve() const
{
    using util::logger::Logger;

    std::string lastError = "no services configured";
    for (const auto &service : services_)
    {
        std::string body;
        std::string error;
        if (!httpGet(service, body, error))
        {
            Logger::getInstance().warn("[ExternalIp] " + service + " failed: " + error);
            lastError = service + ": " + error;
            continue;
        }
        auto ip = parseResponse(body);
        if (!ip)
        {
            Logger::getInstance().warn("[ExternalIp] " + service + " returned no usable address");
            lastError = service + ": unparseable response";
            continue;
        }
        Logger::getInstance().info("[ExternalIp] external address " + *ip + " (via " + service + ")");
        return *ip;
    }
    throw network::MessengerError(network::ErrorKind::ConnectionFailed,
                                  "external IP lookup failed, last error: " + lastError,
                                  network::ConnectCause::Other);
}

std::optional<std::string> ExternalIpResolver::parseResponse(const std::string &body)
{
    std::string text = trim(body);
    if (text.empty())
    {
        return std::nullopt;
    }

    if (text[0] == '{')
    {
        nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            return std::nullopt;
        }
        for (const char *key : {"ip", "origin"})
        {
            auto it = j.find(key);
            if (it != j.end() && it->is_string())
            {
                text = it->get<std::string>();
                break;
            }
        }
        // httpbin lists every hop: "client, proxy".
        auto comma = text.find(',');
        if (comma != std::string::npos)
        {
            text = text.substr(0, comma);
        }
        text = trim(text);
    }

    if (!isIpAddress(text))
    {
        return std::nullopt;
    }
    return text;
}

void ExternalIpResolver::initCurl()
{
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

bool ExternalIpResolver::httpGet(const std::string &url, std::string &responseOut,
                                 std::string &errorOut) const
{
    CURL *curl = curl_easy_init();
    if (!curl)
    {
        errorOut = "curl_easy_init failed";
        return false;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSeconds_));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_NOPROXY, "localhost,127.0.0.1");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "curl/8.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseOut);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
    {
        errorOut = curl_easy_strerror(res);
        return false;
    }
    if (status < 200 || status >= 300)
    {
        errorOut = "HTTP status " + std::to_string(status);
        return false;
    }
    return true;
}

size_t ExternalIpResolver::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) return 0;
    std::string &resp = *reinterpret_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    if (resp.size() + total > kMaxResponseSize)
    {
        return 0;
    }
    resp.append(ptr, total);
    return total;
}

} // namespace discovery
} // namespace veilchat
