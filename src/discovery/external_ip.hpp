#ifndef VEILCHAT_DISCOVERY_EXTERNAL_IP_HPP
#define VEILCHAT_DISCOVERY_EXTERNAL_IP_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace veilchat {
namespace discovery {

/*
  ExternalIpResolver
  --------------------------------
  Best-effort lookup of this host's public address through HTTP IP-echo
  services (api.ipify.org style plain text, or JSON with an "ip"/"origin"
  field as returned by ipinfo.io/httpbin.org).

   - Services are tried in order; the first parseable answer wins.
   - Each request is bounded by timeoutSeconds.
   - Independent of LAN discovery.
   - Uses libcurl; the global init happens once per process.
*/
class ExternalIpResolver
{
public:
    ExternalIpResolver(std::vector<std::string> services, uint32_t timeoutSeconds);

    /**
     * @throw network::MessengerError ConnectionFailed if every service failed
     *        or answered with something that is not an IP address.
     */
    std::string resolve() const;

    /// Extract an IPv4/IPv6 address from a service response body.
    static std::optional<std::string> parseResponse(const std::string &body);

private:
    static void initCurl();
    bool httpGet(const std::string &url, std::string &responseOut, std::string &errorOut) const;
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    std::vector<std::string> services_;
    uint32_t timeoutSeconds_;
};

} // namespace discovery
} // namespace veilchat

#endif // VEILCHAT_DISCOVERY_EXTERNAL_IP_HPP
