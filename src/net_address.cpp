#include "net_address.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include "log.hpp"

std::optional<std::string> SystemAddressResolver::local_ip() const {
  struct ifaddrs* interfaces = nullptr;
  if(getifaddrs(&interfaces) != 0) {
    log_warn(nullptr, "getifaddrs failed; local address unknown");
    return std::nullopt;
  }
  std::optional<std::string> result;
  for(auto* it = interfaces; it != nullptr; it = it->ifa_next) {
    if(!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    if(!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
    char buf[INET_ADDRSTRLEN] = {0};
    auto* sin = reinterpret_cast<struct sockaddr_in*>(it->ifa_addr);
    if(inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
      result = std::string(buf);
      break;
    }
  }
  freeifaddrs(interfaces);
  return result;
}

std::optional<std::string> FixedAddressResolver::local_ip() const {
  if(ip_.empty()) return std::nullopt;
  return ip_;
}

bool is_ipv4_address(const std::string& ip) {
  struct in_addr addr;
  return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

std::string subnet_prefix(const std::string& ip) {
  if(!is_ipv4_address(ip)) return std::string();
  auto pos = ip.rfind('.');
  return ip.substr(0, pos);
}

bool in_subnet(const std::string& ip, const std::string& prefix) {
  if(prefix.empty() || !is_ipv4_address(ip)) return false;
  return subnet_prefix(ip) == prefix;
}
