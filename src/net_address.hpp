#pragma once

#include <optional>
#include <string>

// Source of the local IPv4 address every component derives its subnet from.
class AddressResolver {
public:
  virtual ~AddressResolver() = default;
  virtual std::optional<std::string> local_ip() const = 0;
};

// First interface that is up, not loopback, and carries an IPv4 address.
class SystemAddressResolver : public AddressResolver {
public:
  std::optional<std::string> local_ip() const override;
};

class FixedAddressResolver : public AddressResolver {
public:
  explicit FixedAddressResolver(std::string ip) : ip_(std::move(ip)) {}
  std::optional<std::string> local_ip() const override;

private:
  std::string ip_;
};

// "192.168.1.23" -> "192.168.1". Empty when ip is not dotted IPv4.
std::string subnet_prefix(const std::string& ip);
bool in_subnet(const std::string& ip, const std::string& prefix);
bool is_ipv4_address(const std::string& ip);
