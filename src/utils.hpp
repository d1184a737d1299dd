#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Cryptographically random bytes rendered as lowercase hex (2 chars per byte).
std::string random_hex(std::size_t byte_count);
std::string base64_encode(const std::string& data);

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(int64_t ms);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);

// Paths keep '+' literal; form-encoded query values turn it into a space.
std::string url_decode(const std::string& value, bool plus_as_space = true);
std::string url_encode(const std::string& value);
std::string html_escape(const std::string& value);
std::string header_safe_filename(const std::string& value);

std::string host_name();
