#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string random_hex(std::size_t byte_count){
    std::vector<unsigned char> bytes(byte_count);
    if(byte_count > 0 && RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(bytes);
}

std::string base64_encode(const std::string& data){
    // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp){
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms){
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string url_decode(const std::string& value, bool plus_as_space){
    std::string out;
    out.reserve(value.size());
    for(std::size_t i = 0; i < value.size(); ++i){
        char c = value[i];
        if(c == '%' && i + 2 < value.size() &&
           std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
           std::isxdigit(static_cast<unsigned char>(value[i + 2]))){
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else if(c == '+' && plus_as_space){
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string url_encode(const std::string& value){
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for(unsigned char c : value){
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/'){
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string html_escape(const std::string& value){
    std::string out;
    out.reserve(value.size());
    for(char c : value){
        switch(c){
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::string header_safe_filename(const std::string& value){
    std::string out;
    out.reserve(value.size());
    for(char c : value){
        if(c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20) out.push_back('_');
        else out.push_back(c);
    }
    return out;
}

std::string host_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0){
        return "unknown-host";
    }
    return hostname;
}
