//
// Created by opencode on 18/10/2026.
//

#include "mlink/token_issuer.hpp"
#include "mlink/errors.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace mlink {

    namespace {

        const char BASE64URL[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

        std::string base64url_encode(const std::vector<uint8_t>& data) {
            std::string out;
            size_t i = 0;
            while (i + 3 <= data.size()) {
                uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
                out += BASE64URL[(n >> 18) & 0x3F];
                out += BASE64URL[(n >> 12) & 0x3F];
                out += BASE64URL[(n >> 6) & 0x3F];
                out += BASE64URL[n & 0x3F];
                i += 3;
            }
            size_t rest = data.size() - i;
            if (rest == 1) {
                uint32_t n = data[i] << 16;
                out += BASE64URL[(n >> 18) & 0x3F];
                out += BASE64URL[(n >> 12) & 0x3F];
            } else if (rest == 2) {
                uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
                out += BASE64URL[(n >> 18) & 0x3F];
                out += BASE64URL[(n >> 12) & 0x3F];
                out += BASE64URL[(n >> 6) & 0x3F];
            }
            return out;
        }

        bool is_private(uint32_t host_order) {
            return (host_order >> 24) == 10 ||
                   (host_order >> 20) == ((172 << 4) | 1) ||
                   (host_order >> 16) == ((192 << 8) | 168);
        }

    } // namespace

    std::string ConnectionDescriptor::to_payload() const {
        nlohmann::json payload = {
            {"v", 1},
            {"host", host},
            {"port", port},
            {"token", token}
        };
        return payload.dump();
    }

    std::string ConnectionDescriptor::to_uri() const {
        return "mouselink://" + host + ":" + std::to_string(port) + "/?token=" + token;
    }

    ConnectionDescriptor ConnectionDescriptor::from_payload(const std::string& payload) {
        try {
            auto json = nlohmann::json::parse(payload);
            if (json.at("v").get<int>() != 1) {
                throw std::invalid_argument("Unsupported pairing payload version");
            }
            ConnectionDescriptor desc;
            desc.host = json.at("host").get<std::string>();
            auto port = json.at("port").get<int64_t>();
            if (port < 0 || port > 65535) {
                throw std::invalid_argument("Invalid pairing payload: port out of range: " + std::to_string(port));
            }
            desc.port = static_cast<uint16_t>(port);
            desc.token = json.at("token").get<std::string>();
            return desc;
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("Invalid pairing payload: ") + e.what());
        }
    }

    std::vector<std::string> local_ipv4_addresses() {
        std::vector<std::pair<bool, std::string>> found;

        ifaddrs* list = nullptr;
        if (getifaddrs(&list) != 0) {
            return {};
        }

        for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
            if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
                continue;
            }

            auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
            char buf[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
                continue;
            }
            found.emplace_back(is_private(ntohl(sin->sin_addr.s_addr)), buf);
        }
        freeifaddrs(list);

        // Private LAN addresses first, keep interface order otherwise
        std::stable_sort(found.begin(), found.end(),
                         [](const auto& a, const auto& b) { return a.first && !b.first; });

        std::vector<std::string> addresses;
        for (auto& entry : found) {
            addresses.push_back(std::move(entry.second));
        }
        return addresses;
    }

    bool tokens_equal(const std::string& expected, const std::string& candidate) {
        if (expected.size() != candidate.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (size_t i = 0; i < expected.size(); ++i) {
            diff |= static_cast<unsigned char>(expected[i] ^ candidate[i]);
        }
        return diff == 0;
    }

    TokenIssuer::TokenIssuer(size_t token_bytes, std::string advertise_host, AddressProvider addresses)
        : token_bytes_(std::clamp(token_bytes, MIN_TOKEN_BYTES, MAX_TOKEN_BYTES))
        , advertise_host_(std::move(advertise_host))
        , addresses_(std::move(addresses)) {}

    ConnectionDescriptor TokenIssuer::issue(uint16_t port) {
        std::string host = advertise_host_;
        if (host.empty()) {
            auto candidates = addresses_ ? addresses_() : std::vector<std::string>{};
            if (candidates.empty()) {
                std::lock_guard<std::mutex> lock(mutex_);
                current_token_.clear();
                throw ServerError(ErrorCode::NO_NETWORK_INTERFACE,
                                  "No usable local network interface found");
            }
            host = candidates.front();
        }

        ConnectionDescriptor desc;
        desc.host = host;
        desc.port = port;
        desc.token = generate_token(token_bytes_);

        std::lock_guard<std::mutex> lock(mutex_);
        current_token_ = desc.token;
        return desc;
    }

    void TokenIssuer::revoke() {
        std::lock_guard<std::mutex> lock(mutex_);
        current_token_.clear();
    }

    bool TokenIssuer::matches(const std::string& candidate) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_token_.empty()) {
            return false;
        }
        return tokens_equal(current_token_, candidate);
    }

    std::string TokenIssuer::generate_token(size_t bytes) {
        static thread_local std::random_device rd;
        std::uniform_int_distribution<int> dist(0, 255);

        std::vector<uint8_t> raw(bytes);
        for (auto& b : raw) {
            b = static_cast<uint8_t>(dist(rd));
        }
        return base64url_encode(raw);
    }

} // namespace mlink
