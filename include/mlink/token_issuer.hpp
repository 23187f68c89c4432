/**
 * @file token_issuer.hpp
 * @brief Pairing tokens and connection descriptors
 * 
 * Every server start mints a fresh random token and pairs it with the
 * local address and the bound port. The resulting descriptor is what the
 * pairing display renders (e.g. as a QR code) and what the mobile client
 * presents back on its first frame.
 * 
 * Pairing payload (compact JSON, keys fixed):
 *   {"v":1,"host":"192.168.1.20","port":8080,"token":"..."}
 */

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mlink {

    constexpr size_t MIN_TOKEN_BYTES = 16;

    /**
     * @brief Upper bound on token entropy, keeps the token frame small
     */
    constexpr size_t MAX_TOKEN_BYTES = 256;

    /**
     * @brief Everything a client needs to pair: address, port, token
     */
    struct ConnectionDescriptor {
        std::string host;
        uint16_t port = 0;
        std::string token;

        /**
         * @brief Compact JSON pairing payload (QR content)
         */
        [[nodiscard]] std::string to_payload() const;

        /**
         * @brief mouselink://host:port/?token=... form for display
         */
        [[nodiscard]] std::string to_uri() const;

        /**
         * @brief Parses a pairing payload produced by to_payload()
         * 
         * @throws std::invalid_argument if the payload is not a valid descriptor
         */
        static ConnectionDescriptor from_payload(const std::string& payload);

        bool operator==(const ConnectionDescriptor& o) const {
            return host == o.host && port == o.port && token == o.token;
        }
    };

    /**
     * @brief Source of candidate local IPv4 addresses, best first
     */
    using AddressProvider = std::function<std::vector<std::string>()>;

    /**
     * @brief Lists IPv4 addresses of interfaces that are up, skipping
     *        loopback; RFC 1918 addresses sort first
     */
    std::vector<std::string> local_ipv4_addresses();

    /**
     * @brief Constant-time comparison of a candidate against a token
     */
    bool tokens_equal(const std::string& expected, const std::string& candidate);

    /**
     * @brief Mints pairing tokens and connection descriptors
     * 
     * Holds at most one valid token. issue() replaces it, revoke() clears
     * it. Thread-safe.
     */
    class TokenIssuer {
    public:
        /**
         * @param token_bytes Random bytes per token (raised to MIN_TOKEN_BYTES)
         * @param advertise_host Fixed host to advertise; empty to detect
         * @param addresses Address source used when detecting
         */
        explicit TokenIssuer(size_t token_bytes = MIN_TOKEN_BYTES,
                             std::string advertise_host = "",
                             AddressProvider addresses = local_ipv4_addresses);

        /**
         * @brief Issues a new descriptor for the given bound port
         * 
         * Invalidates any previously issued token.
         * 
         * @throws ServerError(NO_NETWORK_INTERFACE) if no address is usable
         */
        ConnectionDescriptor issue(uint16_t port);

        /**
         * @brief Invalidates the current token
         */
        void revoke();

        /**
         * @brief Checks a candidate against the current token
         * 
         * @return false if no token is valid or the candidate differs
         */
        [[nodiscard]] bool matches(const std::string& candidate) const;

        /**
         * @brief Generates a random base64url token without padding
         */
        [[nodiscard]] static std::string generate_token(size_t bytes);

    private:
        size_t token_bytes_;
        std::string advertise_host_;
        AddressProvider addresses_;
        std::string current_token_;
        mutable std::mutex mutex_;
    };

} // namespace mlink
