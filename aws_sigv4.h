#pragma once

#include <string>
#include <map>
#include <ctime>

namespace aws {

/// @brief Static AWS credentials (access key id, secret, optional session token)
struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;

    bool is_valid() const {
        return !access_key_id.empty() && !secret_access_key.empty();
    }
};

/// @brief Pieces of a URL needed for signing
struct ParsedUrl {
    std::string scheme;
    std::string host;    // Includes :port when non-default
    std::string path;    // As sent on the wire (already percent-encoded)
    std::string query;
};

ParsedUrl parse_url(const std::string& url);

/// @brief Lowercase hex SHA-256 of data
std::string sha256_hex(const std::string& data);

/// @brief Raw HMAC-SHA256
std::string hmac_sha256(const std::string& key, const std::string& data);

/// @brief RFC 3986 percent-encoding; '/' kept when encode_slash is false
std::string uri_encode(const std::string& value, bool encode_slash = true);

/// @brief "20150830T123600Z" for the given UTC time
std::string amz_date(std::time_t when);

/// @brief AWS Signature Version 4 request signer
class SigV4Signer {
public:
    SigV4Signer(Credentials credentials, std::string region, std::string service);

    /// @brief Compute the headers to add to a request
    /// Returns host, x-amz-date, x-amz-security-token (if any) and Authorization.
    /// Every header in `headers` is included in the signature.
    std::map<std::string, std::string> sign(const std::string& method,
                                            const std::string& url,
                                            const std::map<std::string, std::string>& headers,
                                            const std::string& payload,
                                            std::time_t when) const;

    std::map<std::string, std::string> sign(const std::string& method,
                                            const std::string& url,
                                            const std::map<std::string, std::string>& headers,
                                            const std::string& payload) const {
        return sign(method, url, headers, payload, std::time(nullptr));
    }

    /// @brief Canonical request text (exposed for diagnostics and tests)
    std::string canonical_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::map<std::string, std::string>& canonical_headers,
                                  const std::string& payload_hash) const;

    std::string string_to_sign(const std::string& date_time,
                               const std::string& canonical_request_hash) const;

    std::string signature(const std::string& date, const std::string& string_to_sign) const;

    const std::string& region() const { return region_; }
    const std::string& service() const { return service_; }

private:
    std::string credential_scope(const std::string& date) const;

    Credentials credentials_;
    std::string region_;
    std::string service_;
};

} // namespace aws
