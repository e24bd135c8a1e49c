#include "courier.h"
#include "aws_sigv4.h"

#include <openssl/sha.h>
#include <openssl/hmac.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace aws {

static constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";

static std::string to_hex(const unsigned char* bytes, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0f];
    }
    return out;
}

static std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

static std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl parsed;
    std::string rest = url;

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        parsed.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    }

    size_t path_start = rest.find_first_of("/?");
    if (path_start == std::string::npos) {
        parsed.host = rest;
        parsed.path = "/";
        return parsed;
    }

    parsed.host = rest.substr(0, path_start);
    rest = rest.substr(path_start);

    size_t query_start = rest.find('?');
    if (query_start == std::string::npos) {
        parsed.path = rest;
    } else {
        parsed.path = rest.substr(0, query_start);
        parsed.query = rest.substr(query_start + 1);
    }
    if (parsed.path.empty()) {
        parsed.path = "/";
    }

    // Drop default ports from the signed host
    if ((parsed.scheme == "https" && parsed.host.size() > 4 &&
         parsed.host.compare(parsed.host.size() - 4, 4, ":443") == 0) ||
        (parsed.scheme == "http" && parsed.host.size() > 3 &&
         parsed.host.compare(parsed.host.size() - 3, 3, ":80") == 0)) {
        parsed.host = parsed.host.substr(0, parsed.host.rfind(':'));
    }

    return parsed;
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         out, &out_len);
    return std::string(reinterpret_cast<const char*>(out), out_len);
}

std::string uri_encode(const std::string& value, bool encode_slash) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == '/' && !encode_slash) {
            out += '/';
        } else {
            out += '%';
            out += digits[c >> 4];
            out += digits[c & 0x0f];
        }
    }
    return out;
}

std::string amz_date(std::time_t when) {
    struct tm tm_utc;
    gmtime_r(&when, &tm_utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_utc);
    return std::string(buf);
}

// Query parameters sorted by encoded key then value
static std::string canonical_query(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    std::vector<std::pair<std::string, std::string>> params;
    std::stringstream ss(query);
    std::string pair;
    while (std::getline(ss, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        std::string key = eq == std::string::npos ? pair : pair.substr(0, eq);
        std::string value = eq == std::string::npos ? "" : pair.substr(eq + 1);
        params.emplace_back(uri_encode(key), uri_encode(value));
    }
    std::sort(params.begin(), params.end());

    std::string out;
    for (size_t i = 0; i < params.size(); i++) {
        if (i > 0) out += '&';
        out += params[i].first + "=" + params[i].second;
    }
    return out;
}

SigV4Signer::SigV4Signer(Credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)), region_(std::move(region)), service_(std::move(service)) {
}

std::string SigV4Signer::credential_scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string SigV4Signer::canonical_request(const std::string& method,
                                           const ParsedUrl& url,
                                           const std::map<std::string, std::string>& canonical_headers,
                                           const std::string& payload_hash) const {
    std::string signed_headers;
    std::string header_block;
    for (const auto& [name, value] : canonical_headers) {
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += name;
        header_block += name + ":" + value + "\n";
    }

    // Non-S3 services encode the already-encoded path a second time
    std::string canonical_uri = uri_encode(url.path, false);

    return method + "\n" +
           canonical_uri + "\n" +
           canonical_query(url.query) + "\n" +
           header_block + "\n" +
           signed_headers + "\n" +
           payload_hash;
}

std::string SigV4Signer::string_to_sign(const std::string& date_time,
                                        const std::string& canonical_request_hash) const {
    return std::string(ALGORITHM) + "\n" +
           date_time + "\n" +
           credential_scope(date_time.substr(0, 8)) + "\n" +
           canonical_request_hash;
}

std::string SigV4Signer::signature(const std::string& date, const std::string& to_sign) const {
    std::string k_date = hmac_sha256("AWS4" + credentials_.secret_access_key, date);
    std::string k_region = hmac_sha256(k_date, region_);
    std::string k_service = hmac_sha256(k_region, service_);
    std::string k_signing = hmac_sha256(k_service, "aws4_request");
    std::string raw = hmac_sha256(k_signing, to_sign);
    return to_hex(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

std::map<std::string, std::string> SigV4Signer::sign(const std::string& method,
                                                     const std::string& url,
                                                     const std::map<std::string, std::string>& headers,
                                                     const std::string& payload,
                                                     std::time_t when) const {
    ParsedUrl parsed = parse_url(url);
    std::string date_time = amz_date(when);
    std::string date = date_time.substr(0, 8);

    std::map<std::string, std::string> canonical_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers[lowercase(name)] = trim(value);
    }
    canonical_headers["host"] = parsed.host;
    canonical_headers["x-amz-date"] = date_time;
    if (!credentials_.session_token.empty()) {
        canonical_headers["x-amz-security-token"] = credentials_.session_token;
    }

    std::string request = canonical_request(method, parsed, canonical_headers, sha256_hex(payload));
    dprintf(4, "SigV4 canonical request:\n%s", request.c_str());

    std::string to_sign = string_to_sign(date_time, sha256_hex(request));
    std::string sig = signature(date, to_sign);

    std::string signed_headers;
    for (const auto& entry : canonical_headers) {
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += entry.first;
    }

    std::map<std::string, std::string> out;
    out["host"] = parsed.host;
    out["x-amz-date"] = date_time;
    if (!credentials_.session_token.empty()) {
        out["x-amz-security-token"] = credentials_.session_token;
    }
    out["Authorization"] = std::string(ALGORITHM) +
                           " Credential=" + credentials_.access_key_id + "/" + credential_scope(date) +
                           ", SignedHeaders=" + signed_headers +
                           ", Signature=" + sig;
    return out;
}

} // namespace aws
