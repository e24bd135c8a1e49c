#pragma once

#include <string>
#include <map>
#include <functional>
#include <stdexcept>
#include <cstdint>

namespace aws {

/// @brief Malformed event-stream frame (bad length or CRC)
class EventStreamError : public std::runtime_error {
public:
    explicit EventStreamError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief One decoded application/vnd.amazon.eventstream message
struct EventStreamMessage {
    std::map<std::string, std::string> headers;   // String-valued headers only
    std::string payload;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? "" : it->second;
    }

    std::string message_type() const { return header(":message-type"); }
    std::string event_type() const { return header(":event-type"); }
    bool is_exception() const { return message_type() == "exception" || message_type() == "error"; }
};

/// @brief CRC-32 (IEEE 802.3), as used by the event-stream prelude and trailer
uint32_t crc32(const uint8_t* data, size_t len, uint32_t crc = 0);

/// @brief Standard base64 encode/decode (OpenSSL EVP block functions)
std::string base64_encode(const std::string& data);
std::string base64_decode(const std::string& data);

/// @brief Incremental decoder for AWS binary event-stream framing
/// Frame layout (big-endian):
///   total_length:u32 headers_length:u32 prelude_crc:u32 headers payload message_crc:u32
class EventStreamDecoder {
public:
    /// @return true to continue decoding, false to stop
    using MessageCallback = std::function<bool(const EventStreamMessage& message)>;

    /// @brief Append bytes and dispatch every complete message
    /// @throws EventStreamError on a corrupt frame
    /// @return false if the callback requested stop
    bool feed(const std::string& bytes, MessageCallback callback);

    bool has_buffered_data() const { return !buffer_.empty(); }
    void reset() { buffer_.clear(); }

    /// @brief Parse the headers section of a frame
    static std::map<std::string, std::string> parse_headers(const uint8_t* data, size_t len);

private:
    std::string buffer_;
};

/// @brief Extract the inner JSON of a Bedrock "chunk" event payload
/// Payload is {"bytes": "<base64 json>"}; returns the decoded JSON text
std::string decode_chunk_payload(const std::string& payload);

} // namespace aws
