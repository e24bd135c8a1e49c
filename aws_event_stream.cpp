#include "courier.h"
#include "aws_event_stream.h"
#include "nlohmann/json.hpp"

#include <openssl/evp.h>
#include <array>
#include <vector>

namespace aws {

static constexpr size_t PRELUDE_LENGTH = 12;
static constexpr size_t MIN_MESSAGE_LENGTH = 16;
static constexpr size_t MAX_MESSAGE_LENGTH = 16 * 1024 * 1024;

static const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t c = i;
            for (int k = 0; k < 8; k++) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

uint32_t crc32(const uint8_t* data, size_t len, uint32_t crc) {
    const auto& table = crc_table();
    crc = ~crc;
    for (size_t i = 0; i < len; i++) {
        crc = table[(crc ^ data[i]) & 0xff] ^ (crc >> 8);
    }
    return ~crc;
}

static uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

static uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    int len = EVP_EncodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string base64_decode(const std::string& data) {
    if (data.empty()) {
        return "";
    }
    if (data.size() % 4 != 0) {
        throw EventStreamError("Invalid base64 length");
    }
    std::vector<unsigned char> out(3 * data.size() / 4 + 1);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(data.data()),
                              static_cast<int>(data.size()));
    if (len < 0) {
        throw EventStreamError("Invalid base64 data");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (data[data.size() - 1] == '=') padding++;
    if (data[data.size() - 2] == '=') padding++;
    return std::string(reinterpret_cast<const char*>(out.data()), len - padding);
}

std::map<std::string, std::string> EventStreamDecoder::parse_headers(const uint8_t* data, size_t len) {
    std::map<std::string, std::string> headers;
    size_t pos = 0;

    auto need = [&](size_t n) {
        if (pos + n > len) {
            throw EventStreamError("Truncated event-stream header");
        }
    };

    while (pos < len) {
        need(1);
        uint8_t name_len = data[pos++];
        need(name_len);
        std::string name(reinterpret_cast<const char*>(data + pos), name_len);
        pos += name_len;

        need(1);
        uint8_t type = data[pos++];
        switch (type) {
            case 0:  // bool true
                headers[name] = "true";
                break;
            case 1:  // bool false
                headers[name] = "false";
                break;
            case 2:  // byte
                need(1);
                pos += 1;
                break;
            case 3:  // short
                need(2);
                pos += 2;
                break;
            case 4:  // int
                need(4);
                pos += 4;
                break;
            case 5:  // long
            case 8:  // timestamp
                need(8);
                pos += 8;
                break;
            case 6:  // byte array
            case 7: {  // string
                need(2);
                uint16_t value_len = read_u16(data + pos);
                pos += 2;
                need(value_len);
                if (type == 7) {
                    headers[name] = std::string(reinterpret_cast<const char*>(data + pos), value_len);
                }
                pos += value_len;
                break;
            }
            case 9:  // uuid
                need(16);
                pos += 16;
                break;
            default:
                throw EventStreamError("Unknown event-stream header type: " + std::to_string(type));
        }
    }

    return headers;
}

bool EventStreamDecoder::feed(const std::string& bytes, MessageCallback callback) {
    buffer_ += bytes;

    while (buffer_.size() >= PRELUDE_LENGTH) {
        const auto* p = reinterpret_cast<const uint8_t*>(buffer_.data());
        uint32_t total_length = read_u32(p);
        uint32_t headers_length = read_u32(p + 4);
        uint32_t prelude_crc = read_u32(p + 8);

        if (crc32(p, 8) != prelude_crc) {
            throw EventStreamError("Event-stream prelude CRC mismatch");
        }
        if (total_length < MIN_MESSAGE_LENGTH || total_length > MAX_MESSAGE_LENGTH ||
            headers_length > total_length - MIN_MESSAGE_LENGTH) {
            throw EventStreamError("Invalid event-stream message length: " + std::to_string(total_length));
        }

        if (buffer_.size() < total_length) {
            break;  // Wait for the rest of the frame
        }

        uint32_t message_crc = read_u32(p + total_length - 4);
        if (crc32(p, total_length - 4) != message_crc) {
            throw EventStreamError("Event-stream message CRC mismatch");
        }

        EventStreamMessage message;
        message.headers = parse_headers(p + PRELUDE_LENGTH, headers_length);
        size_t payload_offset = PRELUDE_LENGTH + headers_length;
        size_t payload_length = total_length - headers_length - MIN_MESSAGE_LENGTH;
        message.payload = buffer_.substr(payload_offset, payload_length);

        buffer_.erase(0, total_length);

        dprintf(3, "Event-stream message: type=%s event=%s payload=%zu bytes",
                message.message_type().c_str(), message.event_type().c_str(), payload_length);

        if (!callback(message)) {
            return false;
        }
    }

    return true;
}

std::string decode_chunk_payload(const std::string& payload) {
    nlohmann::json envelope;
    try {
        envelope = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        throw EventStreamError("Invalid chunk payload: " + std::string(e.what()));
    }
    if (!envelope.contains("bytes") || !envelope["bytes"].is_string()) {
        throw EventStreamError("Chunk payload has no bytes field");
    }
    return base64_decode(envelope["bytes"].get<std::string>());
}

} // namespace aws
