#include <meridian/event_stream.h>
#include <meridian/call_shape.h>
#include <meridian/exceptions.h>
#include <meridian/logger.h>
#include <boost/crc.hpp>

namespace meridian {

namespace {

    constexpr size_t kPreludeSize = 12;
    constexpr size_t kMinFrameSize = 16;

    uint32_t crc32(const char* data, size_t len) {
        boost::crc_32_type crc;
        crc.process_bytes(data, len);
        return crc.checksum();
    }

    uint32_t read_be32(const char* p) {
        const auto* u = reinterpret_cast<const unsigned char*>(p);
        return (uint32_t(u[0]) << 24) | (uint32_t(u[1]) << 16) | (uint32_t(u[2]) << 8) | uint32_t(u[3]);
    }

    uint16_t read_be16(const char* p) {
        const auto* u = reinterpret_cast<const unsigned char*>(p);
        return static_cast<uint16_t>((u[0] << 8) | u[1]);
    }

    void write_be32(std::string& out, uint32_t v) {
        out.push_back(static_cast<char>((v >> 24) & 0xff));
        out.push_back(static_cast<char>((v >> 16) & 0xff));
        out.push_back(static_cast<char>((v >> 8) & 0xff));
        out.push_back(static_cast<char>(v & 0xff));
    }

    void write_be16(std::string& out, uint16_t v) {
        out.push_back(static_cast<char>((v >> 8) & 0xff));
        out.push_back(static_cast<char>(v & 0xff));
    }

    // Fixed-size header value lengths by type tag; -1 marks length-prefixed types
    int header_value_size(uint8_t type) {
        switch (type) {
            case 0: case 1: return 0;    // bool true / false
            case 2: return 1;            // byte
            case 3: return 2;            // short
            case 4: return 4;            // int
            case 5: case 8: return 8;    // long, timestamp
            case 6: case 7: return -1;   // bytes, string
            case 9: return 16;           // uuid
            default: return -2;
        }
    }

    std::map<std::string, std::string> parse_headers(const char* p, size_t len) {
        std::map<std::string, std::string> headers;
        size_t pos = 0;

        auto need = [&](size_t n) {
            if (pos + n > len) throw StreamError("Truncated event-stream header block");
        };

        while (pos < len) {
            need(1);
            size_t name_len = static_cast<unsigned char>(p[pos++]);
            need(name_len + 1);
            std::string name(p + pos, name_len);
            pos += name_len;
            uint8_t type = static_cast<uint8_t>(p[pos++]);

            int size = header_value_size(type);
            if (size == -2) {
                throw StreamError("Unknown event-stream header type " + std::to_string(type));
            }
            if (size == -1) {
                need(2);
                size_t value_len = read_be16(p + pos);
                pos += 2;
                need(value_len);
                if (type == 7) {
                    headers[name] = std::string(p + pos, value_len);
                }
                pos += value_len;
            } else {
                need(static_cast<size_t>(size));
                pos += static_cast<size_t>(size);
            }
        }
        return headers;
    }

    std::string string_field(const boost::json::value& v, std::string_view key) {
        if (const auto* obj = v.if_object()) {
            if (const auto* field = obj->if_contains(key); field && field->is_string()) {
                return std::string(field->as_string());
            }
        }
        return {};
    }

} // namespace

std::optional<EventStreamMessage> EventStreamDecoder::next() {
    if (offset_ >= buffer_.size()) return std::nullopt;

    const size_t remaining = buffer_.size() - offset_;
    if (remaining < kMinFrameSize) {
        throw StreamError("Truncated event-stream frame");
    }

    const char* p = buffer_.data() + offset_;
    const uint32_t total = read_be32(p);
    const uint32_t headers_len = read_be32(p + 4);

    if (crc32(p, 8) != read_be32(p + 8)) {
        throw StreamError("Event-stream prelude checksum mismatch");
    }
    if (total < kMinFrameSize || total > remaining || headers_len > total - kMinFrameSize) {
        throw StreamError("Invalid event-stream frame length");
    }
    if (crc32(p, total - 4) != read_be32(p + total - 4)) {
        throw StreamError("Event-stream message checksum mismatch");
    }

    EventStreamMessage msg;
    msg.headers = parse_headers(p + kPreludeSize, headers_len);
    const size_t payload_offset = kPreludeSize + headers_len;
    msg.payload.assign(p + payload_offset, total - payload_offset - 4);

    offset_ += total;
    return msg;
}

std::string EventStreamDecoder::encode(const std::map<std::string, std::string>& headers, std::string_view payload) {
    std::string header_block;
    for (const auto& [name, value] : headers) {
        header_block.push_back(static_cast<char>(name.size()));
        header_block += name;
        header_block.push_back(static_cast<char>(7));
        write_be16(header_block, static_cast<uint16_t>(value.size()));
        header_block += value;
    }

    const uint32_t total = static_cast<uint32_t>(kMinFrameSize + header_block.size() + payload.size());

    std::string frame;
    frame.reserve(total);
    write_be32(frame, total);
    write_be32(frame, static_cast<uint32_t>(header_block.size()));
    write_be32(frame, crc32(frame.data(), 8));
    frame += header_block;
    frame.append(payload.data(), payload.size());
    write_be32(frame, crc32(frame.data(), frame.size()));
    return frame;
}

std::optional<boost::json::value> DecodedEventStream::next() {
    auto msg = decoder_.next();
    if (!msg) return std::nullopt;

    boost::json::value payload = boost::json::object{};
    if (!msg->payload.empty()) {
        boost::json::error_code ec;
        payload = boost::json::parse(msg->payload, ec);
        if (ec) {
            throw StreamError("Invalid event payload: " + ec.message());
        }
    }

    const std::string message_type = msg->header(":message-type");
    if (message_type == "exception" || message_type == "error") {
        std::string kind = msg->header(":exception-type");
        if (kind.empty()) kind = msg->header(":error-code");
        std::string text = string_field(payload, "message");
        if (text.empty()) text = msg->header(":error-message");
        throw StreamError(kind + ": " + text);
    }

    boost::json::object event;
    event[msg->header(":event-type")] = std::move(payload);
    return boost::json::value(std::move(event));
}

std::optional<boost::json::value> ChunkSequence::next() {
    while (auto event = stream_->next()) {
        if (auto chunk = shape_->filter_chunk(*event, content_only_)) {
            return chunk;
        }
    }
    return std::nullopt;
}

std::string collect_text(ChunkSequence& chunks) {
    std::string output;

    try {
        while (auto chunk = chunks.next()) {
            if (chunks.content_only()) {
                output += string_field(*chunk, "text");
            } else {
                output += boost::json::serialize(*chunk);
            }
        }
    } catch (const StreamError& e) {
        Logger::instance().log_error(std::string("Error processing event stream: ") + e.what());
    }

    return output;
}

} // namespace meridian
