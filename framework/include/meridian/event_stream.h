#ifndef MERIDIAN_EVENT_STREAM_H
#define MERIDIAN_EVENT_STREAM_H

#include <boost/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

class CallShape;

/**
 * @brief Pull-based sequence of response events.
 *
 * next() returns std::nullopt at the end of the stream and throws StreamError
 * when the stream breaks; the two are never confused. A stream is consumed
 * once and belongs to the call that produced it.
 */
class EventStream {
public:
    virtual ~EventStream() = default;
    virtual std::optional<boost::json::value> next() = 0;
};

/**
 * @brief Events already in memory.
 */
class BufferedEventStream : public EventStream {
public:
    explicit BufferedEventStream(std::vector<boost::json::value> events) : events_(std::move(events)) {}

    std::optional<boost::json::value> next() override {
        if (pos_ >= events_.size()) return std::nullopt;
        return std::move(events_[pos_++]);
    }

private:
    std::vector<boost::json::value> events_;
    size_t pos_ = 0;
};

/**
 * @brief One frame of the application/vnd.amazon.eventstream encoding.
 */
struct EventStreamMessage {
    std::map<std::string, std::string> headers;  // string-typed headers only
    std::string payload;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

/**
 * @brief Splits a buffered event-stream body into frames.
 *
 * Frame layout: total length (4), headers length (4), prelude CRC32 (4),
 * headers, payload, message CRC32 (4). All integers big-endian.
 */
class EventStreamDecoder {
public:
    explicit EventStreamDecoder(std::string buffer) : buffer_(std::move(buffer)) {}

    /**
     * @throws StreamError on truncation or CRC mismatch.
     */
    std::optional<EventStreamMessage> next();

    bool done() const { return offset_ >= buffer_.size(); }

    /**
     * @brief Encodes one frame with string headers; the inverse of next().
     */
    static std::string encode(const std::map<std::string, std::string>& headers, std::string_view payload);

private:
    std::string buffer_;
    size_t offset_ = 0;
};

/**
 * @brief Adapts decoded frames to JSON events of the form {"<event-type>": payload}.
 * Exception frames raise StreamError carrying the service message.
 */
class DecodedEventStream : public EventStream {
public:
    explicit DecodedEventStream(std::string body) : decoder_(std::move(body)) {}

    std::optional<boost::json::value> next() override;

private:
    EventStreamDecoder decoder_;
};

/**
 * @brief Lazily filters an EventStream through a call shape's chunk rules.
 */
class ChunkSequence {
public:
    ChunkSequence(std::shared_ptr<EventStream> stream, const CallShape& shape, bool content_only = true)
        : stream_(std::move(stream)), shape_(&shape), content_only_(content_only) {}

    /**
     * @brief Next chunk that passes the filter, std::nullopt at end of stream.
     * @throws StreamError if the underlying stream breaks.
     */
    std::optional<boost::json::value> next();

    bool content_only() const { return content_only_; }

private:
    std::shared_ptr<EventStream> stream_;
    const CallShape* shape_;
    bool content_only_;
};

/**
 * @brief Drains @p chunks into one string.
 *
 * Content-only sequences contribute their "text" fields; otherwise each chunk
 * is serialized. A broken stream ends collection early and is logged.
 */
std::string collect_text(ChunkSequence& chunks);

} // namespace meridian

#endif // MERIDIAN_EVENT_STREAM_H
