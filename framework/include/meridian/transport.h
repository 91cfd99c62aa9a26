#ifndef MERIDIAN_TRANSPORT_H
#define MERIDIAN_TRANSPORT_H

#include <meridian/call_shape.h>
#include <meridian/config.h>
#include <meridian/event_stream.h>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace meridian {

template<typename T>
using Async = boost::asio::awaitable<T>;

/**
 * @brief What a region client returns: a JSON body, or a stream for the streaming APIs.
 */
struct InvokeResponse {
    int status = 200;
    boost::json::value body;
    std::shared_ptr<EventStream> stream;

    bool empty() const { return !stream && body.is_null(); }
};

/**
 * @brief Remote inference API bound to one region.
 *
 * Implementations throw ValidationError for caller-side faults and
 * TransportFailure (or any other exception) for everything else,
 * timeouts included.
 */
class RegionClient {
public:
    virtual ~RegionClient() = default;

    virtual const std::string& region() const = 0;

    /** @brief Structured-message call (converse / converse-stream). */
    virtual Async<InvokeResponse> converse(const boost::json::object& params, bool streaming) = 0;

    /** @brief Raw-body call (invoke-model / invoke-model-with-response-stream). */
    virtual Async<InvokeResponse> invoke_model(const boost::json::object& params, bool streaming) = 0;
};

class ClientFactory {
public:
    virtual ~ClientFactory() = default;
    virtual std::shared_ptr<RegionClient> create(const std::string& region) = 0;
};

/**
 * @brief Routes @p params to the operation matching @p method.
 */
Async<InvokeResponse> dispatch(RegionClient& client, ApiMethod method, const boost::json::object& params);

/**
 * @brief Hands out region clients according to a ClientLifetime.
 */
class ClientProvider {
public:
    ClientProvider(std::shared_ptr<ClientFactory> factory, ClientLifetime lifetime);

    /**
     * @throws TransportFailure when the factory cannot build a client.
     */
    std::shared_ptr<RegionClient> acquire(const std::string& region);

    void clear();
    size_t pooled() const;
    ClientLifetime lifetime() const { return lifetime_; }

private:
    std::shared_ptr<ClientFactory> factory_;
    ClientLifetime lifetime_;
    std::map<std::string, std::shared_ptr<RegionClient>> pool_;
    mutable std::mutex pool_mtx_;
};

} // namespace meridian

#endif // MERIDIAN_TRANSPORT_H
