#include <meridian/transport.h>
#include <meridian/exceptions.h>
#include <stdexcept>

namespace meridian {

Async<InvokeResponse> dispatch(RegionClient& client, ApiMethod method, const boost::json::object& params) {
    switch (method) {
        case ApiMethod::Converse:
            co_return co_await client.converse(params, false);
        case ApiMethod::ConverseStream:
            co_return co_await client.converse(params, true);
        case ApiMethod::InvokeModel:
            co_return co_await client.invoke_model(params, false);
        case ApiMethod::InvokeModelWithResponseStream:
            co_return co_await client.invoke_model(params, true);
    }
    throw std::invalid_argument("Unknown API method");
}

ClientProvider::ClientProvider(std::shared_ptr<ClientFactory> factory, ClientLifetime lifetime)
    : factory_(std::move(factory)), lifetime_(lifetime) {
    if (!factory_) {
        throw std::invalid_argument("ClientProvider requires a client factory");
    }
}

std::shared_ptr<RegionClient> ClientProvider::acquire(const std::string& region) {
    if (lifetime_ == ClientLifetime::PerCall) {
        auto client = factory_->create(region);
        if (!client) throw TransportFailure("No client for region " + region);
        return client;
    }

    std::lock_guard<std::mutex> lock(pool_mtx_);
    auto it = pool_.find(region);
    if (it != pool_.end()) {
        return it->second;
    }

    auto client = factory_->create(region);
    if (!client) throw TransportFailure("No client for region " + region);
    pool_.emplace(region, client);
    return client;
}

void ClientProvider::clear() {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    pool_.clear();
}

size_t ClientProvider::pooled() const {
    std::lock_guard<std::mutex> lock(pool_mtx_);
    return pool_.size();
}

} // namespace meridian
