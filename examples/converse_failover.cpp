#include <meridian/environment.h>
#include <meridian/failover_client.h>
#include <meridian/http_transport.h>
#include <meridian/logger.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>

using namespace meridian;

// Runs a converse call and a streamed converse call through the same client,
// then writes cooldowns for any region that failed along the way.
int main() {
    load_env();
    Logger::instance().set_level(LogLevel::DEBUG);

    FailoverConfig config = FailoverConfig::from_env();
    config.client_lifetime = ClientLifetime::PooledPerRegion;

    FailoverClient client(config, std::make_shared<BedrockHttpClientFactory>(BedrockHttpOptions::from_env(config)));
    client.set_model_id("anthropic.claude-3-haiku-20240307-v1:0")
          .set_inference_config(boost::json::object{{"maxTokens", 256}, {"temperature", 0.2}});

    boost::json::array messages{
        boost::json::object{{"role", "user"}, {"content", boost::json::array{
            boost::json::object{{"text", "Name three rivers in Europe."}}
        }}}
    };

    boost::asio::io_context ioc;
    boost::asio::co_spawn(ioc, [&]() -> Async<void> {
        auto outcome = co_await client.converse(messages, {}, InvokeOptions{true});
        if (outcome && outcome.content) {
            std::cout << "[" << outcome.region << "] " << boost::json::serialize(*outcome.content) << "\n";
        } else {
            std::cout << "converse: " << outcome.error << "\n";
        }

        auto streamed = co_await client.converse_stream(messages);
        auto chunks = client.chunks(streamed);
        std::cout << "[" << streamed.region << "] " << collect_text(chunks) << "\n";

        if (!client.failed_regions().empty()) {
            client.record_and_persist_failures();
        }
        co_return;
    }, boost::asio::detached);
    ioc.run();

    Logger::instance().flush();
    return 0;
}
