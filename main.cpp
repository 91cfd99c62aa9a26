#include <meridian/environment.h>
#include <meridian/exceptions.h>
#include <meridian/failover_client.h>
#include <meridian/http_transport.h>
#include <meridian/logger.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <string>

using namespace meridian;

namespace {

    constexpr std::string_view kDefaultModel = "anthropic.claude-3-haiku-20240307-v1:0";

    struct CliOptions {
        ApiMethod method = ApiMethod::Converse;
        bool debug = false;
        bool persist = false;
        std::string endpoints;
        std::string model{kDefaultModel};
        std::string prompt = "Hello";
    };

    void print_usage() {
        std::cerr << "Usage: meridian <converse|converse_stream|invoke_model|invoke_model_with_response_stream>\n"
                  << "                [--debug] [--endpoints <file>] [--model <id>] [--prompt <text>] [--persist]\n";
    }

    std::optional<CliOptions> parse_args(int argc, char** argv) {
        if (argc < 2) return std::nullopt;

        CliOptions opts;
        auto method = parse_api_method(argv[1]);
        if (!method) return std::nullopt;
        opts.method = *method;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::optional<std::string> {
                if (i + 1 >= argc) return std::nullopt;
                return std::string(argv[++i]);
            };

            if (arg == "--debug") {
                opts.debug = true;
            } else if (arg == "--persist") {
                opts.persist = true;
            } else if (arg == "--endpoints") {
                auto v = value();
                if (!v) return std::nullopt;
                opts.endpoints = *v;
            } else if (arg == "--model") {
                auto v = value();
                if (!v) return std::nullopt;
                opts.model = *v;
            } else if (arg == "--prompt") {
                auto v = value();
                if (!v) return std::nullopt;
                opts.prompt = *v;
            } else {
                return std::nullopt;
            }
        }
        return opts;
    }

    // Anthropic messages body for the raw invoke APIs
    std::string raw_body(const std::string& prompt) {
        boost::json::object body{
            {"anthropic_version", "bedrock-2023-05-31"},
            {"max_tokens", 512},
            {"messages", boost::json::array{
                boost::json::object{{"role", "user"}, {"content", boost::json::array{
                    boost::json::object{{"type", "text"}, {"text", prompt}}
                }}}
            }}
        };
        return boost::json::serialize(body);
    }

    Async<int> run(FailoverClient& client, const CliOptions& opts) {
        boost::json::array messages{
            boost::json::object{{"role", "user"}, {"content", boost::json::array{
                boost::json::object{{"text", opts.prompt}}
            }}}
        };

        InvokeOutcome outcome;
        switch (opts.method) {
            case ApiMethod::Converse:
                outcome = co_await client.converse(std::move(messages), {}, InvokeOptions{true});
                break;
            case ApiMethod::ConverseStream:
                outcome = co_await client.converse_stream(std::move(messages));
                break;
            case ApiMethod::InvokeModel:
                outcome = co_await client.invoke_model(raw_body(opts.prompt), {}, InvokeOptions{true});
                break;
            case ApiMethod::InvokeModelWithResponseStream:
                outcome = co_await client.invoke_model_with_response_stream(raw_body(opts.prompt));
                break;
        }

        if (outcome.ok()) {
            std::cout << "Region: " << outcome.region << " (" << outcome.model_id << ")\n";
            if (is_streaming(outcome.method)) {
                auto chunks = client.chunks(outcome);
                std::cout << collect_text(chunks) << "\n";
            } else if (outcome.content) {
                const auto& content = *outcome.content;
                std::cout << (content.is_string() ? std::string(content.as_string())
                                                  : boost::json::serialize(content)) << "\n";
            } else {
                std::cout << boost::json::serialize(outcome.response.body) << "\n";
            }
        } else {
            std::cerr << to_string(outcome.status) << ": " << outcome.error << "\n";
            for (const auto& e : client.error_logs()) {
                std::cerr << "  " << e << "\n";
            }
        }

        if (!client.failed_regions().empty()) {
            std::cout << "Failed regions:";
            for (const auto& r : client.failed_regions()) std::cout << " " << r;
            std::cout << "\n";

            if (opts.persist) {
                client.record_and_persist_failures();
            } else {
                client.reset_failures();
            }
        }

        co_return outcome.ok() ? 0 : 1;
    }

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 2;
    }

    load_env();
    auto& log = Logger::instance();
    log.configure(env<std::string>("MERIDIAN_LOG_FILE", std::string("stdout")));
    if (opts->debug) log.set_level(LogLevel::DEBUG);

    int exit_code = 1;
    try {
        FailoverConfig config = FailoverConfig::from_env();
        if (!opts->endpoints.empty()) config.endpoints_path = opts->endpoints;

        auto factory = std::make_shared<BedrockHttpClientFactory>(BedrockHttpOptions::from_env(config));
        FailoverClient client(config, factory);
        client.set_model_id(opts->model);

        boost::asio::io_context ioc;
        boost::asio::co_spawn(ioc, run(client, *opts), [&](std::exception_ptr e, int code) {
            if (e) std::rethrow_exception(e);
            exit_code = code;
        });
        ioc.run();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        exit_code = 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    log.flush();
    return exit_code;
}
