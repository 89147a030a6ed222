#pragma once
#include "coercion.hpp"
#include "config.hpp"
#include "context.hpp"
#include "server.hpp"
#include <functional>
#include <utility>

namespace fdk {

/// Typed function body: receives the decoded input, returns the value to
/// encode back in the request's content type.
template <typename In, typename Out>
using Handler = std::function<Out(RuntimeContext& ctx, In input)>;

/// Wrap a typed handler into the byte-level form the server calls:
/// decode<In>, invoke, encode_payload. Coercion errors and anything the
/// handler throws propagate to the server, which answers 502.
template <typename In, typename Out>
RawHandler make_raw_handler(Handler<In, Out> handler, CoercionOptions options = {}) {
    static_assert(is_input_coercible_v<In>, "In must be convertible from nlohmann::json");
    static_assert(is_output_coercible_v<Out>, "Out must be convertible to nlohmann::json");

    return [handler = std::move(handler), options = std::move(options)](
               RuntimeContext& ctx, ContentType type, Bytes body) {
        In input = decode<In>(type, std::move(body));
        Out output = handler(ctx, std::move(input));
        return encode_payload(type, std::move(output), options);
    };
}

/// Serve `handler` with explicit options until the server is shut down.
template <typename In, typename Out>
void run(FunctionServer::Options opts, Handler<In, Out> handler) {
    auto raw = make_raw_handler<In, Out>(std::move(handler), opts.coercion);
    FunctionServer server(std::move(opts), std::move(raw));
    server.serve();
}

/// Load the runtime configuration from the environment and serve `handler`.
/// Throws ConfigError when FN_FORMAT or FN_LISTENER are unusable.
///
/// Usage:
///   fdk::run<std::string, std::string>([](fdk::RuntimeContext&, std::string name) {
///       return "Hello " + name + "!";
///   });
template <typename In, typename Out>
void run(Handler<In, Out> handler) {
    FunctionServer::Options opts;
    opts.config = RuntimeConfig::from_environment();
    run<In, Out>(std::move(opts), std::move(handler));
}

} // namespace fdk
