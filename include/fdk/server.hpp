#pragma once
#include "coercion.hpp"
#include "config.hpp"
#include "context.hpp"
#include "content_type.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace fdk {

/// Byte-level handler: receives the classified content type and the raw
/// request body, returns the encoded response payload.
using RawHandler = std::function<EncodedPayload(RuntimeContext& ctx, ContentType type, Bytes body)>;

/// Fn "http-stream" function server: HTTP/1.1 over the unix socket named
/// by FN_LISTENER, one POST /call per invocation.
class FunctionServer {
public:
    struct Options {
        RuntimeConfig config;
        ContentTypePolicy content_type_policy = ContentTypePolicy::FallbackToJson;
        CoercionOptions coercion;
        int thread_pool_size = 8;
    };

    FunctionServer(Options opts, RawHandler handler);
    ~FunctionServer();

    // Non-copyable, non-movable
    FunctionServer(const FunctionServer&) = delete;
    FunctionServer& operator=(const FunctionServer&) = delete;

    /// Bind, publish the listener symlink and serve until shutdown().
    /// Throws TransportError if the socket cannot be bound or published;
    /// a socket bound before the failure is closed and unlinked again.
    void serve();
    void shutdown();

    [[nodiscard]] bool is_running() const { return running_; }
    [[nodiscard]] const Options& options() const { return opts_; }

    /// Socket actually bound; FN_LISTENER is a symlink to it.
    [[nodiscard]] std::string phony_socket_path() const;

private:
    void setup_routes();
    void handle_call(const httplib::Request& req, httplib::Response& res);
    void publish_listener() const;
    void remove_listener() const;
    [[nodiscard]] std::string staging_link_path() const;
    void release_bound_socket();

    Options opts_;
    RawHandler handler_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
};

} // namespace fdk
