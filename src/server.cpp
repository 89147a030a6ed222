#include "fdk/server.hpp"
#include "fdk/error.hpp"
#include "fdk/logging.hpp"
#include "fdk/version.hpp"

#include <httplib.h>

#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <thread>

namespace fdk {

namespace {

constexpr const char* CALL_PATH = "/call";

std::string dirname_of(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string basename_of(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

} // anonymous namespace

FunctionServer::FunctionServer(Options opts, RawHandler handler)
    : opts_(std::move(opts))
    , handler_(std::move(handler))
    , server_(std::make_unique<httplib::Server>()) {
}

FunctionServer::~FunctionServer() {
    shutdown();
}

std::string FunctionServer::phony_socket_path() const {
    const auto& listener = opts_.config.listener;
    return dirname_of(listener) + "/phony" + basename_of(listener);
}

void FunctionServer::setup_routes() {
    server_->Post(CALL_PATH, [this](const httplib::Request& req, httplib::Response& res) {
        handle_call(req, res);
    });
}

void FunctionServer::handle_call(const httplib::Request& req, httplib::Response& res) {
    RuntimeContext ctx(opts_.config, Headers(req.headers.begin(), req.headers.end()));
    res.set_header("Fn-Fdk-Version", std::string(FDK_VERSION));
    res.set_header("Fn-Fdk-Runtime", std::string(FDK_RUNTIME));

    try {
        auto type = content_type_from_string(req.get_header_value("Content-Type"),
                                             opts_.content_type_policy);
        logger()->debug("call {}: {} bytes as {}", ctx.call_id(), req.body.size(),
                        content_type_name(type));

        EncodedPayload out = handler_(ctx, type, Bytes(req.body.begin(), req.body.end()));

        for (const auto& [name, value] : ctx.response_headers()) {
            res.set_header(name, value);
        }
        if (auto status = ctx.http_status()) {
            res.set_header("Fn-Http-Status", std::to_string(*status));
        }
        res.status = 200;
        res.set_content(std::string(out.body.begin(), out.body.end()), out.content_type.c_str());
    } catch (const CoercionError& e) {
        logger()->warn("call {}: coercion failed: {}", ctx.call_id(), e.what());
        res.status = 502;
        res.set_content(std::string(e.what()), "text/plain");
    } catch (const std::exception& e) {
        logger()->warn("call {}: function failed: {}", ctx.call_id(), e.what());
        res.status = 502;
        res.set_content(std::string(e.what()), "text/plain");
    }
}

// The platform only connects once FN_LISTENER exists, so the socket is
// bound under a sibling name and exposed through a symlink afterwards.
void FunctionServer::publish_listener() const {
    const auto& link = opts_.config.listener;
    auto phony = phony_socket_path();

    if (::chmod(phony.c_str(), 0666) != 0) {
        throw TransportError(errno_message("Failed to chmod", phony));
    }
    std::string target = "phony" + basename_of(link);
    std::string staging = staging_link_path();
    if (::unlink(staging.c_str()) != 0 && errno != ENOENT) {
        throw TransportError(errno_message("Failed to remove stale link", staging));
    }
    if (::symlink(target.c_str(), staging.c_str()) != 0) {
        throw TransportError(errno_message("Failed to link listener", staging));
    }
    // rename() replaces an existing listener atomically
    if (::rename(staging.c_str(), link.c_str()) != 0) {
        throw TransportError(errno_message("Failed to publish listener", link));
    }
}

std::string FunctionServer::staging_link_path() const {
    return opts_.config.listener + ".link";
}

// httplib's stop() only closes a socket whose accept loop is running, so
// a socket that is bound but never served is released by entering the
// loop and leaving it straight away.
void FunctionServer::release_bound_socket() {
    std::atomic<bool> done{false};
    std::thread loop([this, &done] {
        server_->listen_after_bind();
        done = true;
    });
    while (!done && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_->stop();
    loop.join();

    for (const auto& path : {phony_socket_path(), staging_link_path()}) {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            logger()->warn("{}", errno_message("Failed to remove", path));
        }
    }
}

void FunctionServer::remove_listener() const {
    for (const auto& path : {opts_.config.listener, phony_socket_path()}) {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
            logger()->warn("{}", errno_message("Failed to remove", path));
        }
    }
}

void FunctionServer::serve() {
    if (running_.exchange(true)) return;

    bool bound = false;
    try {
        set_log_level(opts_.config.log_level);
        setup_routes();

        const int threads = opts_.thread_pool_size;
        server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        server_->set_address_family(AF_UNIX);

        auto phony = phony_socket_path();
        if (::unlink(phony.c_str()) != 0 && errno != ENOENT) {
            throw TransportError(errno_message("Failed to remove stale socket", phony));
        }
        // The port is unused for unix sockets but must be non-zero, or
        // httplib tries to look up an ephemeral TCP port
        if (!server_->bind_to_port(phony, 80)) {
            throw TransportError("Failed to bind unix socket " + phony);
        }
        bound = true;
        publish_listener();
    } catch (...) {
        if (bound) release_bound_socket();
        running_ = false;
        throw;
    }

    logger()->info("{} serving {} on {}", FDK_VERSION, opts_.config.fn_name, opts_.config.listener);
    bool ok = server_->listen_after_bind();
    remove_listener();
    running_ = false;

    if (!ok) {
        throw TransportError("Function server stopped unexpectedly on " + opts_.config.listener);
    }
    logger()->info("function server on {} stopped", opts_.config.listener);
}

void FunctionServer::shutdown() {
    if (!running_.exchange(false)) return;
    server_->stop();
}

} // namespace fdk
