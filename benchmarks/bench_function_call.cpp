#include <benchmark/benchmark.h>
#include "fdk/function.hpp"
#include "fdk/server.hpp"
#include <httplib.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <thread>

using namespace fdk;

// Function server on a temporary unix socket plus a client for it
struct CallFixture {
    std::string dir;
    std::string listener;
    std::unique_ptr<FunctionServer> server;
    std::thread server_thread;
    std::unique_ptr<httplib::Client> client;

    CallFixture() {
        char tmpl[] = "/tmp/fdk-bench-XXXXXX";
        if (!::mkdtemp(tmpl)) throw std::runtime_error("mkdtemp failed");
        dir = tmpl;
        listener = dir + "/lsnr.sock";

        FunctionServer::Options opts;
        opts.config = RuntimeConfig::from_map({{"FN_LISTENER", "unix:" + listener}});
        opts.config.log_level = "warn";
        opts.thread_pool_size = 1;

        Handler<std::string, std::string> greet = [](RuntimeContext&, std::string name) {
            return "Hello " + name + "!";
        };
        server = std::make_unique<FunctionServer>(std::move(opts),
                                                  make_raw_handler(std::move(greet)));
        server_thread = std::thread([this]() { server->serve(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        client = std::make_unique<httplib::Client>(listener);
        client->set_address_family(AF_UNIX);
        client->set_keep_alive(true);
    }

    ~CallFixture() {
        client.reset();
        server->shutdown();
        if (server_thread.joinable()) server_thread.join();
        std::filesystem::remove_all(dir);
    }
};

static void BM_PlainCall(benchmark::State& state) {
    CallFixture fixture;

    for (auto _ : state) {
        auto res = fixture.client->Post("/call", "benchmark", "text/plain");
        benchmark::DoNotOptimize(res);
    }
    state.SetLabel("text/plain call roundtrip");
}
BENCHMARK(BM_PlainCall)->MinTime(2.0)->UseRealTime();

static void BM_JsonCall(benchmark::State& state) {
    CallFixture fixture;

    for (auto _ : state) {
        auto res = fixture.client->Post("/call", "\"benchmark\"", "application/json");
        benchmark::DoNotOptimize(res);
    }
    state.SetLabel("application/json call roundtrip");
}
BENCHMARK(BM_JsonCall)->MinTime(2.0)->UseRealTime();

static void BM_MalformedCall(benchmark::State& state) {
    CallFixture fixture;

    for (auto _ : state) {
        auto res = fixture.client->Post("/call", "{broken", "application/json");
        benchmark::DoNotOptimize(res);
    }
    state.SetLabel("502 roundtrip");
}
BENCHMARK(BM_MalformedCall)->MinTime(2.0)->UseRealTime();
