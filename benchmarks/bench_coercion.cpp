#include <benchmark/benchmark.h>
#include "fdk/coercion.hpp"
#include <string>
#include <vector>

using namespace fdk;

namespace {

struct Order {
    std::string id;
    std::string customer;
    int quantity = 0;
    double price = 0.0;
    bool express = false;
    std::vector<std::string> items;
};

void to_json(nlohmann::json& j, const Order& o) {
    j = {{"id", o.id}, {"customer", o.customer}, {"quantity", o.quantity},
         {"price", o.price}, {"express", o.express}, {"items", o.items}};
}

void from_json(const nlohmann::json& j, Order& o) {
    j.at("id").get_to(o.id);
    j.at("customer").get_to(o.customer);
    j.at("quantity").get_to(o.quantity);
    j.at("price").get_to(o.price);
    j.at("express").get_to(o.express);
    j.at("items").get_to(o.items);
}

Order make_order(int n_items) {
    Order o;
    o.id = "ord-0001";
    o.customer = "Ann Lee";
    o.quantity = n_items;
    o.price = 19.99;
    o.express = true;
    for (int i = 0; i < n_items; ++i) {
        o.items.push_back("sku-" + std::to_string(i));
    }
    return o;
}

} // anonymous namespace

static const Order kSmallOrder = make_order(3);
static const Order kLargeOrder = make_order(500);

static const Bytes kSmallJson = encode(ContentType::JSON, kSmallOrder);
static const Bytes kLargeJson = encode(ContentType::JSON, kLargeOrder);
static const Bytes kSmallYaml = encode(ContentType::YAML, kSmallOrder);
static const Bytes kSmallXml = encode(ContentType::XML, kSmallOrder);
static const Bytes kSmallForm = encode(ContentType::URLEncoded, kSmallOrder);

// ---- Decode benchmarks ----

static void decode_order(benchmark::State& state, ContentType type, const Bytes& input) {
    for (auto _ : state) {
        auto order = decode<Order>(type, input);
        benchmark::DoNotOptimize(order);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

static void BM_DecodeJsonSmall(benchmark::State& state) { decode_order(state, ContentType::JSON, kSmallJson); }
BENCHMARK(BM_DecodeJsonSmall)->MinTime(1.0);

static void BM_DecodeJsonLarge(benchmark::State& state) { decode_order(state, ContentType::JSON, kLargeJson); }
BENCHMARK(BM_DecodeJsonLarge)->MinTime(1.0);

static void BM_DecodeYamlSmall(benchmark::State& state) { decode_order(state, ContentType::YAML, kSmallYaml); }
BENCHMARK(BM_DecodeYamlSmall)->MinTime(1.0);

static void BM_DecodeXmlSmall(benchmark::State& state) { decode_order(state, ContentType::XML, kSmallXml); }
BENCHMARK(BM_DecodeXmlSmall)->MinTime(1.0);

static void BM_DecodeFormSmall(benchmark::State& state) { decode_order(state, ContentType::URLEncoded, kSmallForm); }
BENCHMARK(BM_DecodeFormSmall)->MinTime(1.0);

static void BM_DecodePlainString(benchmark::State& state) {
    const Bytes input = to_bytes("Hello benchmark");
    for (auto _ : state) {
        auto s = decode<std::string>(ContentType::Plain, input);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_DecodePlainString)->MinTime(1.0);

static void BM_DecodeInvalidJson(benchmark::State& state) {
    const Bytes bad = to_bytes("{this is not valid json at all!!!");
    for (auto _ : state) {
        try {
            auto order = decode<Order>(ContentType::JSON, bad);
            benchmark::DoNotOptimize(order);
        } catch (const CoercionError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_DecodeInvalidJson)->MinTime(1.0);

// ---- Encode benchmarks ----

static void encode_order(benchmark::State& state, ContentType type, const Order& order) {
    for (auto _ : state) {
        auto out = encode_payload(type, order);
        benchmark::DoNotOptimize(out);
    }
}

static void BM_EncodeJsonSmall(benchmark::State& state) { encode_order(state, ContentType::JSON, kSmallOrder); }
BENCHMARK(BM_EncodeJsonSmall)->MinTime(1.0);

static void BM_EncodeJsonLarge(benchmark::State& state) { encode_order(state, ContentType::JSON, kLargeOrder); }
BENCHMARK(BM_EncodeJsonLarge)->MinTime(1.0);

static void BM_EncodeYamlSmall(benchmark::State& state) { encode_order(state, ContentType::YAML, kSmallOrder); }
BENCHMARK(BM_EncodeYamlSmall)->MinTime(1.0);

static void BM_EncodeXmlSmall(benchmark::State& state) { encode_order(state, ContentType::XML, kSmallOrder); }
BENCHMARK(BM_EncodeXmlSmall)->MinTime(1.0);

static void BM_EncodeFormSmall(benchmark::State& state) { encode_order(state, ContentType::URLEncoded, kSmallOrder); }
BENCHMARK(BM_EncodeFormSmall)->MinTime(1.0);

static void BM_RoundTripJson(benchmark::State& state) {
    for (auto _ : state) {
        auto order = decode<Order>(ContentType::JSON, kSmallJson);
        auto out = encode(ContentType::JSON, std::move(order));
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_RoundTripJson)->MinTime(1.0);
