/// Order function: prices an order and reports the total.
/// Usage: run inside an Fn http-stream container (FN_LISTENER=unix:/path).
///
///   curl -H 'Content-Type: application/x-www-form-urlencoded' \
///        -d 'sku=book&sku=pen&quantity=2' ...
///
/// The same order can be sent as JSON, YAML or XML. TAX_RATE from the
/// function configuration is applied to the total.

#include <fdk/fdk.hpp>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {

struct Order {
    std::vector<std::string> sku;
    int quantity = 1;
    bool express = false;
};

void from_json(const nlohmann::json& j, Order& o) {
    j.at("sku").get_to(o.sku);
    if (j.contains("quantity")) j.at("quantity").get_to(o.quantity);
    if (j.contains("express")) j.at("express").get_to(o.express);
}

void to_json(nlohmann::json& j, const Order& o) {
    j = {{"sku", o.sku}, {"quantity", o.quantity}, {"express", o.express}};
}

struct Quote {
    std::vector<std::string> sku;
    double total = 0.0;
    std::string currency = "EUR";
};

void to_json(nlohmann::json& j, const Quote& q) {
    j = {{"sku", q.sku}, {"total", q.total}, {"currency", q.currency}};
}

const std::map<std::string, double> PRICES = {
    {"book", 12.50},
    {"pen", 1.20},
    {"lamp", 30.00},
};

} // anonymous namespace

int main() {
    fdk::FunctionServer::Options opts;
    try {
        opts.config = fdk::RuntimeConfig::from_environment();
    } catch (const fdk::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    opts.coercion.xml_root = "quote";

    fdk::Handler<Order, Quote> handler = [](fdk::RuntimeContext& ctx, Order order) {
        double rate = 0.0;
        if (auto tax = ctx.config_value("TAX_RATE")) rate = std::stod(*tax);

        Quote quote;
        for (const auto& sku : order.sku) {
            auto it = PRICES.find(sku);
            if (it == PRICES.end()) throw fdk::FunctionError("unknown sku: " + sku);
            quote.total += it->second * order.quantity;
        }
        if (order.express) quote.total += 5.0;
        quote.total *= 1.0 + rate;
        quote.sku = std::move(order.sku);

        ctx.add_response_header("X-Priced-By", ctx.fn_name());
        ctx.set_http_status(201);
        return quote;
    };

    try {
        fdk::run(std::move(opts), std::move(handler));
    } catch (const fdk::FdkError& e) {
        std::cerr << "function invocation error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
