// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file demo_instance.cpp
 * @brief Instrumented sample application for exercising a coordinator
 *
 * Usage: devbridge-demo [--url ws://host:port] [--device-id id] [-v]
 *
 * Registers a small shop: product and cart state, cart actions, a handful of
 * on-screen components, feature flags and a traced checkout. Outbound HTTP
 * goes through the bridge so it can be listed, mocked and replayed.
 */

#include "app_setup.h"
#include "bridge_client.h"
#include "cli_args.h"
#include "config.h"
#include "log_capture_sink.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <signal.h>
#include <stdexcept>
#include <thread>

using namespace devbridge;

static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

namespace {

/// In-memory shop model standing in for a real application
class DemoShop {
  public:
    json products() const {
        return json::array({{{"id", 1}, {"name", "Espresso"}, {"price", 3.5}},
                            {{"id", 2}, {"name", "Croissant"}, {"price", 2.75}},
                            {{"id", 3}, {"name", "Orange Juice"}, {"price", 4.0}}});
    }

    json cart() const {
        std::lock_guard<std::mutex> lock(mutex_);
        json items = json::array();
        for (const auto& [id, qty] : cart_) {
            items.push_back({{"id", id}, {"quantity", qty}});
        }
        return items;
    }

    double cart_total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        double total = 0;
        for (const auto& product : products()) {
            auto it = cart_.find(product["id"].get<int>());
            if (it != cart_.end()) {
                total += product["price"].get<double>() * it->second;
            }
        }
        return total;
    }

    int add(int product_id, int quantity) {
        if (product_id < 1 || product_id > 3) {
            throw std::invalid_argument("Unknown product id " + std::to_string(product_id));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        cart_[product_id] += quantity;
        return cart_[product_id];
    }

    size_t clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = cart_.size();
        cart_.clear();
        return n;
    }

    std::string search_text() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return search_;
    }

    void set_search_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        search_ = text;
    }

  private:
    mutable std::mutex mutex_;
    std::map<int, int> cart_;
    std::string search_;
};

void register_demo(BridgeClient& bridge, DemoShop& shop) {
    auto& state = bridge.state();
    state.register_state("products", [&shop] { return shop.products(); });
    state.register_state("cart", [&shop] { return shop.cart(); });
    state.register_state("cartTotal", [&shop] { return shop.cart_total(); });
    state.register_state("user", [] { return json{{"id", "u-42"}, {"name", "Demo User"}}; });

    auto& actions = bridge.actions();
    actions.register_action("add_to_cart", [&shop](const json& params) {
        int id = json_util::safe_int(params, "productId", 0);
        int qty = json_util::safe_int(params, "quantity", 1);
        return json{{"productId", id}, {"quantity", shop.add(id, qty)}};
    });
    actions.register_action("clear_cart", [&shop](const json&) {
        return json{{"removed", shop.clear()}};
    });
    actions.register_action("navigate", [](const json& params) {
        std::string route = json_util::safe_string(params, "route");
        spdlog::info("[Demo] Navigating to {}", route);
        return json{{"route", route}};
    });

    // Checkout completes later on another thread, like a network-backed action
    TraceEngine& traces = bridge.traces();
    actions.register_async_action("checkout", [&shop, &traces](const json& params,
                                                               ActionReply reply) {
        std::thread([&shop, &traces, params, reply]() {
            TraceScope scope(traces, "checkout", json::array({params}), "demo_instance.cpp");
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            double total = shop.cart_total();
            if (total <= 0) {
                scope.set_error("Cart is empty");
                reply.reject("Cart is empty");
                return;
            }
            shop.clear();
            json receipt = {{"orderId", "ord-" + std::to_string(json_util::now_epoch_ms())},
                            {"total", total}};
            scope.set_return(receipt);
            reply.resolve(receipt);
        }).detach();
    });

    auto http = bridge.http();
    actions.register_action("fetch_products", [http](const json& params) {
        OutboundRequest request;
        request.url = json_util::safe_string(params, "url", "https://example.com/api/products");
        OutboundResponse response = http->perform(request);
        return json{{"status", response.status},
                    {"body", response.body},
                    {"error", response.error}};
    });

    auto& components = bridge.components();
    {
        ComponentSpec header;
        header.test_id = "header-title";
        header.type = "Text";
        header.bounds = Bounds{0, 0, 400, 60};
        header.get_text = [] { return std::string("Demo Shop"); };
        components.register_component(std::move(header));
    }
    {
        ComponentSpec search;
        search.test_id = "search-input";
        search.type = "TextInput";
        search.bounds = Bounds{10, 70, 380, 40};
        search.get_text = [&shop] { return shop.search_text(); };
        search.on_text_input = [&shop](const std::string& text) { shop.set_search_text(text); };
        components.register_component(std::move(search));
    }
    {
        ComponentSpec add_button;
        add_button.test_id = "add-espresso-button";
        add_button.type = "Button";
        add_button.bounds = Bounds{10, 130, 180, 48};
        add_button.get_text = [] { return std::string("Add Espresso"); };
        add_button.on_tap = [&shop] { shop.add(1, 1); };
        add_button.props = {{"productId", 1}};
        components.register_component(std::move(add_button));
    }
    {
        ComponentSpec badge;
        badge.test_id = "cart-badge";
        badge.type = "Badge";
        badge.bounds = Bounds{340, 10, 50, 40};
        badge.get_text = [&shop] { return std::to_string(shop.cart().size()); };
        components.register_component(std::move(badge));
    }
    {
        ComponentSpec screen;
        screen.test_id = "home-screen";
        screen.type = "Screen";
        screen.bounds = Bounds{0, 0, 400, 800};
        screen.children = {"header-title", "search-input", "add-espresso-button", "cart-badge"};
        components.register_component(std::move(screen));
    }

    bridge.flags().register_flags({{"new_checkout", false}, {"dark_mode", true}});
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? 0 : 1;
    }

    Config config;
    init_config(args, config);

    // Capture application logs for get_logs; skip the bridge's own tagged chatter
    auto log_sink = std::make_shared<LogCaptureSink>(LogCaptureSink::DEFAULT_CAPACITY, "[Bridge");
    init_logging(args, config, {log_sink});

    BridgeClientOptions options;
    options.url = args.url.empty() ? config.get<std::string>("/client/url", options.url) : args.url;
    options.identity.app_name = config.get<std::string>("/client/app_name", "devbridge-demo");
    options.identity.app_version = config.get<std::string>("/client/app_version", "1.0.0");
    options.identity.device_id = args.device_id.empty()
                                     ? config.get<std::string>("/client/device_id", "")
                                     : args.device_id;
    options.reconnect_delay_ms =
        config.get<uint32_t>("/client/reconnect_delay_ms", options.reconnect_delay_ms);
    options.connect_timeout_ms =
        config.get<uint32_t>("/client/connect_timeout_ms", options.connect_timeout_ms);
    options.log_sink = log_sink;

    DemoShop shop;
    BridgeClient bridge(options);
    register_demo(bridge, shop);

    bridge.set_state_change_callback([&bridge](ConnectionState, ConnectionState state) {
        spdlog::info("[Demo] Connection {}", connection_state_name(state));
        if (state == ConnectionState::CONNECTED) {
            bridge.emit_event("app_ready", {{"screen", "home"}});
        }
    });

    if (bridge.start() != 0) {
        spdlog::warn("[Demo] Initial connect to {} failed, retrying in the background",
                     options.url);
    }

    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
    spdlog::info("[Demo] Running as {} (Ctrl+C to quit)", bridge.identity().device_id);
    while (!g_quit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    bridge.stop();
    return 0;
}
