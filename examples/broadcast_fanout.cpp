/// Example: one publisher, several subscribers
/// Drivers talk over Unix domain sockets; every subscriber receives each broadcast

#include <peerwire/peerwire.hpp>

#include <thread>
#include <vector>

constexpr int SUBSCRIBERS = 3;
constexpr int UPDATES = 4;

int main() {
    peerwire::DriverConfig config;
    config.protocol = "ipc";
    config.host = "127.0.0.1";

    auto publisher_res = peerwire::Driver::create(config, peerwire::echo_logger());
    if (publisher_res.is_err()) {
        echo::error("Failed to create publisher: ", publisher_res.error().message.c_str());
        return 1;
    }
    auto publisher = std::move(publisher_res.value());

    std::vector<std::unique_ptr<peerwire::Driver>> subscribers;
    peerwire::PeersAddressMap peers;
    for (int i = 0; i < SUBSCRIBERS; ++i) {
        auto res = peerwire::Driver::create(config);
        if (res.is_err()) {
            echo::error("Failed to create subscriber: ", res.error().message.c_str());
            return 1;
        }
        // Only the broadcast address: the publisher never sends to them directly
        peerwire::WireAddressMap wire;
        wire["broadcast"] = res.value()->address().at(peerwire::ChannelKind::BroadcastInbound);
        peers[dp::String(("worker-" + std::to_string(i)).c_str())] = wire;
        subscribers.push_back(std::move(res.value()));
    }

    auto connect_res = publisher->connect(peers);
    if (connect_res.is_err()) {
        echo::error("connect failed: ", connect_res.error().message.c_str());
        return 1;
    }
    echo::info("publisher has ", publisher->subscriber_count(), " subscribers");

    std::vector<std::thread> threads;
    for (int i = 0; i < SUBSCRIBERS; ++i) {
        threads.emplace_back([i, &subscribers]() {
            int seen = 0;
            auto res = subscribers[i]->receive([i, &seen](const peerwire::Message &update) {
                echo::info("worker-", i, " received ", update.tag, ": ",
                           peerwire::payload_as<std::string>(update).value());
                return ++seen < UPDATES;
            });
            if (res.is_err()) {
                echo::error("worker-", i, " receive failed: ", res.error().message.c_str());
            }
        });
    }

    for (int update = 0; update < UPDATES; ++update) {
        auto message = peerwire::make_message<std::string>("publisher", "", "params",
                                                           "version " + std::to_string(update));
        auto res = publisher->broadcast(message);
        if (res.is_err()) {
            echo::warn("broadcast failed: ", res.error().message.c_str());
        }
    }

    for (auto &thread : threads) {
        thread.join();
    }
    return 0;
}
