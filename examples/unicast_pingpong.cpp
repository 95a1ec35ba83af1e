/// Example: two drivers exchanging direct messages over TCP
/// "learner" sends numbered pings, "actor" replies with pongs carrying the same number

#include <peerwire/peerwire.hpp>

#include <thread>

constexpr int ROUNDS = 5;

int main() {
    peerwire::DriverConfig config;
    config.host = "127.0.0.1";
    config.receive_timeout_ms = 500;

    auto learner_res = peerwire::Driver::create(config, peerwire::echo_logger());
    auto actor_res = peerwire::Driver::create(config, peerwire::echo_logger());
    if (learner_res.is_err() || actor_res.is_err()) {
        echo::error("Failed to create drivers");
        return 1;
    }
    auto learner = std::move(learner_res.value());
    auto actor = std::move(actor_res.value());

    // Address exchange normally happens through a discovery service
    peerwire::PeersAddressMap learner_peers;
    learner_peers["actor"] = peerwire::to_wire(actor->address());
    peerwire::PeersAddressMap actor_peers;
    actor_peers["learner"] = peerwire::to_wire(learner->address());

    if (learner->connect(learner_peers).is_err() || actor->connect(actor_peers).is_err()) {
        echo::error("Failed to connect drivers");
        return 1;
    }

    std::thread actor_thread([&actor]() {
        auto res = actor->receive([&actor](const peerwire::Message &request) {
            auto round = peerwire::payload_as<dp::i32>(request);
            if (round.is_err()) {
                return true;
            }
            echo::info("actor got ping ", round.value(), " from ", request.source);
            auto reply = peerwire::make_message<dp::i32>("actor", request.source, "pong", round.value());
            auto send_res = actor->send(reply);
            if (send_res.is_err()) {
                echo::error("reply failed: ", send_res.error().message.c_str());
            }
            return round.value() < ROUNDS - 1;
        });
        if (res.is_err()) {
            echo::error("actor receive failed: ", res.error().message.c_str());
        }
    });

    for (dp::i32 round = 0; round < ROUNDS; ++round) {
        auto send_res = learner->send(peerwire::make_message<dp::i32>("learner", "actor", "ping", round));
        if (send_res.is_err()) {
            echo::error("ping failed: ", send_res.error().message.c_str());
            break;
        }

        auto reply = learner->receive_one();
        if (reply.is_err()) {
            echo::error("no pong: ", reply.error().message.c_str());
            break;
        }
        echo::info("learner got ", reply.value().tag, " ", peerwire::payload_as<dp::i32>(reply.value()).value());
    }

    actor_thread.join();

    auto &metrics = learner->metrics();
    echo::info("learner sent ", metrics.total_sent(), " and received ", metrics.total_received(), " messages");
    return 0;
}
