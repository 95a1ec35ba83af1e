#include <doctest/doctest.h>
#include <peerwire/driver/address_registry.hpp>
#include <peerwire/errors.hpp>

#include <algorithm>
#include <string>

TEST_CASE("ChannelKind wire names") {
    CHECK(std::string(peerwire::channel_kind_name(peerwire::ChannelKind::UnicastInbound)) == "unicast");
    CHECK(std::string(peerwire::channel_kind_name(peerwire::ChannelKind::BroadcastInbound)) == "broadcast");

    CHECK((peerwire::parse_channel_kind("unicast").value() == peerwire::ChannelKind::UnicastInbound));
    CHECK((peerwire::parse_channel_kind("broadcast").value() == peerwire::ChannelKind::BroadcastInbound));
    CHECK(peerwire::parse_channel_kind("7").is_err());
    CHECK(peerwire::parse_channel_kind("Unicast").is_err());
}

TEST_CASE("AddressRegistry") {
    peerwire::AddressRegistry registry("10.1.2.3");

    SUBCASE("TCP wildcard bind is advertised under the resolved host") {
        auto bound = peerwire::Address::from_tcp(peerwire::TcpEndpoint{"0.0.0.0", 40001});
        registry.record(peerwire::ChannelKind::UnicastInbound, bound);
        CHECK(registry.get(peerwire::ChannelKind::UnicastInbound).value() == "tcp://10.1.2.3:40001");
    }

    SUBCASE("IPC addresses are advertised as bound") {
        auto bound = peerwire::Address::from_ipc(peerwire::IpcEndpoint{"/tmp/x.sock"});
        registry.record(peerwire::ChannelKind::BroadcastInbound, bound);
        CHECK(registry.get(peerwire::ChannelKind::BroadcastInbound).value() == "ipc:///tmp/x.sock");
    }

    SUBCASE("Missing kind is not found") { CHECK(registry.get(peerwire::ChannelKind::UnicastInbound).is_err()); }

    SUBCASE("to_wire keys addresses by wire name") {
        registry.record(peerwire::ChannelKind::UnicastInbound,
                        peerwire::Address::from_tcp(peerwire::TcpEndpoint{"0.0.0.0", 1000}));
        registry.record(peerwire::ChannelKind::BroadcastInbound,
                        peerwire::Address::from_tcp(peerwire::TcpEndpoint{"0.0.0.0", 1001}));
        auto wire = peerwire::to_wire(registry.addresses());
        REQUIRE(wire.size() == 2);
        CHECK(wire["unicast"] == "tcp://10.1.2.3:1000");
        CHECK(wire["broadcast"] == "tcp://10.1.2.3:1001");
    }
}

TEST_CASE("resolve_local_ip returns a dotted quad") {
    auto ip = peerwire::resolve_local_ip();
    if (ip.is_ok()) {
        std::string dotted(ip.value().c_str());
        CHECK(std::count(dotted.begin(), dotted.end(), '.') == 3);
    }
}

TEST_CASE("Error kinds survive in dp::Error") {
    auto socket_type = peerwire::socket_type_error("unrecognized socket type 9.");
    CHECK((peerwire::error_kind(socket_type) == peerwire::ErrorKind::SocketType));

    auto connection = peerwire::peers_connection_error("actor", dp::Error::io_error("connect failed"));
    CHECK((peerwire::error_kind(connection) == peerwire::ErrorKind::PeersConnection));
    CHECK(std::string(connection.message.c_str()).find("actor") != std::string::npos);
    CHECK(std::string(connection.message.c_str()).find("connect failed") != std::string::npos);

    auto receive = peerwire::driver_receive_error("poll failed");
    CHECK((peerwire::error_kind(receive) == peerwire::ErrorKind::DriverReceive));

    auto send = peerwire::driver_send_error("write timeout", true);
    CHECK((peerwire::error_kind(send) == peerwire::ErrorKind::DriverSend));
    CHECK(send.code == dp::Error::TIMEOUT);

    CHECK((peerwire::error_kind(dp::Error::io_error("plain")) == peerwire::ErrorKind::None));
    CHECK((peerwire::error_kind(dp::Error::io_error("DriverSendError")) == peerwire::ErrorKind::None));
}
