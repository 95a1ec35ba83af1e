#include <peerwire/peerwire.hpp>

int main() {
    echo::info("Peerwire library loaded successfully!");
    echo::info("Channels per driver:");
    echo::info("  Inbound: unicast receiver, broadcast receiver");
    echo::info("  Outbound: one unicast sender per peer, one broadcast sender");
    echo::info("Transports: tcp, ipc");
    echo::info("");
    echo::info("See examples/unicast_pingpong.cpp and broadcast_fanout.cpp for usage");
    return 0;
}
