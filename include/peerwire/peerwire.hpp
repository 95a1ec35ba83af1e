#pragma once

// Peerwire - peer-to-peer messaging driver
// Unicast delivery to one named peer and broadcast delivery to every subscriber,
// over TCP or Unix domain socket streams

// Core types and utilities
#include <peerwire/common.hpp>
#include <peerwire/endpoint.hpp>
#include <peerwire/errors.hpp>

// Transports
#include <peerwire/stream.hpp>
#include <peerwire/transport.hpp>

// Messages
#include <peerwire/message.hpp>
#include <peerwire/serialization.hpp>

// Driver
#include <peerwire/driver/address_registry.hpp>
#include <peerwire/driver/channel.hpp>
#include <peerwire/driver/config.hpp>
#include <peerwire/driver/driver.hpp>
#include <peerwire/driver/multiplexer.hpp>
#include <peerwire/logger.hpp>
#include <peerwire/metrics.hpp>

// All types are in the peerwire:: namespace
//   - peerwire::Driver, DriverConfig, Message
//   - peerwire::TcpStream, IpcStream (Stream base class)
//   - peerwire::ChannelKind, AddressMap, PeersAddressMap
//   - peerwire::ErrorKind, error_kind()
