#include "dumpscope/configdump/listener.h"

#include <limits>

namespace dumpscope {
namespace configdump {

namespace {

bool present(const json::JsonValue& j, const std::string& key) {
  return j.contains(key) && !j[key].isNull();
}

std::string readString(const json::JsonValue& j,
                       const std::string& key,
                       const std::string& field) {
  const auto& value = j[key];
  if (!value.isString()) {
    throw ListenerDecodeError(field, "expected a string");
  }
  return value.getString();
}

}  // namespace

SocketAddress SocketAddress::fromJson(const json::JsonValue& j) {
  SocketAddress addr;

  if (!j.isObject()) {
    throw ListenerDecodeError("socket_address", "expected an object");
  }

  if (present(j, "address")) {
    addr.address = readString(j, "address", "socket_address.address");
  }

  if (present(j, "port_value")) {
    const auto& port = j["port_value"];
    if (!port.isInteger()) {
      throw ListenerDecodeError("socket_address.port_value",
                                "expected an integer");
    }
    const int64_t value = port.getInt64();
    if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
      throw ListenerDecodeError("socket_address.port_value",
                                "out of range: " + std::to_string(value));
    }
    addr.port_value = static_cast<uint32_t>(value);
  }

  return addr;
}

std::string Filter::configText() const {
  if (typed_config.isNull()) {
    return std::string();
  }
  return typed_config.dump(-1, false);
}

Filter Filter::fromJson(const json::JsonValue& j) {
  Filter filter;

  if (!j.isObject()) {
    throw ListenerDecodeError("filter", "expected an object");
  }

  if (present(j, "name")) {
    filter.name = readString(j, "name", "name");
  }

  if (present(j, "typed_config")) {
    filter.typed_config = j["typed_config"];
  } else if (present(j, "config")) {
    filter.typed_config = j["config"];
  }

  return filter;
}

FilterChain FilterChain::fromJson(const json::JsonValue& j) {
  FilterChain chain;

  if (!j.isObject()) {
    throw ListenerDecodeError("filter_chain", "expected an object");
  }

  if (!present(j, "filters")) {
    return chain;
  }

  const auto& filters = j["filters"];
  if (!filters.isArray()) {
    throw ListenerDecodeError("filters", "expected an array");
  }

  for (size_t i = 0; i < filters.size(); ++i) {
    try {
      chain.filters.push_back(Filter::fromJson(filters[i]));
    } catch (const ListenerDecodeError& e) {
      throw ListenerDecodeError(
          "filters[" + std::to_string(i) + "]." + e.field(), e.reason());
    }
  }

  return chain;
}

Listener Listener::fromJson(const json::JsonValue& j) {
  Listener listener;

  if (!j.isObject()) {
    throw ListenerDecodeError("listener", "expected an object");
  }

  if (j.contains(kTypeUrlKey)) {
    const std::string type_url =
        readString(j, kTypeUrlKey, std::string("listener.") + kTypeUrlKey);
    if (type_url != kListenerTypeUrl) {
      throw ListenerDecodeError(std::string("listener.") + kTypeUrlKey,
                                "unexpected type " + type_url);
    }
  }

  if (present(j, "name")) {
    listener.name = readString(j, "name", "listener.name");
  }

  if (present(j, "address")) {
    const auto& address = j["address"];
    if (!address.isObject()) {
      throw ListenerDecodeError("listener.address", "expected an object");
    }
    if (present(address, "socket_address")) {
      try {
        listener.address = SocketAddress::fromJson(address["socket_address"]);
      } catch (const ListenerDecodeError& e) {
        throw ListenerDecodeError("listener.address." + e.field(),
                                  e.reason());
      }
    }
  }

  if (present(j, "filter_chains")) {
    const auto& chains = j["filter_chains"];
    if (!chains.isArray()) {
      throw ListenerDecodeError("listener.filter_chains", "expected an array");
    }
    for (size_t i = 0; i < chains.size(); ++i) {
      try {
        listener.filter_chains.push_back(FilterChain::fromJson(chains[i]));
      } catch (const ListenerDecodeError& e) {
        throw ListenerDecodeError(
            "listener.filter_chains[" + std::to_string(i) + "]." + e.field(),
            e.reason());
      }
    }
  }

  listener.raw = j;
  if (listener.raw.contains(kTypeUrlKey)) {
    listener.raw.erase(kTypeUrlKey);
  }

  return listener;
}

}  // namespace configdump
}  // namespace dumpscope
