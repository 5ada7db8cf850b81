/**
 * @file listener.h
 * @brief Decoded listener records taken from a proxy config dump
 *
 * A listener payload in the dump is a type-tagged JSON object. Decoding
 * extracts the fields the inspector reasons about (bound socket address and
 * the named filters of every filter chain) and keeps the complete object for
 * full-fidelity output.
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "dumpscope/json/json_bridge.h"

namespace dumpscope {
namespace configdump {

/// Key carrying the type tag of an embedded payload
constexpr char kTypeUrlKey[] = "@type";

/// Canonical (v3) listener type
constexpr char kListenerTypeUrl[] =
    "type.googleapis.com/envoy.config.listener.v3.Listener";

/// Legacy (v2) listener type, wire-compatible with the v3 one
constexpr char kListenerTypeUrlV2[] = "type.googleapis.com/envoy.api.v2.Listener";

/**
 * @brief Listener payload decode failure
 *
 * Carries the dotted path of the offending field relative to the listener.
 */
class ListenerDecodeError : public std::runtime_error {
 public:
  ListenerDecodeError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    std::ostringstream oss;
    oss << "field '" << field << "': " << reason;
    return oss.str();
  }

  std::string field_;
  std::string reason_;
};

/**
 * @brief Bound socket address of a listener
 *
 * Listeners bound to a pipe have no socket address; both fields stay empty.
 */
struct SocketAddress {
  std::string address;
  uint32_t port_value = 0;

  static SocketAddress fromJson(const json::JsonValue& j);

  bool operator==(const SocketAddress& other) const {
    return address == other.address && port_value == other.port_value;
  }
};

/**
 * @brief Named network filter with its opaque configuration
 */
struct Filter {
  /// Protocol handler identifier ("envoy.tcp_proxy", ...)
  std::string name;

  /// Type-tagged configuration; legacy dumps carry an untyped "config"
  json::JsonValue typed_config;

  /**
   * @brief Textual form of the configuration payload
   *
   * Empty when the filter carries no configuration.
   */
  std::string configText() const;

  static Filter fromJson(const json::JsonValue& j);
};

struct FilterChain {
  std::vector<Filter> filters;

  static FilterChain fromJson(const json::JsonValue& j);
};

/**
 * @brief Decoded listener
 */
struct Listener {
  std::string name;

  /// address.socket_address
  SocketAddress address;

  std::vector<FilterChain> filter_chains;

  /// Complete listener object as found in the dump, without its type tag
  json::JsonValue raw = json::JsonValue::object();

  const std::string& boundAddress() const { return address.address; }
  uint32_t boundPort() const { return address.port_value; }

  /**
   * @brief Full representation for structured output
   */
  const json::JsonValue& toJson() const { return raw; }

  /**
   * @brief Decode a listener payload
   *
   * The payload must be an object whose type tag, if present, is the
   * canonical listener type.
   * @throws ListenerDecodeError on any structural mismatch
   */
  static Listener fromJson(const json::JsonValue& j);
};

}  // namespace configdump
}  // namespace dumpscope
