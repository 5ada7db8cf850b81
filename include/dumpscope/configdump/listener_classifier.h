#pragma once

#include <string>

#include "dumpscope/configdump/listener.h"

namespace dumpscope {
namespace configdump {

/// Marks a listener as HTTP by the presence of an HTTP connection manager
constexpr char kHttpListenerFilter[] = "envoy.http_connection_manager";

/// Marks a listener as TCP by the presence of a TCP proxy filter
constexpr char kTcpListenerFilter[] = "envoy.tcp_proxy";

/// Fallback cluster the control plane injects when no route matches. A TCP
/// proxy pointing at it is not user traffic.
constexpr char kBlackHoleCluster[] = "BlackHoleCluster";

enum class ListenerType { Http, Tcp, HttpAndTcp, Unknown };

/**
 * @brief Label used in summaries and type filters
 *
 * One of "HTTP", "TCP", "HTTP+TCP" or "UNKNOWN".
 */
const char* listenerTypeToString(ListenerType type);

/**
 * @brief Derive the effective protocol of a listener from its filters
 *
 * Only the HTTP connection manager and TCP proxy filters are recognized;
 * filters with any other name are ignored, so unrecognized protocols
 * classify as Unknown.
 */
ListenerType classifyListener(const Listener& listener);

/**
 * @brief Shorthand for listenerTypeToString(classifyListener(listener))
 */
std::string retrieveListenerType(const Listener& listener);

}  // namespace configdump
}  // namespace dumpscope
