#include "dumpscope/configdump/listener_classifier.h"

namespace dumpscope {
namespace configdump {

const char* listenerTypeToString(ListenerType type) {
  switch (type) {
    case ListenerType::Http: return "HTTP";
    case ListenerType::Tcp: return "TCP";
    case ListenerType::HttpAndTcp: return "HTTP+TCP";
    case ListenerType::Unknown: return "UNKNOWN";
    default: return "UNKNOWN";
  }
}

ListenerType classifyListener(const Listener& listener) {
  size_t http_count = 0;
  size_t tcp_count = 0;

  for (const auto& chain : listener.filter_chains) {
    for (const auto& filter : chain.filters) {
      if (filter.name == kHttpListenerFilter) {
        ++http_count;
      } else if (filter.name == kTcpListenerFilter) {
        if (filter.configText().find(kBlackHoleCluster) == std::string::npos) {
          ++tcp_count;
        }
      }
    }
  }

  if (http_count > 0) {
    return tcp_count == 0 ? ListenerType::Http : ListenerType::HttpAndTcp;
  }
  if (tcp_count > 0) {
    return ListenerType::Tcp;
  }
  return ListenerType::Unknown;
}

std::string retrieveListenerType(const Listener& listener) {
  return listenerTypeToString(classifyListener(listener));
}

}  // namespace configdump
}  // namespace dumpscope
