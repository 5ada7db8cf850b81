#include "dumpscope/configdump/listener_filter.h"

#include <algorithm>
#include <cctype>

#include "dumpscope/configdump/listener_classifier.h"

namespace dumpscope {
namespace configdump {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

}  // namespace

bool ListenerFilter::verify(const Listener& listener) const {
  // Unset filter: skip classification entirely
  if (empty()) {
    return true;
  }
  if (!address.empty() && !equalsIgnoreCase(listener.boundAddress(), address)) {
    return false;
  }
  if (port != 0 && listener.boundPort() != port) {
    return false;
  }
  if (!type.empty() && !equalsIgnoreCase(retrieveListenerType(listener), type)) {
    return false;
  }
  return true;
}

}  // namespace configdump
}  // namespace dumpscope
