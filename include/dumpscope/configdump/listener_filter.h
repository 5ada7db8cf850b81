#pragma once

#include <cstdint>
#include <string>

#include "dumpscope/configdump/listener.h"

namespace dumpscope {
namespace configdump {

/**
 * @brief Address, port and type predicate over listeners
 *
 * Empty strings and port 0 mean "any". Address and type compare
 * case-insensitively; type compares against the classifier label.
 */
struct ListenerFilter {
  std::string address;
  uint32_t port = 0;
  std::string type;

  bool empty() const { return address.empty() && port == 0 && type.empty(); }

  /**
   * @brief True when the listener passes every specified check
   */
  bool verify(const Listener& listener) const;
};

}  // namespace configdump
}  // namespace dumpscope
