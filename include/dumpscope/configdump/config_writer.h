/**
 * @file config_writer.h
 * @brief Listener views over a proxy config dump
 *
 * Usage:
 *   ConfigWriter writer(std::cout);
 *   auto result = writer.prime(bytes);
 *   if (is_success(result)) {
 *     result = writer.printListenerSummary(ListenerFilter{});
 *   }
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "dumpscope/configdump/config_dump.h"
#include "dumpscope/configdump/listener.h"
#include "dumpscope/configdump/listener_filter.h"
#include "dumpscope/types.h"

namespace dumpscope {
namespace configdump {

/**
 * @brief Prints listener state from a primed config dump
 *
 * Output is rendered into a buffer and reaches the stream only when every
 * stage succeeded. Not thread-safe.
 */
class ConfigWriter {
 public:
  explicit ConfigWriter(std::ostream& out) : out_(out) {}

  /**
   * @brief Load the config dump to inspect
   *
   * On failure the previously primed dump, if any, stays in place.
   */
  VoidResult prime(const std::string& bytes);

  bool isPrimed() const { return dump_ != nullptr; }

  /// Dynamic listeners first, then static ones, in dump order
  Result<std::vector<Listener>> retrieveListeners() const;

  VoidResult printListenerSummary(const ListenerFilter& filter);

  VoidResult printListenerDump(const ListenerFilter& filter);

 private:
  VoidResult commit(const std::string& text);

  std::ostream& out_;
  std::unique_ptr<ConfigDump> dump_;
};

}  // namespace configdump
}  // namespace dumpscope
