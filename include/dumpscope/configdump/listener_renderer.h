#pragma once

#include <cstddef>
#include <ostream>
#include <vector>

#include "dumpscope/configdump/listener.h"
#include "dumpscope/configdump/listener_filter.h"
#include "dumpscope/types.h"

namespace dumpscope {
namespace configdump {

// Summary table layout
constexpr size_t kSummaryMinWidth = 0;
constexpr size_t kSummaryTabWidth = 8;
constexpr size_t kSummaryPadding = 5;
constexpr char kSummaryPadChar = ' ';

/**
 * @brief Write an aligned ADDRESS / PORT / TYPE table of matching listeners
 *
 * Rows keep the order of @p listeners. Fails with RenderFailure when @p out
 * cannot be flushed.
 */
VoidResult renderListenerSummary(const std::vector<Listener>& listeners,
                                 const ListenerFilter& filter,
                                 std::ostream& out);

/**
 * @brief Write matching listeners as a 4-space indented JSON array
 *
 * Nothing is written when serialization fails.
 */
VoidResult renderListenerDump(const std::vector<Listener>& listeners,
                              const ListenerFilter& filter,
                              std::ostream& out);

}  // namespace configdump
}  // namespace dumpscope
