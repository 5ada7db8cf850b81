#define DUMPSCOPE_LOG_COMPONENT "config_dump.render"

#include "dumpscope/configdump/listener_renderer.h"

#include <string>

#include "dumpscope/configdump/listener_classifier.h"
#include "dumpscope/configdump/tab_writer.h"
#include "dumpscope/logging/log_macros.h"

namespace dumpscope {
namespace configdump {

VoidResult renderListenerSummary(const std::vector<Listener>& listeners,
                                 const ListenerFilter& filter,
                                 std::ostream& out) {
  TabWriter w(out, kSummaryMinWidth, kSummaryTabWidth, kSummaryPadding,
              kSummaryPadChar);

  w.write("ADDRESS\tPORT\tTYPE\n");

  size_t rows = 0;
  for (const auto& listener : listeners) {
    if (!filter.verify(listener)) {
      continue;
    }
    w.write(listener.boundAddress() + "\t" +
            std::to_string(listener.boundPort()) + "\t" +
            retrieveListenerType(listener) + "\n");
    ++rows;
  }

  if (!w.flush()) {
    return makeVoidError(
        Error(ErrorCode::RenderFailure, "failed to flush listener summary"));
  }

  DUMPSCOPE_LOG(Debug, "rendered {} of {} listeners", rows, listeners.size());
  return makeVoidSuccess();
}

VoidResult renderListenerDump(const std::vector<Listener>& listeners,
                              const ListenerFilter& filter,
                              std::ostream& out) {
  json::JsonValue array = json::JsonValue::array();
  for (const auto& listener : listeners) {
    if (filter.verify(listener)) {
      array.push_back(listener.toJson());
    }
  }

  std::string text;
  try {
    text = array.dump(4);
  } catch (const json::JsonException& e) {
    return makeVoidError(
        Error(ErrorCode::RenderFailure,
              std::string("failed to marshal listeners: ") + e.what()));
  }

  out << text << '\n';
  out.flush();
  if (!out) {
    return makeVoidError(
        Error(ErrorCode::RenderFailure, "failed to flush listener dump"));
  }

  DUMPSCOPE_LOG(Debug, "rendered {} of {} listeners", array.size(),
                listeners.size());
  return makeVoidSuccess();
}

}  // namespace configdump
}  // namespace dumpscope
