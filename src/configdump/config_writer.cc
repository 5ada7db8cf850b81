#define DUMPSCOPE_LOG_COMPONENT "config_dump.writer"

#include "dumpscope/configdump/config_writer.h"

#include <sstream>

#include "dumpscope/configdump/listener_extractor.h"
#include "dumpscope/configdump/listener_renderer.h"
#include "dumpscope/logging/log_macros.h"

namespace dumpscope {
namespace configdump {

VoidResult ConfigWriter::prime(const std::string& bytes) {
  auto result = ConfigDump::parse(bytes);
  if (is_error(result)) {
    DUMPSCOPE_LOG(Warning, "rejected config dump: {}",
                  get_error(result)->message);
    return makeVoidError(*get_error(result));
  }

  dump_ = std::make_unique<ConfigDump>(std::move(*get_value(result)));
  DUMPSCOPE_LOG(Debug, "primed with {} byte config dump", bytes.size());
  return makeVoidSuccess();
}

Result<std::vector<Listener>> ConfigWriter::retrieveListeners() const {
  return extractListeners(dump_.get());
}

VoidResult ConfigWriter::printListenerSummary(const ListenerFilter& filter) {
  auto listeners = retrieveListeners();
  if (is_error(listeners)) {
    return makeVoidError(*get_error(listeners));
  }

  std::ostringstream buffer;
  auto result = renderListenerSummary(*get_value(listeners), filter, buffer);
  if (is_error(result)) {
    return result;
  }
  return commit(buffer.str());
}

VoidResult ConfigWriter::printListenerDump(const ListenerFilter& filter) {
  auto listeners = retrieveListeners();
  if (is_error(listeners)) {
    return makeVoidError(*get_error(listeners));
  }

  std::ostringstream buffer;
  auto result = renderListenerDump(*get_value(listeners), filter, buffer);
  if (is_error(result)) {
    return result;
  }
  return commit(buffer.str());
}

VoidResult ConfigWriter::commit(const std::string& text) {
  out_ << text;
  out_.flush();
  if (!out_) {
    return makeVoidError(
        Error(ErrorCode::RenderFailure, "failed to write output"));
  }
  return makeVoidSuccess();
}

}  // namespace configdump
}  // namespace dumpscope
