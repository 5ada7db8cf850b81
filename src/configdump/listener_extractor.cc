#define DUMPSCOPE_LOG_COMPONENT "config_dump.listener"

#include "dumpscope/configdump/listener_extractor.h"

#include "dumpscope/logging/log_macros.h"

namespace dumpscope {
namespace configdump {

namespace {

bool present(const json::JsonValue& j, const std::string& key) {
  return j.contains(key) && !j[key].isNull();
}

std::string entryField(const char* list, size_t index) {
  return std::string(list) + "[" + std::to_string(index) + "]";
}

// Listener payload of a dynamic entry; nullptr while the listener is still
// warming or draining
const json::JsonValue* dynamicPayload(const json::JsonValue& entry,
                                      const std::string& field) {
  if (entry.isNull()) {
    return nullptr;
  }
  if (!entry.isObject()) {
    throw ListenerDecodeError(field, "expected an object");
  }
  if (!present(entry, "active_state")) {
    return nullptr;
  }
  const auto& state = entry["active_state"];
  if (!state.isObject()) {
    throw ListenerDecodeError(field + ".active_state", "expected an object");
  }
  return present(state, "listener") ? &state["listener"] : nullptr;
}

const json::JsonValue* staticPayload(const json::JsonValue& entry,
                                     const std::string& field) {
  if (entry.isNull()) {
    return nullptr;
  }
  if (!entry.isObject()) {
    throw ListenerDecodeError(field, "expected an object");
  }
  return present(entry, "listener") ? &entry["listener"] : nullptr;
}

Listener decodePayload(json::JsonValue payload) {
  normalizeListenerTypeUrl(payload);
  return Listener::fromJson(payload);
}

}  // namespace

void normalizeListenerTypeUrl(json::JsonValue& payload) {
  if (!payload.isObject()) {
    return;
  }
  payload.set(kTypeUrlKey, json::JsonValue(kListenerTypeUrl));
}

Result<std::vector<Listener>> extractListeners(const ConfigDump* dump) {
  if (dump == nullptr) {
    return makeError<std::vector<Listener>>(
        ErrorCode::NotPrimed, "config writer has not been primed");
  }

  auto section_result = dump->listenerConfigDump();
  if (is_error(section_result)) {
    return makeError<std::vector<Listener>>(
        ErrorCode::RetrievalFailure,
        "listener dump: " + get_error(section_result)->message);
  }
  const ListenersConfigDump& section = *get_value(section_result);

  const auto& dynamic_listeners = section.dynamicListeners();
  const auto& static_listeners = section.staticListeners();
  DUMPSCOPE_LOG(Debug, "listeners section: {} dynamic, {} static",
                dynamic_listeners.size(), static_listeners.size());

  std::vector<Listener> listeners;
  try {
    for (size_t i = 0; i < dynamic_listeners.size(); ++i) {
      const auto* payload = dynamicPayload(
          dynamic_listeners[i], entryField("dynamic_listeners", i));
      if (payload) {
        listeners.push_back(decodePayload(*payload));
      }
    }

    for (size_t i = 0; i < static_listeners.size(); ++i) {
      const auto* payload = staticPayload(
          static_listeners[i], entryField("static_listeners", i));
      if (payload) {
        listeners.push_back(decodePayload(*payload));
      }
    }
  } catch (const ListenerDecodeError& e) {
    DUMPSCOPE_LOG(Debug, "failed to decode listener: {}", e.what());
    return makeError<std::vector<Listener>>(
        ErrorCode::DecodeFailure,
        std::string("unmarshal listener: ") + e.what());
  }

  if (listeners.empty()) {
    return makeError<std::vector<Listener>>(ErrorCode::EmptyResult,
                                            "no listeners found");
  }

  DUMPSCOPE_LOG(Debug, "decoded {} listeners", listeners.size());
  return makeSuccess(std::move(listeners));
}

}  // namespace configdump
}  // namespace dumpscope
