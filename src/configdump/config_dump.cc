#include "dumpscope/configdump/config_dump.h"

#include "dumpscope/configdump/listener.h"

namespace dumpscope {
namespace configdump {

namespace {

bool isListenersSection(const json::JsonValue& section) {
  if (!section.isObject() || !section.contains(kTypeUrlKey)) {
    return false;
  }
  const std::string type_url = section[kTypeUrlKey].getString("");
  return type_url == kListenersConfigDumpType ||
         type_url == kListenersConfigDumpTypeV2;
}

// Missing or null lists read as empty
Result<json::JsonValue> listenerList(const json::JsonValue& section,
                                     const std::string& key) {
  if (!section.contains(key) || section[key].isNull()) {
    return makeSuccess(json::JsonValue::array());
  }
  const auto& list = section[key];
  if (!list.isArray()) {
    return makeError<json::JsonValue>(ErrorCode::RetrievalFailure,
                                      key + " is not an array");
  }
  return makeSuccess(json::JsonValue(list));
}

}  // namespace

Result<ConfigDump> ConfigDump::parse(const std::string& bytes) {
  json::JsonValue document;
  try {
    document = json::JsonValue::parse(bytes);
  } catch (const json::JsonException& e) {
    return makeError<ConfigDump>(ErrorCode::InvalidDump,
                                 std::string("invalid config dump: ") +
                                     e.what());
  }

  if (!document.isObject()) {
    return makeError<ConfigDump>(ErrorCode::InvalidDump,
                                 "invalid config dump: expected an object");
  }

  return makeSuccess(ConfigDump(std::move(document)));
}

Result<ListenersConfigDump> ConfigDump::listenerConfigDump() const {
  if (!document_.contains("configs") || !document_["configs"].isArray()) {
    return makeError<ListenersConfigDump>(ErrorCode::RetrievalFailure,
                                          "configs is not an array");
  }

  const auto& configs = document_["configs"];
  for (size_t i = 0; i < configs.size(); ++i) {
    const auto& section = configs[i];
    if (!isListenersSection(section)) {
      continue;
    }

    auto dynamic_result = listenerList(section, "dynamic_listeners");
    if (is_error(dynamic_result)) {
      return Result<ListenersConfigDump>(*get_error(dynamic_result));
    }
    auto static_result = listenerList(section, "static_listeners");
    if (is_error(static_result)) {
      return Result<ListenersConfigDump>(*get_error(static_result));
    }

    return makeSuccess(
        ListenersConfigDump(std::move(*get_value(dynamic_result)),
                            std::move(*get_value(static_result))));
  }

  return makeError<ListenersConfigDump>(ErrorCode::RetrievalFailure,
                                        "config dump has no listeners section");
}

}  // namespace configdump
}  // namespace dumpscope
