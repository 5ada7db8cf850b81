/**
 * @file config_dump.h
 * @brief Proxy admin config dump document
 *
 * A config dump is an object whose "configs" array holds one type-tagged
 * section per resource kind. Only the listeners section is interpreted here.
 */

#pragma once

#include <string>
#include <utility>

#include "dumpscope/json/json_bridge.h"
#include "dumpscope/types.h"

namespace dumpscope {
namespace configdump {

constexpr char kListenersConfigDumpType[] =
    "type.googleapis.com/envoy.admin.v3.ListenersConfigDump";

constexpr char kListenersConfigDumpTypeV2[] =
    "type.googleapis.com/envoy.admin.v2alpha.ListenersConfigDump";

/**
 * @brief Listeners section of a config dump
 *
 * Dynamic entries wrap their payload as {"active_state": {"listener": ...}},
 * static entries as {"listener": ...}. Absent lists read as empty arrays.
 */
class ListenersConfigDump {
 public:
  ListenersConfigDump(json::JsonValue dynamic_listeners,
                      json::JsonValue static_listeners)
      : dynamic_listeners_(std::move(dynamic_listeners)),
        static_listeners_(std::move(static_listeners)) {}

  const json::JsonValue& dynamicListeners() const { return dynamic_listeners_; }
  const json::JsonValue& staticListeners() const { return static_listeners_; }

 private:
  json::JsonValue dynamic_listeners_;
  json::JsonValue static_listeners_;
};

class ConfigDump {
 public:
  explicit ConfigDump(json::JsonValue document)
      : document_(std::move(document)) {}

  /**
   * @brief Parse raw dump bytes
   *
   * Fails with InvalidDump unless the bytes hold a JSON object.
   */
  static Result<ConfigDump> parse(const std::string& bytes);

  /**
   * @brief Locate the listeners section
   *
   * Either listeners-section type tag is accepted. Fails with
   * RetrievalFailure when "configs" is not an array, when no section carries
   * the tag, or when a listener list is not an array.
   */
  Result<ListenersConfigDump> listenerConfigDump() const;

  const json::JsonValue& document() const { return document_; }

 private:
  json::JsonValue document_;
};

}  // namespace configdump
}  // namespace dumpscope
