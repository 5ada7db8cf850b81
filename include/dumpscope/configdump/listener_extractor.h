#pragma once

#include <vector>

#include "dumpscope/configdump/config_dump.h"
#include "dumpscope/configdump/listener.h"
#include "dumpscope/types.h"

namespace dumpscope {
namespace configdump {

/**
 * @brief Rewrite the type tag of a listener payload to the canonical type
 *
 * v2 and v3 listener payloads share one wire layout, so the tag is all that
 * differs. Non-object payloads are left alone for the decoder to reject.
 */
void normalizeListenerTypeUrl(json::JsonValue& payload);

/**
 * @brief Decode every listener of a config dump
 *
 * Dynamic listeners with an active state come first, then static listeners,
 * each in dump order. Entries without a listener payload (warming,
 * draining, null) are skipped. An entry that is not an object, or whose
 * active_state is not an object, fails like a payload that does not decode,
 * and the first such failure aborts the extraction.
 *
 * @param dump Parsed dump, or nullptr when none was supplied
 * @return Listeners, or NotPrimed / RetrievalFailure / DecodeFailure /
 *         EmptyResult
 */
Result<std::vector<Listener>> extractListeners(const ConfigDump* dump);

}  // namespace configdump
}  // namespace dumpscope
