#ifndef __BURROW_EVENT_JSON__
#define __BURROW_EVENT_JSON__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace burrow {
/**
 * @brief Wire form of an event:
 * `{"type":"event","event":<tag>,"data":{camelCase fields}}`.
 *
 * Tags are Started, Result, Finished (search) and Output, Exit (sessions).
 */
json eventToJson(const Event& event);

json volumeToJson(const VolumeInfo& volume);

string exitReasonName(PtyExitReason reason);

string driveTypeName(DriveType driveType);
}  // namespace burrow

#endif  // __BURROW_EVENT_JSON__
