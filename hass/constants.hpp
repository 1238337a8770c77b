#pragma once

namespace paramdb::hassconst
{

// Device identity and MQTT topics of the itho-wifi add-on (defaults, the
// config file may override them).
inline constexpr const char* kDeviceId = "itho_432432";
inline constexpr const char* kRootTopic = "itho_wtw";
inline constexpr const char* kStatusSuffix = "ithostatus"; // JSON telemetry
inline constexpr const char* kLwtSuffix = "lwt";           // availability
inline constexpr const char* kPayloadAvailable = "online";
inline constexpr const char* kPayloadNotAvailable = "offline";

// Separator between device id and sensor name in unique_id.
inline constexpr const char* kUniqueIdSeparator = "_";

// Home Assistant state classes.
inline constexpr const char* kStateMeasurement = "measurement";
inline constexpr const char* kStateTotal = "total";
inline constexpr const char* kStateTotalIncreasing = "total_increasing";

} // namespace paramdb::hassconst
