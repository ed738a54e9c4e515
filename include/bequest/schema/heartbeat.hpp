#pragma once
#include <bequest/schema/primitives.hpp>

// Schema constants: heartbeat.
// Custody workflow: Bounds on the proof-of-life interval an owner may set.
namespace bequest::schema {

inline constexpr auto kMinHeartbeatInterval =
    duration_milliseconds_t{30 * kMillisecondsPerDay};
inline constexpr auto kMaxHeartbeatInterval =
    duration_milliseconds_t{365 * kMillisecondsPerDay};

}  // namespace bequest::schema
