#pragma once

#include <bequest/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace bequest::execution {

using time_source_t = std::function<bequest::schema::timestamp_milliseconds_t()>;

inline time_source_t system_time_source() {
  return [] {
    return static_cast<bequest::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace bequest::execution
