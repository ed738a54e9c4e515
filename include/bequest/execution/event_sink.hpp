#pragma once

#include <bequest/schema/ledger_event.hpp>
#include <functional>

namespace bequest::execution {

using event_sink_t =
    std::function<void(const bequest::schema::ledger_event_t& event)>;

}  // namespace bequest::execution
