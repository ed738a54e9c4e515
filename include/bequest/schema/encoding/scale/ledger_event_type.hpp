#pragma once
#include <bequest/schema/ledger_event_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bequest::schema::encoding::scale {

void encode(ledger_event_type_t&& o, ::scale::Encoder& encoder);
void decode(ledger_event_type_t&& o, ::scale::Decoder& decoder);

}  // namespace bequest::schema::encoding::scale
