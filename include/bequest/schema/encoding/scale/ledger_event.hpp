#pragma once
#include <bequest/schema/ledger_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bequest::schema::encoding::scale {

void encode(ledger_event<1>&& o, ::scale::Encoder& encoder);
void decode(ledger_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace bequest::schema::encoding::scale
