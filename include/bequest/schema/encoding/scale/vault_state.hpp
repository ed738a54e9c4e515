#pragma once
#include <bequest/schema/vault_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bequest::schema::encoding::scale {

void encode(vault_state<1>&& o, ::scale::Encoder& encoder);
void decode(vault_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace bequest::schema::encoding::scale
