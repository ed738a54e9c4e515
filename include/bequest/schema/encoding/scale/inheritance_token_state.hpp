#pragma once
#include <bequest/schema/inheritance_token_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bequest::schema::encoding::scale {

void encode(inheritance_token_state<1>&& o, ::scale::Encoder& encoder);
void decode(inheritance_token_state<1>&& o, ::scale::Decoder& decoder);

}  // namespace bequest::schema::encoding::scale
