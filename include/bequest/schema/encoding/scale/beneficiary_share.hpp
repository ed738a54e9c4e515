#pragma once
#include <bequest/schema/beneficiary_share.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace bequest::schema::encoding::scale {

void encode(beneficiary_share<1>&& o, ::scale::Encoder& encoder);
void decode(beneficiary_share<1>&& o, ::scale::Decoder& decoder);

}  // namespace bequest::schema::encoding::scale
