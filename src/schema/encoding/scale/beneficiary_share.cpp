#include <bequest/schema/encoding/scale/beneficiary_share.hpp>

using namespace bequest::schema;

namespace bequest::schema::encoding::scale {

void encode(beneficiary_share<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
  encode(o.beneficiary, encoder);
  encode(o.percentage, encoder);
}

void decode(beneficiary_share<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
  decode(o.beneficiary, decoder);
  decode(o.percentage, decoder);
}

}  // namespace bequest::schema::encoding::scale
