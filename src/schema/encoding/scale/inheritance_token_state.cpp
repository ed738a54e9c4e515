#include <bequest/schema/encoding/scale/inheritance_token_state.hpp>

using namespace bequest::schema;

namespace bequest::schema::encoding::scale {

void encode(inheritance_token_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.token_id, encoder);
  encode(o.vault_id, encoder);
  encode(o.beneficiary, encoder);
  encode(o.active, encoder);
  encode(o.minted_at, encoder);
}

void decode(inheritance_token_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.token_id, decoder);
  decode(o.vault_id, decoder);
  decode(o.beneficiary, decoder);
  decode(o.active, decoder);
  decode(o.minted_at, decoder);
}

}  // namespace bequest::schema::encoding::scale
