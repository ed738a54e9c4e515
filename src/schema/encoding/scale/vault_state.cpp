#include <bequest/schema/encoding/scale/vault_state.hpp>

using namespace bequest::schema;

namespace bequest::schema::encoding::scale {

void encode(vault_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.vault_id, encoder);
  encode(o.owner, encoder);
  encode(o.beneficiary, encoder);
  encode(o.balance, encoder);
  encode(o.unlock_time, encoder);
  encode(o.created_at, encoder);
  encode(o.claimed, encoder);
  encode(o.heartbeat_enabled, encoder);
  encode(o.heartbeat_interval, encoder);
  encode(o.last_heartbeat_at, encoder);
  encode(o.note, encoder);
}

void decode(vault_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.vault_id, decoder);
  decode(o.owner, decoder);
  decode(o.beneficiary, decoder);
  decode(o.balance, decoder);
  decode(o.unlock_time, decoder);
  decode(o.created_at, decoder);
  decode(o.claimed, decoder);
  decode(o.heartbeat_enabled, decoder);
  decode(o.heartbeat_interval, decoder);
  decode(o.last_heartbeat_at, decoder);
  decode(o.note, decoder);
}

}  // namespace bequest::schema::encoding::scale
