#include <bequest/schema/encoding/scale/ledger_event.hpp>
#include <bequest/schema/encoding/scale/ledger_event_type.hpp>

using namespace bequest::schema;

namespace bequest::schema::encoding::scale {

void encode(ledger_event<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(std::move(o.type), encoder);
  encode(o.vault_id, encoder);
  encode(o.actor, encoder);
  encode(o.counterparty, encoder);
  encode(o.amount, encoder);
  encode(o.token_id, encoder);
  encode(o.unlock_time, encoder);
  encode(o.detail, encoder);
  encode(o.recorded_at, encoder);
}

void decode(ledger_event<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(std::move(o.type), decoder);
  decode(o.vault_id, decoder);
  decode(o.actor, decoder);
  decode(o.counterparty, decoder);
  decode(o.amount, decoder);
  decode(o.token_id, decoder);
  decode(o.unlock_time, decoder);
  decode(o.detail, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace bequest::schema::encoding::scale
