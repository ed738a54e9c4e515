#include <bequest/schema/encoding/scale/ledger_event_type.hpp>

using namespace bequest::schema;

namespace bequest::schema::encoding::scale {

void encode(ledger_event_type_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint16_t>(o), encoder);
}

void decode(ledger_event_type_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint16_t{};
  decode(raw, decoder);
  o = static_cast<ledger_event_type_t>(raw);
}

}  // namespace bequest::schema::encoding::scale
