#include <vigil/schema/encoding/scale/alert.hpp>
#include <vigil/schema/encoding/scale/alert_type.hpp>
#include <vigil/schema/encoding/scale/risk_band.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(alert<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.transaction_id, encoder);
  encode(o.alert_types, encoder);
  encode(o.risk_score, encoder);
  encode(o.risk_band, encoder);
  encode(o.pass_id, encoder);
  encode(o.created_at, encoder);
}

void decode(alert<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.transaction_id, decoder);
  decode(o.alert_types, decoder);
  decode(o.risk_score, decoder);
  decode(o.risk_band, decoder);
  decode(o.pass_id, decoder);
  decode(o.created_at, decoder);
}

}  // namespace vigil::schema::encoding::scale
