#include <vigil/schema/encoding/scale/asset_class.hpp>
#include <vigil/schema/encoding/scale/transaction.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.asset_class, encoder);
  encode(o.source, encoder);
  encode(o.destination, encoder);
  encode(o.amount, encoder);
  encode(o.timestamp, encoder);
  encode(o.jurisdiction, encoder);
  encode(o.reviewed, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.asset_class, decoder);
  decode(o.source, decoder);
  decode(o.destination, decoder);
  decode(o.amount, decoder);
  decode(o.timestamp, decoder);
  decode(o.jurisdiction, decoder);
  decode(o.reviewed, decoder);
}

}  // namespace vigil::schema::encoding::scale
