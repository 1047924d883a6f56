#pragma once

#include <vigil/schema/transaction.hpp>
#include <scale/scale.hpp>

namespace vigil::schema::encoding::scale {

void encode(vigil::schema::transaction<1>&& o, ::scale::Encoder& encoder);
void decode(vigil::schema::transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
