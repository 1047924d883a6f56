#pragma once

#include <vigil/schema/alert.hpp>
#include <scale/scale.hpp>

namespace vigil::schema::encoding::scale {

void encode(vigil::schema::alert<1>&& o, ::scale::Encoder& encoder);
void decode(vigil::schema::alert<1>&& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
