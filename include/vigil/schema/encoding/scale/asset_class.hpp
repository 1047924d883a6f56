#pragma once

#include <vigil/schema/asset_class.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(vigil::schema,
                             asset_class_t,
                             vigil::schema::asset_class_t::fiat,
                             vigil::schema::asset_class_t::crypto)
