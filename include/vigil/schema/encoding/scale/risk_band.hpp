#pragma once

#include <vigil/schema/risk_band.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(vigil::schema,
                             risk_band_t,
                             vigil::schema::risk_band_t::moderate,
                             vigil::schema::risk_band_t::high)
