#pragma once

#include <vigil/schema/alert_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    vigil::schema,
    alert_type_t,
    vigil::schema::alert_type_t::high_value,
    vigil::schema::alert_type_t::high_risk_counterparty,
    vigil::schema::alert_type_t::high_risk_jurisdiction,
    vigil::schema::alert_type_t::rapid_succession,
    vigil::schema::alert_type_t::round_amount,
    vigil::schema::alert_type_t::high_frequency,
    vigil::schema::alert_type_t::new_counterparty,
    vigil::schema::alert_type_t::cluster_member)
