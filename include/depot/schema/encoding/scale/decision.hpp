#pragma once

#include <depot/schema/decision.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(depot::schema,
                             decision_t,
                             depot::schema::decision_t::approve,
                             depot::schema::decision_t::reject)
