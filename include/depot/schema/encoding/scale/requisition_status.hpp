#pragma once

#include <depot/schema/requisition_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(depot::schema,
                             requisition_status_t,
                             depot::schema::requisition_status_t::pending,
                             depot::schema::requisition_status_t::approved,
                             depot::schema::requisition_status_t::partially_approved,
                             depot::schema::requisition_status_t::rejected,
                             depot::schema::requisition_status_t::cancelled)
