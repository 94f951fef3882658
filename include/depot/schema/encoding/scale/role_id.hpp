#pragma once

#include <depot/schema/role_id.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(depot::schema,
                             role_id_t,
                             depot::schema::role_id_t::requester,
                             depot::schema::role_id_t::approver,
                             depot::schema::role_id_t::administrator)
