#pragma once

#include <tally/schema/stake_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             stake_status_t,
                             tally::schema::stake_status_t::active,
                             tally::schema::stake_status_t::closed)
