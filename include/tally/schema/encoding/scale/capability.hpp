#pragma once

#include <tally/schema/capability.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tally::schema,
                             capability_t,
                             tally::schema::capability_t::governance,
                             tally::schema::capability_t::custody_operator)
