//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Basic Timing Functions (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//------------------------------------------------------------------------------

//-------------------------------------- System Headers --------------------------------------------

#include <cstdint>

//-------------------------------------- Project  Headers ------------------------------------------


//------------------------------------- Public Definitions -----------------------------------------

namespace stylekit {

using tstamp = uint64_t;

//--------------------------------------- Public Functions -----------------------------------------

tstamp sk_get_stamp();
uint32_t sk_elapsed_micros(tstamp start, tstamp end);
uint32_t sk_elapsed_millis(tstamp start, tstamp end);

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
