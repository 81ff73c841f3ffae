//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Basic Timing Functions
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//-------------------------------------- System Headers --------------------------------------------

#if defined(WIN32) || defined(WIN64)
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <time.h>
#endif

//-------------------------------------- Project  Headers ------------------------------------------

#include "performance.h"


//-------------------------------------- Global Variables ------------------------------------------


//------------------------------------- Private Prototypes -----------------------------------------

namespace stylekit {

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Obtain timestamp from a monotonic clock
 *
 * @return Opaque timestamp, only meaningful for computing differences
 */
tstamp sk_get_stamp() {
#if defined(WIN32) || defined(WIN64)
    LARGE_INTEGER stamp;
    QueryPerformanceCounter(&stamp);
    return (tstamp)stamp.QuadPart;
#else
    struct timespec spec;
    clock_gettime(CLOCK_MONOTONIC, &spec);
    return ((tstamp)spec.tv_sec)*1000000000ULL + (tstamp)spec.tv_nsec;
#endif
}


uint32_t sk_elapsed_micros(tstamp start, tstamp end) {
#if defined(WIN32) || defined(WIN64)
    LARGE_INTEGER freq;
    QueryPerformanceFrequency(&freq);
    return (uint32_t)(1000000.0 * (double)(end-start) / (double)(freq.QuadPart));
#else
    return (uint32_t)((end-start)/1000ULL);
#endif
}


uint32_t sk_elapsed_millis(tstamp start, tstamp end) {
    return sk_elapsed_micros(start, end) / 1000;
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
