//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Types and Options
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cstdint>

//-------------------------------------- Project  Headers ------------------------------------------

namespace stylekit {

//------------------------------------- Public Declarations ----------------------------------------

/**
 * @brief Identifiers for supported layer types
 *
 * The set of layer types is closed, every type maps to exactly one alternative of the
 * cpu::CPULayer variant.
 */
enum class LayerType : uint16_t {
    REFLECTIONPAD2D = 1,    //!< 2D reflection padding on the spatial axes
    INSTANCENORM,           //!< Instance normalization
    CONDINSTANCENORM,       //!< Conditional (style-selected) instance normalization
    DEPROCESS,              //!< Mapping of activations back to pixel range
    LAST_SUPPORTED,         //!< Last supported layer type (+1)
    ILLEGAL = 0xFFFF
};


/**
 * @brief Order of the axes in image tensors
 */
enum class DimOrdering : uint8_t {
    CHANNELS_LAST = 0,      //!< (batch, height, width, channels)
    CHANNELS_FIRST          //!< (batch, channels, height, width)
};


/**
 * @brief Identifiers for the activations that a deprocessing layer can undo
 */
enum class ActType : uint8_t {
    SIGMOID = 0,            //!< Upstream produced pixel-range values already, pass-through
    TANH                    //!< Upstream produced values in [-1,1], map to [0,255]
};


/**
 * @brief Constant initializers for normalization parameters
 */
enum class Initializer : uint8_t {
    ZEROS = 0,              //!< Initialize to 0
    ONES                    //!< Initialize to 1
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
