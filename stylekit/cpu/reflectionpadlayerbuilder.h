//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Reflection Padding Layer Builder (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Templatized anchor for reflection padding layer builders
 *
 * @see ReflectionPadLayerBuilder
 */
template<typename D>
struct ReflectionPadLayerBuilderTempl : LayerBuilderTempl<D> {

    enum side {
        TOP = 0,
        BOTTOM,
        LEFT,
        RIGHT
    };

    /**
     * @brief Constructor
     *
     * @param name Name to be assigned to the layer when built
     *
     * The padding defaults to one pixel on each side.
     */
    explicit ReflectionPadLayerBuilderTempl(const std::string& name) : LayerBuilderTempl<D>(name, LayerType::REFLECTIONPAD2D) {
    }

    /**
     * @brief Set same padding on all four sides
     *
     * @param pad Padding amount (in pixels)
     *
     * @return Reference to builder object
     *
     * @throws InvalidPaddingException if \p pad is negative
     */
    D & padding(int pad) {
        return padding(pad, pad, pad, pad);
    }

    /**
     * @brief Set symmetric padding per spatial axis
     *
     * @param vertical Padding on top and bottom
     * @param horizontal Padding on left and right
     *
     * @return Reference to builder object
     *
     * @throws InvalidPaddingException if any value is negative
     */
    D & padding(int vertical, int horizontal) {
        return padding(vertical, vertical, horizontal, horizontal);
    }

    /**
     * @brief Set padding for each side individually
     *
     * @param top Rows to add above the image
     * @param bottom Rows to add below the image
     * @param left Columns to add left of the image
     * @param right Columns to add right of the image
     *
     * @return Reference to builder object
     *
     * @throws InvalidPaddingException if any value is negative
     */
    D & padding(int top, int bottom, int left, int right) {
        if ((top < 0) || (bottom < 0) || (left < 0) || (right < 0)) {
            THROW_EXCEPTION_ARGS(InvalidPaddingException, "Negative padding (%d,%d,%d,%d) supplied", top, bottom, left, right);
        }
        padding_[TOP] = top;
        padding_[BOTTOM] = bottom;
        padding_[LEFT] = left;
        padding_[RIGHT] = right;
        return *(D *)this;
    }

    /**
     * @brief Set order of the axes in the input tensor
     *
     * @param order Axis order, defaults to DimOrdering::CHANNELS_LAST
     *
     * @return Reference to builder object
     */
    D & dimOrdering(DimOrdering order) {
        ordering_ = order;
        return *(D *)this;
    }

    int padding_[4] = {1, 1, 1, 1};                     //!< Padding in the order top, bottom, left, right
    DimOrdering ordering_ = DimOrdering::CHANNELS_LAST; //!< Axis order of the input tensor
};


/**
 * @brief Reflection padding layer builder
 *
 * This builder is used to create layers that extend the spatial axes of an image tensor by
 * mirroring its border pixels.
 */
struct ReflectionPadLayerBuilder : ReflectionPadLayerBuilderTempl<ReflectionPadLayerBuilder> {
    explicit ReflectionPadLayerBuilder(const std::string& name) : ReflectionPadLayerBuilderTempl<ReflectionPadLayerBuilder>(name) {}
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
