//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Reflection Padding Layer (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerbase.h"
#include "cpubuffer.h"
#include "reflectionpadlayerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Reflection padding layer (CPU-based)
 *
 * Extends the height and width axes of a 4D image tensor by mirroring the pixels next to the border
 * outward. The border pixel itself is not repeated, i.e. a padded row above the image at distance
 * \e k is a copy of the row at index \e k of the input. Therefore the padding on each side may not
 * exceed the size of the padded axis minus one.
 *
 * @see reflectionPad2D()
 */
class ReflectionPadLayer : public LayerBase {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    ReflectionPadLayer(const ReflectionPadLayerBuilder& builder, int layerNumber);

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    void build(const CPUBufferShape& inputShape);
    [[nodiscard]] CPUBufferShape computeOutputShape(const CPUBufferShape& inputShape) const;
    [[nodiscard]] std::unique_ptr<CPUBuffer> forward(const CPUBuffer& input) const;
    [[nodiscard]] nlohmann::json getConfig() const;

    [[nodiscard]] int top() const {
        return top_;
    }

    [[nodiscard]] int bottom() const {
        return bottom_;
    }

    [[nodiscard]] int left() const {
        return left_;
    }

    [[nodiscard]] int right() const {
        return right_;
    }

    [[nodiscard]] DimOrdering dimOrdering() const {
        return ordering_;
    }

 private:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    void checkExtent(const CPUBufferShape& shape) const;

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    int top_ = 1;                                       //!< Rows added on top
    int bottom_ = 1;                                    //!< Rows added at the bottom
    int left_ = 1;                                      //!< Columns added on the left
    int right_ = 1;                                     //!< Columns added on the right
    DimOrdering ordering_ = DimOrdering::CHANNELS_LAST; //!< Axis order of the input
};


std::unique_ptr<CPUBuffer> reflectionPad2D(const CPUBuffer& input, int top, int bottom, int left, int right,
                                           DimOrdering order = DimOrdering::CHANNELS_LAST);

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
