//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Reflection Padding Layer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <algorithm>
#include <cstring>
#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include "reflectionpadlayer.h"
#include "../base/layerconfig.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

/**
 * @brief Mirror an index into the range [0,extent) without repeating the border element
 *
 * @param idx Index to mirror, must be in [-(extent-1), 2*(extent-1)]
 * @param extent Size of the axis
 *
 * @return Index into the axis
 */
static inline int reflect(int idx, int extent) {
    if (idx < 0) return -idx;
    if (idx >= extent) return 2 * (extent - 1) - idx;
    return idx;
}

/**
 * @brief Get axis indices of height and width for a given axis order
 */
static inline void spatialAxes(DimOrdering order, int & hAxis, int & wAxis) {
    hAxis = (order == DimOrdering::CHANNELS_LAST) ? 1 : 2;
    wAxis = hAxis + 1;
}

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param builder Builder that carries the padding parameters
 * @param layerNumber Number to be assigned to the layer
 *
 * @throws InvalidPaddingException if any padding amount in the builder is negative
 */
ReflectionPadLayer::ReflectionPadLayer(const ReflectionPadLayerBuilder& builder, int layerNumber) :
      LayerBase(builder, layerNumber) {
    top_ = builder.padding_[ReflectionPadLayerBuilder::TOP];
    bottom_ = builder.padding_[ReflectionPadLayerBuilder::BOTTOM];
    left_ = builder.padding_[ReflectionPadLayerBuilder::LEFT];
    right_ = builder.padding_[ReflectionPadLayerBuilder::RIGHT];
    ordering_ = builder.ordering_;
    if ((top_ < 0) || (bottom_ < 0) || (left_ < 0) || (right_ < 0)) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Layer %s has negative padding", name_.c_str());
    }
}


/**
 * @brief Prepare layer for a given input shape
 *
 * @param inputShape Shape of the input tensor, spatial dimensions may be unknown
 *
 * @throws ShapeException if the input is not a 4D tensor
 * @throws InvalidPaddingException if a known spatial extent is too small for the padding
 */
void ReflectionPadLayer::build(const CPUBufferShape& inputShape) {
    if (inputShape.rank() != 4) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s requires 4D input, got %s", name_.c_str(), inputShape.toString().c_str());
    }
    checkExtent(inputShape);
    markBuilt(inputShape);
}


/**
 * @brief Compute shape of the output tensor for a given input shape
 *
 * @param inputShape Shape of the input tensor, spatial dimensions may be unknown
 *
 * @return Input shape with \c top+bottom added to the height and \c left+right added to the width.
 *         Unknown dimensions stay unknown
 *
 * @throws ShapeException if the input is not a 4D tensor
 */
CPUBufferShape ReflectionPadLayer::computeOutputShape(const CPUBufferShape& inputShape) const {
    if (inputShape.rank() != 4) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s requires 4D input, got %s", name_.c_str(), inputShape.toString().c_str());
    }
    int haxis, waxis;
    spatialAxes(ordering_, haxis, waxis);
    int height = inputShape.dim(haxis);
    int width = inputShape.dim(waxis);
    CPUBufferShape out = inputShape.withDim(haxis, (height == CPUBufferShape::UNKNOWN) ? height : height + top_ + bottom_);
    return out.withDim(waxis, (width == CPUBufferShape::UNKNOWN) ? width : width + left_ + right_);
}


/**
 * @brief Pad input tensor
 *
 * @param input Input tensor
 *
 * @return New tensor with the padded data
 *
 * @throws InvalidPaddingException if the input is too small for the padding
 * @throws ShapeException if the input is not a 4D tensor
 *
 * @see reflectionPad2D()
 */
std::unique_ptr<CPUBuffer> ReflectionPadLayer::forward(const CPUBuffer& input) const {
    return reflectionPad2D(input, top_, bottom_, left_, right_, ordering_);
}


/**
 * @brief Retrieve layer configuration
 *
 * @return JSON object with the options \c name, \c padding (always in nested form) and
 *         \c dim_ordering
 */
nlohmann::json ReflectionPadLayer::getConfig() const {
    nlohmann::json cfg;
    cfg["name"] = name_;
    cfg["padding"] = nlohmann::json::array({nlohmann::json::array({top_, bottom_}),
                                           nlohmann::json::array({left_, right_})});
    cfg["dim_ordering"] = dimOrderingName(ordering_);
    return cfg;
}


/**
 * @brief Perform reflection padding on the spatial axes of a 4D tensor
 *
 * @param input Input tensor, either (batch, height, width, channels) or (batch, channels, height,
 *              width) depending on \p order
 * @param top Number of rows to add on top
 * @param bottom Number of rows to add at the bottom
 * @param left Number of columns to add on the left
 * @param right Number of columns to add on the right
 * @param order Axis order of \p input
 *
 * @return New tensor with height increased by \p top + \p bottom and width increased by
 *         \p left + \p right
 *
 * @throws InvalidPaddingException if a padding amount is negative or exceeds the extent of the
 *         respective axis minus one
 * @throws ShapeException if the input is not a 4D tensor
 *
 * Output row \e i maps to input row \c reflect(i-top) and output column \e j maps to input column
 * \c reflect(j-left), where indices below zero are mirrored as <tt>-k -> k</tt> and indices past
 * the end are mirrored as <tt>W-1+k -> W-1-k</tt>. The input is not modified. A padding of zero on
 * all sides yields a copy.
 */
std::unique_ptr<CPUBuffer> reflectionPad2D(const CPUBuffer& input, int top, int bottom, int left, int right, DimOrdering order) {
    const CPUBufferShape & ishape = input.shape();
    if (ishape.rank() != 4) {
        THROW_EXCEPTION_ARGS(ShapeException, "Reflection padding requires 4D input, got %s", ishape.toString().c_str());
    }
    int haxis, waxis;
    spatialAxes(order, haxis, waxis);
    const int height = ishape.dim(haxis);
    const int width = ishape.dim(waxis);
    if ((top < 0) || (bottom < 0) || (left < 0) || (right < 0)) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Negative padding (%d,%d,%d,%d) supplied", top, bottom, left, right);
    }
    // an axis without padding is copied as is, even if it is empty
    if (((top > 0) && (top > height - 1)) || ((bottom > 0) && (bottom > height - 1))) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Vertical padding (%d,%d) exceeds height %d minus one", top, bottom, height);
    }
    if (((left > 0) && (left > width - 1)) || ((right > 0) && (right > width - 1))) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Horizontal padding (%d,%d) exceeds width %d minus one", left, right, width);
    }
    const int oheight = height + top + bottom;
    const int owidth = width + left + right;
    CPUBufferShape oshape = ishape.withDim(haxis, oheight).withDim(waxis, owidth);
    auto output = std::make_unique<CPUBuffer>(oshape);
    // outer covers all axes before the height axis, inner all axes after the width axis
    size_t outer = 1, inner = 1;
    for (int i=0; i < haxis; i++) outer *= (size_t)ishape.dim(i);
    for (int i=waxis+1; i < 4; i++) inner *= (size_t)ishape.dim(i);
    std::vector<int> srcrow(oheight), srccol(owidth);
    for (int y=0; y < oheight; y++) srcrow[y] = reflect(y - top, height);
    for (int x=0; x < owidth; x++) srccol[x] = reflect(x - left, width);
    ReadMapping src(input);
    WriteMapping tgt(*output);
    const size_t iplane = (size_t)height * width * inner;
    const size_t oplane = (size_t)oheight * owidth * inner;
    for (size_t o=0; o < outer; o++) {
        const float * in = src.data() + o * iplane;
        float * out = tgt.data() + o * oplane;
        for (int y=0; y < oheight; y++) {
            const float * inrow = in + (size_t)srcrow[y] * width * inner;
            for (int x=0; x < owidth; x++) {
                memcpy(out, inrow + (size_t)srccol[x] * inner, inner * sizeof(float));
                out += inner;
            }
        }
    }
    return output;
}

/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Check that the known spatial extents of a shape allow for the configured padding
 *
 * @param shape Shape to check
 *
 * @throws InvalidPaddingException if the padding exceeds a known extent minus one
 */
void ReflectionPadLayer::checkExtent(const CPUBufferShape& shape) const {
    int haxis, waxis;
    spatialAxes(ordering_, haxis, waxis);
    int height = shape.dim(haxis);
    int width = shape.dim(waxis);
    if ((height != CPUBufferShape::UNKNOWN) && (std::max(top_, bottom_) > 0) && (std::max(top_, bottom_) > height - 1)) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Layer %s: vertical padding (%d,%d) exceeds height %d minus one", name_.c_str(), top_, bottom_, height);
    }
    if ((width != CPUBufferShape::UNKNOWN) && (std::max(left_, right_) > 0) && (std::max(left_, right_) > width - 1)) {
        THROW_EXCEPTION_ARGS(InvalidPaddingException, "Layer %s: horizontal padding (%d,%d) exceeds width %d minus one", name_.c_str(), left_, right_, width);
    }
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
