//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Buffer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cstring>

//-------------------------------------- Project  Headers ------------------------------------------

#include "cpubuffer.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Create (zero-initialized) CPU buffer with the supplied shape
 *
 * @param shape Shape of the buffer, must be fully defined
 *
 * @throws ShapeException if the shape has unknown dimensions
 */
CPUBuffer::CPUBuffer(const CPUBufferShape& shape) : shape_(shape) {
    size_t num = shape_.elements();
    memory_ = new float[(num > 0) ? num : 1];
    memset(memory_, 0, num * sizeof(float));
}


/**
 * @brief Create CPU buffer with the supplied shape and copy data into it
 *
 * @param shape Shape of the buffer, must be fully defined
 * @param data Pointer to data to copy, must hold at least as many elements as the \p shape
 *             describes
 *
 * @throws ShapeException if the shape has unknown dimensions
 */
CPUBuffer::CPUBuffer(const CPUBufferShape& shape, const float *data) : CPUBuffer(shape) {
    if (data) memcpy(memory_, data, bytes());
}


/**
 * @brief Destructor
 *
 * Deallocates buffer memory
 */
CPUBuffer::~CPUBuffer() {
    delete [] memory_;
    memory_ = nullptr;
}


/**
 * @brief Get size of buffer in bytes
 *
 * @return Number of bytes of the buffer data
 */
size_t CPUBuffer::bytes() const {
    return shape_.bytes();
}


/**
 * @brief Get number of elements in buffer
 *
 * @return Element count
 */
size_t CPUBuffer::elements() const {
    return shape_.elements();
}


/**
 * @brief Create deep copy of this buffer
 *
 * @return Pointer to new buffer with the same shape and content
 */
std::unique_ptr<CPUBuffer> CPUBuffer::copy() const {
    return reshape(shape_);
}


/**
 * @brief Create copy of this buffer with a different shape
 *
 * @param shape New shape for the data, must have the same number of elements
 *
 * @return Pointer to new buffer that carries a copy of the data with the new shape
 *
 * @throws ShapeException in case the element counts do not match
 */
std::unique_ptr<CPUBuffer> CPUBuffer::reshape(const CPUBufferShape& shape) const {
    if (shape.elements() != elements()) {
        THROW_EXCEPTION_ARGS(ShapeException, "Cannot reshape %s into %s", shape_.toString().c_str(), shape.toString().c_str());
    }
    ReadMapping src(*this);
    return std::make_unique<CPUBuffer>(shape, src.data());
}


/**
 * @brief Create copy of this buffer with all elements multiplied by a constant
 *
 * @param factor Multiplier
 *
 * @return Pointer to new buffer of the same shape
 */
std::unique_ptr<CPUBuffer> CPUBuffer::scale(float factor) const {
    auto result = std::make_unique<CPUBuffer>(shape_);
    ReadMapping src(*this);
    WriteMapping tgt(*result);
    size_t num = elements();
    for (size_t i=0; i < num; i++) tgt.data()[i] = src.data()[i] * factor;
    return result;
}


} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
