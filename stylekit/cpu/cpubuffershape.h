//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Buffer Shape (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cstdint>
#include <cstdlib>
#include <vector>
#include <string>
#include <initializer_list>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../common/skexception.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

class CPUBuffer;

/**
 * @brief Shape of an N-dimensional tensor
 *
 * This class stores the ordered list of dimension sizes of a tensor. Tensor data is always laid
 * out in row-major order, i.e. the last axis is the fastest-moving one. For image tensors the
 * default layout is (batch, height, width, channels).
 *
 * For static shape propagation (see the \c computeOutputShape() functions of the layers), a shape
 * may contain dimensions that are not known yet. Those are stored as #UNKNOWN. A shape that is used
 * to actually allocate a CPUBuffer must be fully defined.
 *
 * Axis indices that are passed to this class may be negative, in which case they count from the
 * end (-1 refers to the last axis).
 *
 * @see CPUBuffer
 */
class CPUBufferShape {
    friend class CPUBuffer;
 public:
    constexpr static int UNKNOWN = -1;      //!< Marker for a dimension with no statically known size

    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    CPUBufferShape() = default;
    CPUBufferShape(std::initializer_list<int> dims);
    explicit CPUBufferShape(const std::vector<int>& dims);
    ~CPUBufferShape() = default;

    // ------------------------------------------------------------------------
    // Overloaded operators
    // ------------------------------------------------------------------------
    bool operator!=(const CPUBufferShape& other) const;
    bool operator==(const CPUBufferShape& other) const;

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    [[nodiscard]] int normalizeAxis(int axis) const;
    [[nodiscard]] int dim(int axis) const;
    [[nodiscard]] bool isFullyDefined() const;
    [[nodiscard]] size_t elements() const;
    [[nodiscard]] size_t bytes() const;
    [[nodiscard]] size_t stride(int axis) const;
    [[nodiscard]] CPUBufferShape withDim(int axis, int size) const;
    [[nodiscard]] CPUBufferShape expandDims(int axis) const;
    [[nodiscard]] CPUBufferShape squeeze(int axis) const;
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Get number of dimensions (rank) of the shape
     *
     * @return Rank of the tensor
     */
    [[nodiscard]] int rank() const {
        return (int)dims_.size();
    }

    /**
     * @brief Get list of dimension sizes
     *
     * @return Const reference to dimensions, unknown dimensions are set to #UNKNOWN
     */
    [[nodiscard]] const std::vector<int>& dims() const {
        return dims_;
    }

 private:
    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::vector<int> dims_;             //!< Dimension sizes, outermost first
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
