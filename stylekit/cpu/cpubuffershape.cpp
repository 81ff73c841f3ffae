//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Buffer Shape
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <sstream>

//-------------------------------------- Project  Headers ------------------------------------------

#include "cpubuffershape.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param dims List of dimension sizes, outermost first. Use #UNKNOWN for dimensions that are not
 *             (yet) known
 *
 * @throws ShapeException if a dimension is neither non-negative nor #UNKNOWN
 */
CPUBufferShape::CPUBufferShape(std::initializer_list<int> dims) : CPUBufferShape(std::vector<int>(dims)) {
}


/**
 * @copydoc CPUBufferShape(std::initializer_list<int>)
 */
CPUBufferShape::CPUBufferShape(const std::vector<int>& dims) : dims_(dims) {
    for (int d : dims_) {
        if ((d < 0) && (d != UNKNOWN)) THROW_EXCEPTION_ARGS(ShapeException, "Illegal dimension size %d", d);
    }
}


/**
 * @brief Compare shape against another shape for equality
 *
 * @param other Shape to compare against
 *
 * @retval true if both shapes have the same rank and the same dimension sizes
 * @retval false otherwise
 */
bool CPUBufferShape::operator==(const CPUBufferShape& other) const {
    return dims_ == other.dims_;
}


/**
 * @brief Compare shape against another shape for inequality
 *
 * @param other Shape to compare against
 *
 * @retval true if the shapes differ in rank or any dimension
 * @retval false otherwise
 */
bool CPUBufferShape::operator!=(const CPUBufferShape& other) const {
    return !(*this == other);
}


/**
 * @brief Map (possibly negative) axis index to a non-negative one
 *
 * @param axis Axis index, negative indices count from the end
 *
 * @return Axis index in the range [0, rank)
 *
 * @throws ShapeException if the axis is out of range
 */
int CPUBufferShape::normalizeAxis(int axis) const {
    int ax = (axis < 0) ? axis + rank() : axis;
    if ((ax < 0) || (ax >= rank())) THROW_EXCEPTION_ARGS(ShapeException, "Axis %d out of range for shape %s", axis, toString().c_str());
    return ax;
}


/**
 * @brief Get size of a single dimension
 *
 * @param axis Axis index, negative indices count from the end
 *
 * @return Size of the dimension or #UNKNOWN
 *
 * @throws ShapeException if the axis is out of range
 */
int CPUBufferShape::dim(int axis) const {
    return dims_[normalizeAxis(axis)];
}


/**
 * @brief Check if all dimensions have a known size
 *
 * @retval true if no dimension is #UNKNOWN
 * @retval false otherwise
 */
bool CPUBufferShape::isFullyDefined() const {
    for (int d : dims_) {
        if (d == UNKNOWN) return false;
    }
    return true;
}


/**
 * @brief Get number of elements in a tensor of this shape
 *
 * @return Element count (1 for a rank-0 shape)
 *
 * @throws ShapeException if the shape is not fully defined
 */
size_t CPUBufferShape::elements() const {
    if (!isFullyDefined()) THROW_EXCEPTION_ARGS(ShapeException, "Shape %s is not fully defined", toString().c_str());
    size_t count = 1;
    for (int d : dims_) count *= (size_t)d;
    return count;
}


/**
 * @brief Get number of bytes required to store a (float) tensor of this shape
 *
 * @return Size in bytes
 */
size_t CPUBufferShape::bytes() const {
    return elements() * sizeof(float);
}


/**
 * @brief Get (element) stride of an axis in row-major layout
 *
 * @param axis Axis index, negative indices count from the end
 *
 * @return Number of elements between two consecutive indices along the axis
 */
size_t CPUBufferShape::stride(int axis) const {
    int ax = normalizeAxis(axis);
    size_t str = 1;
    for (int i=rank()-1; i > ax; i--) {
        if (dims_[i] == UNKNOWN) THROW_EXCEPTION_ARGS(ShapeException, "Cannot compute stride on shape %s", toString().c_str());
        str *= (size_t)dims_[i];
    }
    return str;
}


/**
 * @brief Create a copy of this shape with a single dimension replaced
 *
 * @param axis Axis index, negative indices count from the end
 * @param size New size for the dimension (may be #UNKNOWN)
 *
 * @return New shape instance
 */
CPUBufferShape CPUBufferShape::withDim(int axis, int size) const {
    std::vector<int> dims = dims_;
    dims[normalizeAxis(axis)] = size;
    return CPUBufferShape(dims);
}


/**
 * @brief Create a copy of this shape with an additional axis of size 1
 *
 * @param axis Position at which the new axis is inserted (0..rank)
 *
 * @return New shape instance with rank increased by one
 */
CPUBufferShape CPUBufferShape::expandDims(int axis) const {
    int ax = (axis < 0) ? axis + rank() + 1 : axis;
    if ((ax < 0) || (ax > rank())) THROW_EXCEPTION_ARGS(ShapeException, "Cannot insert axis %d into shape %s", axis, toString().c_str());
    std::vector<int> dims = dims_;
    dims.insert(dims.begin() + ax, 1);
    return CPUBufferShape(dims);
}


/**
 * @brief Create a copy of this shape with an axis of size 1 removed
 *
 * @param axis Axis to remove, negative indices count from the end
 *
 * @return New shape instance with rank decreased by one
 *
 * @throws ShapeException if the axis does not have size 1
 */
CPUBufferShape CPUBufferShape::squeeze(int axis) const {
    int ax = normalizeAxis(axis);
    if (dims_[ax] != 1) THROW_EXCEPTION_ARGS(ShapeException, "Cannot squeeze axis %d of shape %s", axis, toString().c_str());
    std::vector<int> dims = dims_;
    dims.erase(dims.begin() + ax);
    return CPUBufferShape(dims);
}


/**
 * @brief Create printable representation of the shape
 *
 * @return String in the form "[1,4,4,3]", unknown dimensions are printed as "?"
 */
std::string CPUBufferShape::toString() const {
    std::stringstream str;
    str << "[";
    for (size_t i=0; i < dims_.size(); i++) {
        if (i > 0) str << ",";
        if (dims_[i] == UNKNOWN) str << "?";
        else str << dims_[i];
    }
    str << "]";
    return str.str();
}


} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
