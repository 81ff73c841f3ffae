//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Base
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cmath>
#include <cstring>

//-------------------------------------- Project  Headers ------------------------------------------

#include "normlayerbase.h"
#include "../base/layerconfig.h"
#include "../common/logging.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Perform instance normalization on a tensor
 *
 * @param input Input tensor of arbitrary rank
 * @param axis Channel axis, negative values count from the end
 * @param epsilon Value that is added to the standard deviation
 * @param gamma Optional per-channel scale, \c nullptr to skip scaling
 * @param beta Optional per-channel shift, \c nullptr to skip shifting
 *
 * @return New tensor with the same shape as \p input
 *
 * @throws ShapeException if \p axis is out of range
 *
 * Mean and (population) variance are computed over all axes except the channel axis and except the
 * batch axis. The first axis is treated as batch axis when the tensor has at least 3 dimensions and
 * the channel axis is not the first one, i.e. the statistics are computed per sample and per
 * channel. Each element is then mapped to <tt>(x - mean) / (sqrt(var) + epsilon)</tt>. Note that
 * \p epsilon is added to the standard deviation, not to the variance. Afterwards the result is
 * multiplied by \p gamma and \p beta is added, if supplied.
 */
std::unique_ptr<CPUBuffer> instanceNormalize(const CPUBuffer& input, int axis, float epsilon, const float *gamma, const float *beta) {
    const CPUBufferShape & shape = input.shape();
    const int ax = shape.normalizeAxis(axis);
    const bool batched = (shape.rank() >= 3) && (ax != 0);
    const size_t batches = (batched) ? (size_t)shape.dim(0) : 1;
    const size_t channels = (size_t)shape.dim(ax);
    size_t pre = 1, post = 1;
    for (int i=(batched) ? 1 : 0; i < ax; i++) pre *= (size_t)shape.dim(i);
    for (int i=ax+1; i < shape.rank(); i++) post *= (size_t)shape.dim(i);
    const size_t count = pre * post;
    auto output = std::make_unique<CPUBuffer>(shape);
    if (count == 0 || channels == 0 || batches == 0) return output;
    ReadMapping src(input);
    WriteMapping tgt(*output);
    const size_t bstride = pre * channels * post;
    bool degenerate = false;
    for (size_t b=0; b < batches; b++) {
        const float * in = src.data() + b * bstride;
        float * out = tgt.data() + b * bstride;
        for (size_t c=0; c < channels; c++) {
            // NOTE (mw) two-pass computation in double precision, tensors are small anyway
            double sum = 0.0;
            for (size_t p=0; p < pre; p++) {
                const float * ptr = in + (p * channels + c) * post;
                for (size_t q=0; q < post; q++) sum += ptr[q];
            }
            const double mean = sum / (double)count;
            double sqsum = 0.0;
            for (size_t p=0; p < pre; p++) {
                const float * ptr = in + (p * channels + c) * post;
                for (size_t q=0; q < post; q++) {
                    double diff = ptr[q] - mean;
                    sqsum += diff * diff;
                }
            }
            const double stddev = sqrt(sqsum / (double)count) + (double)epsilon;
            if (stddev == 0.0) degenerate = true;
            const double mul = ((gamma) ? (double)gamma[c] : 1.0) / stddev;
            const double add = (beta) ? (double)beta[c] : 0.0;
            for (size_t p=0; p < pre; p++) {
                const float * iptr = in + (p * channels + c) * post;
                float * optr = out + (p * channels + c) * post;
                for (size_t q=0; q < post; q++) optr[q] = (float)((iptr[q] - mean) * mul + add);
            }
        }
    }
    if (degenerate) {
        SKLOGW("Instance normalization encountered a constant channel with zero epsilon, output contains non-finite values");
    }
    return output;
}


/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Determine channel count from an input shape
 *
 * @param inputShape Shape supplied to build()
 *
 * @return Number of channels
 *
 * @throws ShapeException if the channel axis is out of range or has no known size
 */
int NormLayerBase::resolveChannels(const CPUBufferShape& inputShape) const {
    if ((axis_ >= inputShape.rank()) || (axis_ < -inputShape.rank())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: axis %d out of range for input %s", name_.c_str(), axis_, inputShape.toString().c_str());
    }
    int dim = inputShape.dim(axis_);
    if (dim == CPUBufferShape::UNKNOWN) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: axis %d of input %s should have a defined dimension", name_.c_str(), axis_, inputShape.toString().c_str());
    }
    return dim;
}


/**
 * @brief Check that a tensor matches the channel count of the layer
 *
 * @param input Tensor to check
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the channel dimension does not match
 */
void NormLayerBase::checkInput(const CPUBuffer& input) const {
    assertBuilt();
    const CPUBufferShape & shape = input.shape();
    if ((axis_ >= shape.rank()) || (axis_ < -shape.rank()) || (shape.dim(axis_) != channels_)) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s expects %d channels on axis %d, got input %s", name_.c_str(), channels_, axis_, shape.toString().c_str());
    }
}


/**
 * @brief Load a parameter table from a provider
 *
 * @param weights Parameter provider
 * @param suffix Parameter name suffix (\c gamma or \c beta )
 * @param target Table to fill, must already have the correct size
 *
 * @throws ShapeException if the provider reports a size that does not match the table
 *
 * If the provider does not have the parameter, the table keeps its initial values.
 */
void NormLayerBase::loadTable(const ParameterProvider * weights, const char *suffix, std::vector<float>& target) const {
    std::string pname = name_ + "." + suffix;
    int64_t avail = weights->elements(pname, layerNumber_, 0);
    if ((avail >= 0) && (avail != (int64_t)target.size())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Parameter %s has %ld elements, expected %ld", pname.c_str(), (long)avail, (long)target.size());
    }
    bool found = false;
    weights->map(pname, layerNumber_, 0).with([&](const std::any& data) {
        if (data.has_value()) {
            memcpy(target.data(), std::any_cast<const float *>(data), target.size() * sizeof(float));
            found = true;
        }
    });
    if (!found) {
        SKLOGW("No parameter %s supplied, keeping initial values", pname.c_str());
    }
}


/**
 * @brief Generate configuration options that are shared by the normalization layers
 *
 * @return JSON object with \c name, \c axis, \c epsilon, \c center, \c scale, \c beta_initializer
 *         and \c gamma_initializer
 */
nlohmann::json NormLayerBase::normConfig() const {
    nlohmann::json cfg;
    cfg["name"] = name_;
    cfg["axis"] = axis_;
    cfg["epsilon"] = epsilon_;
    cfg["center"] = center_;
    cfg["scale"] = scale_;
    cfg["beta_initializer"] = initializerConfig(betaInit_);
    cfg["gamma_initializer"] = initializerConfig(gammaInit_);
    return cfg;
}


/**
 * @brief Map initializer to its constant value
 */
float NormLayerBase::initialValue(Initializer init) {
    return (init == Initializer::ONES) ? 1.0f : 0.0f;
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
