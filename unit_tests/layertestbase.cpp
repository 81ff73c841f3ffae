//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Base class for misc. layer testing
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------


//--------------------------------------- System Headers -------------------------------------------

#include <cmath>
#include <random>

//-------------------------------------- Project  Headers ------------------------------------------

#include "layertestbase.h"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

using namespace stylekit;
using namespace stylekit::cpu;

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/


/**
 * @brief Generate tensor with constant data
 *
 * @param shape Shape of the tensor
 * @param content Constant value to put into every element of the generated tensor
 *
 * @return Pointer to tensor
 */
std::unique_ptr<CPUBuffer> LayerTestBase::generateConstantData(const CPUBufferShape& shape, float content) {
    auto buf = std::make_unique<CPUBuffer>(shape);
    buf->fill(content);
    return buf;
}


/**
 * @brief Generate tensor with uniformly distributed random data
 *
 * @param shape Shape of the tensor
 * @param low Lower bound for the data
 * @param high Upper bound for the data
 * @param seed Seed for the random number generator
 *
 * @return Pointer to tensor
 */
std::unique_ptr<CPUBuffer> LayerTestBase::generateRandomData(const CPUBufferShape& shape, float low, float high, unsigned seed) {
    auto buf = std::make_unique<CPUBuffer>(shape);
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(low, high);
    WriteMapping map(*buf);
    for (size_t i=0; i < buf->elements(); i++) map.data()[i] = dist(rng);
    return buf;
}


/**
 * @brief Generate tensor where each element carries its own (flat) index
 *
 * @param shape Shape of the tensor
 *
 * @return Pointer to tensor
 */
std::unique_ptr<CPUBuffer> LayerTestBase::generateRampData(const CPUBufferShape& shape) {
    auto buf = std::make_unique<CPUBuffer>(shape);
    WriteMapping map(*buf);
    for (size_t i=0; i < buf->elements(); i++) map.data()[i] = (float)i;
    return buf;
}


std::vector<float> LayerTestBase::toVector(const CPUBuffer& buffer) {
    ReadMapping map(buffer);
    return std::vector<float>(map.data(), map.data() + buffer.elements());
}


/**
 * @brief Compute reflection padding (reference implementation)
 *
 * Explicitly mirrors each output coordinate into the source tensor, the border pixel is not repeated.
 */
std::vector<float> LayerTestBase::computeReflectionPad(const std::vector<float>& input, int batch, int height, int width, int channels,
                                                       int top, int bottom, int left, int right) {
    int oheight = height + top + bottom;
    int owidth = width + left + right;
    std::vector<float> output((size_t)batch * oheight * owidth * channels);
    auto mirror = [](int idx, int size) {
        if (idx < 0) return -idx;
        if (idx >= size) return 2 * (size - 1) - idx;
        return idx;
    };
    for (int b=0; b < batch; b++) {
        for (int y=0; y < oheight; y++) {
            int sy = mirror(y - top, height);
            for (int x=0; x < owidth; x++) {
                int sx = mirror(x - left, width);
                for (int c=0; c < channels; c++) {
                    output[(((size_t)b * oheight + y) * owidth + x) * channels + c] = input[(((size_t)b * height + sy) * width + sx) * channels + c];
                }
            }
        }
    }
    return output;
}


/**
 * @brief Compute instance normalization (reference implementation)
 *
 * @param gamma Per-channel scale, empty to skip
 * @param beta Per-channel shift, empty to skip
 */
std::vector<float> LayerTestBase::computeInstanceNorm(const std::vector<float>& input, int batch, int height, int width, int channels,
                                                      float epsilon, const std::vector<float>& gamma, const std::vector<float>& beta) {
    std::vector<float> output(input.size());
    size_t spatial = (size_t)height * width;
    for (int b=0; b < batch; b++) {
        const float * in = input.data() + b * spatial * channels;
        float * out = output.data() + b * spatial * channels;
        for (int c=0; c < channels; c++) {
            double mean = 0.0, var = 0.0;
            for (size_t i=0; i < spatial; i++) mean += in[i*channels+c];
            mean /= (double)spatial;
            for (size_t i=0; i < spatial; i++) var += (in[i*channels+c] - mean) * (in[i*channels+c] - mean);
            var /= (double)spatial;
            double denom = sqrt(var) + epsilon;
            for (size_t i=0; i < spatial; i++) {
                double val = (in[i*channels+c] - mean) / denom;
                if (!gamma.empty()) val *= gamma[c];
                if (!beta.empty()) val += beta[c];
                out[i*channels+c] = (float)val;
            }
        }
    }
    return output;
}


/**
 * @brief Compute mean and population variance of a single channel of a single sample
 */
void LayerTestBase::channelMoments(const CPUBuffer& buffer, int batch, int channel, double& mean, double& variance) {
    const CPUBufferShape & shape = buffer.shape();
    ASSERT_EQ(shape.rank(), 4);
    int channels = shape.dim(3);
    size_t spatial = (size_t)shape.dim(1) * shape.dim(2);
    ReadMapping map(buffer);
    const float * ptr = map.data() + batch * spatial * channels;
    mean = 0.0;
    variance = 0.0;
    for (size_t i=0; i < spatial; i++) mean += ptr[i*channels+channel];
    mean /= (double)spatial;
    for (size_t i=0; i < spatial; i++) variance += (ptr[i*channels+channel] - mean) * (ptr[i*channels+channel] - mean);
    variance /= (double)spatial;
}


void LayerTestBase::expectNear(const CPUBuffer& buffer, const std::vector<float>& reference, float tolerance) {
    ASSERT_EQ(buffer.elements(), reference.size());
    ReadMapping map(buffer);
    for (size_t i=0; i < reference.size(); i++) {
        ASSERT_NEAR(map.data()[i], reference[i], tolerance) << "at element " << i;
    }
}

// vim: set expandtab ts=4 sw=4:
