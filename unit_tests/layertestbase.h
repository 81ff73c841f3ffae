//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Base class for misc. layer testing (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include <gtest/gtest.h>
#include <stylekit/stylekit.h>

//------------------------------------- Public Declarations ----------------------------------------

/**
 * @brief Base class for individual layer unit-tests
 *
 * This class contains a few helper routines that can be used by derived test classes to make
 * life easier. All tensors handled here are in (batch, height, width, channels) order unless
 * stated otherwise.
 */
class LayerTestBase {
  protected:
    static std::unique_ptr<stylekit::cpu::CPUBuffer> generateConstantData(const stylekit::cpu::CPUBufferShape& shape, float content);
    static std::unique_ptr<stylekit::cpu::CPUBuffer> generateRandomData(const stylekit::cpu::CPUBufferShape& shape, float low, float high, unsigned seed = 4711);
    static std::unique_ptr<stylekit::cpu::CPUBuffer> generateRampData(const stylekit::cpu::CPUBufferShape& shape);
    static std::vector<float> toVector(const stylekit::cpu::CPUBuffer& buffer);
    static std::vector<float> computeReflectionPad(const std::vector<float>& input, int batch, int height, int width, int channels,
                                                   int top, int bottom, int left, int right);
    static std::vector<float> computeInstanceNorm(const std::vector<float>& input, int batch, int height, int width, int channels,
                                                  float epsilon, const std::vector<float>& gamma, const std::vector<float>& beta);
    static void channelMoments(const stylekit::cpu::CPUBuffer& buffer, int batch, int channel, double& mean, double& variance);
    static void expectNear(const stylekit::cpu::CPUBuffer& buffer, const std::vector<float>& reference, float tolerance);
};


// vim: set expandtab ts=4 sw=4:
