//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Parameter Provider for Flat Weight Files (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/base/memoryprovider.h>
#include <stylekit/base/neuralnetwork.h>

//------------------------------------- Public Declarations ----------------------------------------

/**
 * @brief Parameter provider for weight files that store all parameters of a network in one block
 *
 * The file is a raw array of 32-bit floats (host byte order). It is split into per-layer blocks in
 * ascending layer-number order. For each normalization layer, the gamma table is followed by the
 * beta table, tables that are disabled on the layer (\c scale or \c center set to false) are not
 * present in the file.
 */
class WeightFileProvider : public stylekit::MemoryParameterProvider {
 public:
    WeightFileProvider(const std::string& fileName, stylekit::NeuralNetwork& network);
    WeightFileProvider(const float *data, size_t numFloats, stylekit::NeuralNetwork& network);

 protected:
    static std::vector<float> loadFile(const std::string& fileName);
    void split(const float *data, size_t numFloats, stylekit::NeuralNetwork& network);
    size_t take(const std::string& name, const float *data, size_t offset, size_t count, size_t numFloats);
};

// vim: set expandtab ts=4 sw=4:
