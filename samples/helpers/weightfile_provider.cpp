//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Parameter Provider for Flat Weight Files
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------


//--------------------------------------- System Headers -------------------------------------------

#include <cstdio>
#include <variant>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/common/skexception.h>
#include <stylekit/common/logging.h>
#include "weightfile_provider.h"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

using namespace stylekit;

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Load weight file and split it into the parameters of a network
 *
 * @param fileName Name of the weight file
 * @param network Network to load the parameters for, must be set up
 *
 * @throws StyleKitException if the file cannot be read or does not match the network
 */
WeightFileProvider::WeightFileProvider(const std::string& fileName, NeuralNetwork& network) {
    std::vector<float> data = loadFile(fileName);
    split(data.data(), data.size(), network);
}


/**
 * @brief Create provider object around existing memory block
 *
 * @param data Pointer to weight data, no ownership is taken (data is copied)
 * @param numFloats Number of floats presented by \p data
 * @param network Network to load the parameters for, must be set up
 */
WeightFileProvider::WeightFileProvider(const float *data, size_t numFloats, NeuralNetwork& network) {
    split(data, numFloats, network);
}

/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

std::vector<float> WeightFileProvider::loadFile(const std::string& fileName) {
    FILE * in = fopen(fileName.c_str(), "rb");
    if (!in) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot open weight file %s for reading", fileName.c_str());
    fseek(in, 0, SEEK_END);
    long filesize = ftell(in);
    fseek(in, 0, SEEK_SET);
    if ((filesize < 0) || (filesize % sizeof(float))) {
        fclose(in);
        THROW_EXCEPTION_ARGS(StyleKitException, "Weight file %s does not contain 32-bit floats", fileName.c_str());
    }
    std::vector<float> data(filesize / sizeof(float));
    size_t read = fread(data.data(), sizeof(float), data.size(), in);
    fclose(in);
    if (read != data.size()) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Insufficient weight data supplied in file %s", fileName.c_str());
    }
    return data;
}


/**
 * @brief Split flat weight block into named per-layer parameters
 *
 * @throws StyleKitException if the network is not set up or the size does not match
 */
void WeightFileProvider::split(const float *data, size_t numFloats, NeuralNetwork& network) {
    if (!network.isSetup()) THROW_EXCEPTION_ARGS(StyleKitException, "Network %s must be set up to split weights", network.getName().c_str());
    size_t expected = network.parameterCount();
    if (expected != numFloats) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Network %s has %d parameters, weight data supplies %d", network.getName().c_str(), (int)expected, (int)numFloats);
    }
    size_t offset = 0;
    for (auto & entry : network.layers()) {
        if (auto * norm = std::get_if<cpu::InstanceNormLayer>(&entry.second)) {
            offset = take(norm->getName() + ".gamma", data, offset, norm->gamma().size(), numFloats);
            offset = take(norm->getName() + ".beta", data, offset, norm->beta().size(), numFloats);
        } else if (auto * cnorm = std::get_if<cpu::CondInstanceNormLayer>(&entry.second)) {
            offset = take(cnorm->getName() + ".gamma", data, offset, cnorm->gammaTable().size(), numFloats);
            offset = take(cnorm->getName() + ".beta", data, offset, cnorm->betaTable().size(), numFloats);
        }
    }
    SKLOGI("Loaded %d parameters for network %s", (int)offset, network.getName().c_str());
}


size_t WeightFileProvider::take(const std::string& name, const float *data, size_t offset, size_t count, size_t numFloats) {
    if (count == 0) return offset;
    if (offset + count > numFloats) THROW_EXCEPTION_ARGS(StyleKitException, "Weight data too short for %s", name.c_str());
    set(name, data + offset, count);
    return offset + count;
}

// vim: set expandtab ts=4 sw=4:
