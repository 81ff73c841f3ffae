//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Layer Variant
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <type_traits>

//-------------------------------------- Project  Headers ------------------------------------------

#include "cpulayer.h"
#include "../base/layerconfig.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

template<typename T>
constexpr bool has_parameters = std::is_same_v<T, InstanceNormLayer> || std::is_same_v<T, CondInstanceNormLayer>;

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Access the common layer information
 *
 * @param layer Layer to access
 *
 * @return Reference to the LayerBase part of the layer (name, number, type, build state)
 */
const LayerBase & layerBase(const CPULayer& layer) {
    return std::visit([](const auto& lyr) -> const LayerBase& { return lyr; }, layer);
}


/**
 * @brief Build a layer for a given input shape
 *
 * @param layer Layer to build
 * @param inputShape Shape of the input, may contain unknown dimensions where the layer permits
 *
 * @throws ShapeException, InvalidPaddingException depending on the layer type
 */
void buildLayer(CPULayer& layer, const CPUBufferShape& inputShape) {
    std::visit([&](auto& lyr) { lyr.build(inputShape); }, layer);
}


/**
 * @brief Load parameters into a layer
 *
 * @param layer Layer to load the parameters into, must have been built
 * @param weights Parameter provider
 *
 * Layers without parameters ignore this call.
 */
void loadLayerParameters(CPULayer& layer, const ParameterProvider * weights) {
    std::visit([&](auto& lyr) {
        using T = std::decay_t<decltype(lyr)>;
        if constexpr (has_parameters<T>) lyr.loadParameters(weights);
    }, layer);
}


/**
 * @brief Compute the output shape of a layer
 *
 * @param layer Layer to query
 * @param inputShape Input shape, may contain unknown dimensions
 *
 * @return Output shape
 */
CPUBufferShape layerOutputShape(const CPULayer& layer, const CPUBufferShape& inputShape) {
    return std::visit([&](const auto& lyr) { return lyr.computeOutputShape(inputShape); }, layer);
}


/**
 * @brief Run the forward pass of a layer
 *
 * @param layer Layer to execute
 * @param input Input tensor
 * @param styleWeights Optional style selector, only used by conditional instance normalization
 *                     layers, which use their own selector if this is \c nullptr
 *
 * @return New tensor with the result
 */
std::unique_ptr<CPUBuffer> forwardLayer(const CPULayer& layer, const CPUBuffer& input, const std::vector<float> * styleWeights) {
    return std::visit([&](const auto& lyr) -> std::unique_ptr<CPUBuffer> {
        using T = std::decay_t<decltype(lyr)>;
        if constexpr (std::is_same_v<T, CondInstanceNormLayer>) {
            if (styleWeights) return lyr.forward(input, *styleWeights);
        }
        return lyr.forward(input);
    }, layer);
}


/**
 * @brief Generate class-name tagged configuration record for a layer
 *
 * @param layer Layer to serialize
 *
 * @return JSON object of the form <tt>{"class_name": ..., "config": {...}}</tt>
 */
nlohmann::json layerRecord(const CPULayer& layer) {
    return std::visit([](const auto& lyr) {
        return makeLayerRecord(lyr.getType(), lyr.getConfig());
    }, layer);
}


/**
 * @brief Get number of parameters of a layer
 *
 * @param layer Layer to query, must have been built if it has parameters
 *
 * @return Number of float parameters, 0 for layers without parameters
 */
size_t layerParameterCount(const CPULayer& layer) {
    return std::visit([](const auto& lyr) -> size_t {
        using T = std::decay_t<decltype(lyr)>;
        if constexpr (has_parameters<T>) return lyr.parameterCount();
        else return 0;
    }, layer);
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
