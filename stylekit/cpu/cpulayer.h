//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Layer Variant (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "reflectionpadlayer.h"
#include "instancenormlayer.h"
#include "condinstancenormlayer.h"
#include "deprocesslayer.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Closed set of layer kinds that StyleKit supports
 *
 * Layers are stored as values of this variant and are invoked through the free functions below,
 * each of which dispatches with a single \c std::visit. There is no virtual dispatch on layers.
 */
using CPULayer = std::variant<ReflectionPadLayer, InstanceNormLayer, CondInstanceNormLayer, DeprocessLayer>;

[[nodiscard]] const LayerBase & layerBase(const CPULayer& layer);
void buildLayer(CPULayer& layer, const CPUBufferShape& inputShape);
void loadLayerParameters(CPULayer& layer, const ParameterProvider * weights);
[[nodiscard]] CPUBufferShape layerOutputShape(const CPULayer& layer, const CPUBufferShape& inputShape);
[[nodiscard]] std::unique_ptr<CPUBuffer> forwardLayer(const CPULayer& layer, const CPUBuffer& input,
                                                      const std::vector<float> * styleWeights = nullptr);
[[nodiscard]] nlohmann::json layerRecord(const CPULayer& layer);
[[nodiscard]] size_t layerParameterCount(const CPULayer& layer);

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
