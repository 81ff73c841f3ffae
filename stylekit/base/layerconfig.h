//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Configuration Records (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "layerflags.h"
#include "layerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Padding amounts as parsed from a configuration record
 */
struct PaddingSpec {
    int top = 1;        //!< Rows added on top
    int bottom = 1;     //!< Rows added at the bottom
    int left = 1;       //!< Columns added on the left
    int right = 1;      //!< Columns added on the right
};

[[nodiscard]] const char * dimOrderingName(DimOrdering order);
[[nodiscard]] DimOrdering dimOrderingFromName(const std::string& name);
[[nodiscard]] const char * activationName(ActType act);
[[nodiscard]] ActType activationFromName(const std::string& name);
[[nodiscard]] nlohmann::json initializerConfig(Initializer init);
[[nodiscard]] Initializer initializerFromConfig(const nlohmann::json& cfg);
[[nodiscard]] PaddingSpec paddingFromConfig(const nlohmann::json& cfg);
[[nodiscard]] const char * layerClassName(LayerType type);
[[nodiscard]] LayerType layerTypeFromClassName(const std::string& name);
[[nodiscard]] nlohmann::json makeLayerRecord(LayerType type, const nlohmann::json& config);
[[nodiscard]] std::unique_ptr<LayerBuilderBase> builderFromRecord(const nlohmann::json& record, int layerNumber);

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
