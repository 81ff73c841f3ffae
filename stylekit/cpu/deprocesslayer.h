//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Deprocessing Layer (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerbase.h"
#include "cpubuffer.h"
#include "deprocesslayerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Maps the activations of a stylization network back to pixel range
 *
 * The mapping depends on the activation function of the preceding layer:
 *   - ActType::SIGMOID leaves the data untouched, as the network already produced pixel values
 *   - ActType::TANH maps the range [-1,1] to [0,255] by computing <tt>(x+1)*127.5</tt>
 */
class DeprocessLayer : public LayerBase {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    DeprocessLayer(const DeprocessLayerBuilder& builder, int layerNumber);

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    void build(const CPUBufferShape& inputShape);
    [[nodiscard]] std::unique_ptr<CPUBuffer> forward(const CPUBuffer& input) const;
    [[nodiscard]] nlohmann::json getConfig() const;

    [[nodiscard]] CPUBufferShape computeOutputShape(const CPUBufferShape& inputShape) const {
        return inputShape;
    }

    [[nodiscard]] ActType activation() const {
        return act_;
    }

 private:
    ActType act_ = ActType::SIGMOID;        //!< Activation of the preceding layer
};


std::unique_ptr<CPUBuffer> deprocessImage(const CPUBuffer& input, ActType activation);

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
