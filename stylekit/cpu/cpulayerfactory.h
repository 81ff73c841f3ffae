//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Layer Factory Backend (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerfactory.h"
#include "reflectionpadlayerbuilder.h"
#include "instancenormlayerbuilder.h"
#include "deprocesslayerbuilder.h"

namespace stylekit::cpu {
//------------------------------------- Public Declarations ----------------------------------------

/**
 * @brief Producer backend for CPU-based network layers
 *
 * Translates builders into the matching alternative of the CPULayer variant.
 */
class CPULayerFactoryBackend : public LayerFactoryBackend {
    friend class stylekit::LayerFactory;
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    CPULayerFactoryBackend() = default;

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    std::string getName() const override;
    CPULayer createLayer(LayerType type, const LayerBuilderBase& builder, int layerNumber) override;

 protected:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    template<typename B>
    static const B & concrete(const LayerBuilderBase& builder);
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
