//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Deprocessing Layer Builder (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Templatized anchor for deprocessing layer builders
 *
 * @see DeprocessLayerBuilder
 */
template<typename D>
struct DeprocessLayerBuilderTempl : LayerBuilderTempl<D> {

    explicit DeprocessLayerBuilderTempl(const std::string& name) : LayerBuilderTempl<D>(name, LayerType::DEPROCESS) {
    }

    /**
     * @brief Set activation of the preceding layer that is to be undone
     *
     * @param act Activation type (default: ActType::SIGMOID)
     *
     * @return Reference to builder object
     */
    D & activation(ActType act) {
        act_ = act;
        return *(D *)this;
    }

    ActType act_ = ActType::SIGMOID;        //!< Activation of the preceding layer
};


/**
 * @brief Deprocessing layer builder
 *
 * This builder is used to create layers that map the output of a stylization network back to
 * pixel range.
 */
struct DeprocessLayerBuilder : DeprocessLayerBuilderTempl<DeprocessLayerBuilder> {
    explicit DeprocessLayerBuilder(const std::string& name) : DeprocessLayerBuilderTempl<DeprocessLayerBuilder>(name) {}
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
