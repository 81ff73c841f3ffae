//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Style Model with Fixed Output (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <vector>
#include <memory>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/base/graphmodel.h>
#include <stylekit/common/skexception.h>

//------------------------------------- Public Declarations ----------------------------------------

/**
 * @brief Style model that maps every style image to the same style weights
 *
 * Stands in for a style-prediction network in setups where the style is selected by hand. The
 * output is a (1, N) buffer holding the weights supplied at construction.
 */
class ConstantStyleModel : public stylekit::GraphModel {
 public:
    explicit ConstantStyleModel(const std::vector<float>& weights) : weights_(weights) {
        if (weights_.empty()) THROW_EXCEPTION_ARGS(stylekit::InvalidConfigException, "No style weights supplied");
    }

    std::unique_ptr<stylekit::cpu::CPUBuffer> predict(const std::vector<const stylekit::cpu::CPUBuffer *>& inputs) override {
        (void)inputs;
        return std::make_unique<stylekit::cpu::CPUBuffer>(stylekit::cpu::CPUBufferShape{1, (int)weights_.size()}, weights_.data());
    }

 private:
    std::vector<float> weights_;        //!< Style weights, one per style of the transform network
};

// vim: set expandtab ts=4 sw=4:
