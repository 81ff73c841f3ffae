//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Graph Model Interface (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../cpu/cpubuffer.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Interface for models that map a list of input tensors to a single output tensor
 *
 * This is the interface that the style transfer uses to talk to its style-prediction and
 * transformation models. StyleKit ships one implementation (NeuralNetwork), other implementations
 * may wrap any inference engine that is capable of running the convolutional parts of the models.
 */
class GraphModel {
 public:
    virtual ~GraphModel() = default;

    /**
     * @brief Run inference on the model
     *
     * @param inputs List of input tensors, the meaning of each entry is model-specific
     *
     * @return New tensor with the model output
     */
    virtual std::unique_ptr<cpu::CPUBuffer> predict(const std::vector<const cpu::CPUBuffer *>& inputs) = 0;
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
