//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Deprocessing Layer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "deprocesslayer.h"
#include "../base/layerconfig.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param builder Builder that carries the activation type
 * @param layerNumber Number to be assigned to the layer
 *
 * @throws InvalidConfigException if the builder carries an unsupported activation
 */
DeprocessLayer::DeprocessLayer(const DeprocessLayerBuilder& builder, int layerNumber) :
      LayerBase(builder, layerNumber), act_(builder.act_) {
    if ((act_ != ActType::SIGMOID) && (act_ != ActType::TANH)) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Layer %s: unsupported activation %d", name_.c_str(), (int)act_);
    }
}


/**
 * @brief Prepare layer for a given input shape
 *
 * @param inputShape Shape of the input tensor
 *
 * The layer has no parameters, any shape is accepted.
 */
void DeprocessLayer::build(const CPUBufferShape& inputShape) {
    markBuilt(inputShape);
}


/**
 * @brief Map input tensor to pixel range
 *
 * @param input Input tensor
 *
 * @return New tensor with the same shape as \p input
 *
 * @see deprocessImage()
 */
std::unique_ptr<CPUBuffer> DeprocessLayer::forward(const CPUBuffer& input) const {
    return deprocessImage(input, act_);
}


/**
 * @brief Retrieve layer configuration
 *
 * @return JSON object with the options \c name and \c activation
 */
nlohmann::json DeprocessLayer::getConfig() const {
    nlohmann::json cfg;
    cfg["name"] = name_;
    cfg["activation"] = activationName(act_);
    return cfg;
}


/**
 * @brief Map activations of a stylization network to pixel range
 *
 * @param input Input tensor of arbitrary shape
 * @param activation Activation of the layer that produced \p input
 *
 * @return New tensor with the same shape as \p input, either a copy (ActType::SIGMOID) or the
 *         data mapped by <tt>(x+1)*127.5</tt> (ActType::TANH)
 *
 * @throws InvalidConfigException on unsupported activation types
 */
std::unique_ptr<CPUBuffer> deprocessImage(const CPUBuffer& input, ActType activation) {
    switch (activation) {
        case ActType::SIGMOID:
            return input.copy();
        case ActType::TANH: {
            auto output = std::make_unique<CPUBuffer>(input.shape());
            ReadMapping src(input);
            WriteMapping tgt(*output);
            size_t num = input.elements();
            for (size_t i=0; i < num; i++) tgt.data()[i] = (src.data()[i] + 1.0f) * 127.5f;
            return output;
        }
    }
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unsupported deprocessing activation %d", (int)activation);
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
