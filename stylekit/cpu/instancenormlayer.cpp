//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Layer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "instancenormlayer.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param builder Builder that carries the normalization options
 * @param layerNumber Number to be assigned to the layer
 */
InstanceNormLayer::InstanceNormLayer(const InstanceNormLayerBuilder& builder, int layerNumber) :
      NormLayerBase(builder, layerNumber) {
}


/**
 * @brief Allocate parameters for a given input shape
 *
 * @param inputShape Shape of the input, the channel axis must have a known size
 *
 * @throws ShapeException if the channel dimension is out of range or unknown
 */
void InstanceNormLayer::build(const CPUBufferShape& inputShape) {
    channels_ = resolveChannels(inputShape);
    gamma_.clear();
    beta_.clear();
    if (scale_) gamma_.assign(channels_, initialValue(gammaInit_));
    if (center_) beta_.assign(channels_, initialValue(betaInit_));
    markBuilt(inputShape);
}


/**
 * @brief Load gamma/beta from a parameter provider
 *
 * @param weights Provider that supplies \c <name>.gamma and/or \c <name>.beta
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the provider supplies parameters with a mismatching size
 */
void InstanceNormLayer::loadParameters(const ParameterProvider * weights) {
    assertBuilt();
    if (!weights) return;
    if (scale_) loadTable(weights, "gamma", gamma_);
    if (center_) loadTable(weights, "beta", beta_);
}


/**
 * @brief Replace scale vector
 *
 * @param gamma New scale vector with one entry per channel
 *
 * @throws ShapeException if the size does not match the channel count or scaling is disabled
 */
void InstanceNormLayer::setGamma(const std::vector<float>& gamma) {
    assertBuilt();
    if ((!scale_) || (gamma.size() != gamma_.size())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: cannot set gamma of size %d", name_.c_str(), (int)gamma.size());
    }
    gamma_ = gamma;
}


/**
 * @brief Replace shift vector
 *
 * @param beta New shift vector with one entry per channel
 *
 * @throws ShapeException if the size does not match the channel count or centering is disabled
 */
void InstanceNormLayer::setBeta(const std::vector<float>& beta) {
    assertBuilt();
    if ((!center_) || (beta.size() != beta_.size())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: cannot set beta of size %d", name_.c_str(), (int)beta.size());
    }
    beta_ = beta;
}


/**
 * @brief Normalize input tensor
 *
 * @param input Input tensor, must match the channel count that the layer was built for
 *
 * @return New tensor with the same shape as \p input
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the channel count does not match
 */
std::unique_ptr<CPUBuffer> InstanceNormLayer::forward(const CPUBuffer& input) const {
    checkInput(input);
    return instanceNormalize(input, axis_, epsilon_,
                             (scale_) ? gamma_.data() : nullptr,
                             (center_) ? beta_.data() : nullptr);
}


/**
 * @brief Retrieve layer configuration
 *
 * @return JSON object with the instance normalization options
 */
nlohmann::json InstanceNormLayer::getConfig() const {
    return normConfig();
}


/**
 * @brief Get number of trainable parameters
 *
 * @return Number of float values in gamma and beta
 */
size_t InstanceNormLayer::parameterCount() const {
    assertBuilt();
    return gamma_.size() + beta_.size();
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
