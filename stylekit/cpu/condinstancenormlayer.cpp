//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Conditional Instance Normalization Layer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cmath>

//-------------------------------------- Project  Headers ------------------------------------------

#include "condinstancenormlayer.h"
#include "../common/logging.h"

namespace stylekit::cpu {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param builder Builder that carries the normalization options and the number of styles
 * @param layerNumber Number to be assigned to the layer
 *
 * @throws InvalidConfigException if the number of styles is not positive
 */
CondInstanceNormLayer::CondInstanceNormLayer(const CondInstanceNormLayerBuilder& builder, int layerNumber) :
      NormLayerBase(builder, layerNumber), styles_(builder.styles_) {
    if (styles_ < 1) THROW_EXCEPTION_ARGS(InvalidConfigException, "Layer %s: number of styles must be positive (got %d)", name_.c_str(), styles_);
    selector_.assign(styles_, 0.0f);
    selector_[0] = 1.0f;
}


/**
 * @brief Allocate parameter tables for a given input shape
 *
 * @param inputShape Shape of the input, the channel axis must have a known size
 *
 * @throws ShapeException if the channel dimension is out of range or unknown
 */
void CondInstanceNormLayer::build(const CPUBufferShape& inputShape) {
    channels_ = resolveChannels(inputShape);
    gamma_.clear();
    beta_.clear();
    if (scale_) gamma_.assign((size_t)styles_ * channels_, initialValue(gammaInit_));
    if (center_) beta_.assign((size_t)styles_ * channels_, initialValue(betaInit_));
    markBuilt(inputShape);
}


/**
 * @brief Load the parameter tables from a provider
 *
 * @param weights Provider that supplies \c <name>.gamma and/or \c <name>.beta with
 *                \c styles*channels elements
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the provider supplies tables with a mismatching size
 */
void CondInstanceNormLayer::loadParameters(const ParameterProvider * weights) {
    assertBuilt();
    if (!weights) return;
    if (scale_) loadTable(weights, "gamma", gamma_);
    if (center_) loadTable(weights, "beta", beta_);
}


/**
 * @brief Set style selector
 *
 * @param weights One weight per style
 * @param normalize If \c true, the weights are rescaled such that they sum up to one
 *
 * @throws ShapeException if the number of weights does not match the number of styles
 *
 * Without normalization the weights are used as they are, which also allows for extrapolation.
 */
void CondInstanceNormLayer::setStyleWeights(const std::vector<float>& weights, bool normalize) {
    checkSelector(weights);
    selector_ = weights;
    if (normalize) {
        double sum = 0.0;
        for (float w : selector_) sum += w;
        if (std::fabs(sum) > 0.0) {
            for (float & w : selector_) w = (float)(w / sum);
        } else {
            SKLOGW("Layer %s: style weights sum up to zero, cannot normalize", name_.c_str());
        }
    }
}


/**
 * @brief Replace scale table
 *
 * @param table Table with \c styles*channels entries (row-major, one row per style)
 *
 * @throws ShapeException if the size does not match or scaling is disabled
 */
void CondInstanceNormLayer::setGammaTable(const std::vector<float>& table) {
    assertBuilt();
    if ((!scale_) || (table.size() != gamma_.size())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: cannot set gamma table of size %d", name_.c_str(), (int)table.size());
    }
    gamma_ = table;
}


/**
 * @brief Replace shift table
 *
 * @param table Table with \c styles*channels entries (row-major, one row per style)
 *
 * @throws ShapeException if the size does not match or centering is disabled
 */
void CondInstanceNormLayer::setBetaTable(const std::vector<float>& table) {
    assertBuilt();
    if ((!center_) || (table.size() != beta_.size())) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: cannot set beta table of size %d", name_.c_str(), (int)table.size());
    }
    beta_ = table;
}


/**
 * @brief Normalize input tensor using the current style selector
 *
 * @param input Input tensor, must match the channel count that the layer was built for
 *
 * @return New tensor with the same shape as \p input
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the channel count does not match
 */
std::unique_ptr<CPUBuffer> CondInstanceNormLayer::forward(const CPUBuffer& input) const {
    return forward(input, selector_);
}


/**
 * @brief Normalize input tensor using the supplied style selector
 *
 * @param input Input tensor, must match the channel count that the layer was built for
 * @param styleWeights Selector to use for this call only, one weight per style
 *
 * @return New tensor with the same shape as \p input
 *
 * @throws StyleKitException if the layer has not been built
 * @throws ShapeException if the channel count or the selector length does not match
 */
std::unique_ptr<CPUBuffer> CondInstanceNormLayer::forward(const CPUBuffer& input, const std::vector<float>& styleWeights) const {
    checkInput(input);
    checkSelector(styleWeights);
    std::vector<float> gamma, beta;
    if (scale_) gamma = mixRows(gamma_, styleWeights, channels_);
    if (center_) beta = mixRows(beta_, styleWeights, channels_);
    return instanceNormalize(input, axis_, epsilon_,
                             (scale_) ? gamma.data() : nullptr,
                             (center_) ? beta.data() : nullptr);
}


/**
 * @brief Retrieve layer configuration
 *
 * @return JSON object with the instance normalization options plus \c style_num
 */
nlohmann::json CondInstanceNormLayer::getConfig() const {
    nlohmann::json cfg = normConfig();
    cfg["style_num"] = styles_;
    return cfg;
}


/**
 * @brief Get number of trainable parameters
 *
 * @return Number of float values in both tables
 */
size_t CondInstanceNormLayer::parameterCount() const {
    assertBuilt();
    return gamma_.size() + beta_.size();
}

/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Check selector length
 *
 * @throws ShapeException if the length does not match the number of styles
 */
void CondInstanceNormLayer::checkSelector(const std::vector<float>& weights) const {
    if ((int)weights.size() != styles_) {
        THROW_EXCEPTION_ARGS(ShapeException, "Layer %s: style selector has %d entries, expected %d", name_.c_str(), (int)weights.size(), styles_);
    }
}


/**
 * @brief Compute weighted combination of table rows (vector/matrix product)
 *
 * @param table Table with one row of \p channels entries per weight
 * @param weights Row weights
 * @param channels Row length
 *
 * @return Vector with \p channels entries
 */
std::vector<float> CondInstanceNormLayer::mixRows(const std::vector<float>& table, const std::vector<float>& weights, int channels) {
    std::vector<float> result(channels, 0.0f);
    for (size_t s=0; s < weights.size(); s++) {
        const float w = weights[s];
        if (w == 0.0f) continue;
        const float * row = table.data() + s * channels;
        for (int c=0; c < channels; c++) result[c] += w * row[c];
    }
    return result;
}

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
