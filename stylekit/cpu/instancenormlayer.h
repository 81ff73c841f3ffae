//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Layer (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include "normlayerbase.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Instance normalization layer (CPU-based)
 *
 * Standardizes each channel of each sample individually (in contrast to batch normalization, which
 * computes the statistics across the batch) and optionally applies a learned per-channel scale
 * (gamma) and shift (beta).
 *
 * The parameters are owned by the layer, they are allocated in build() from the configured
 * initializers and may be replaced by loadParameters(), which queries the provider for
 * \c <name>.gamma and \c <name>.beta with \c C elements each.
 *
 * @see instanceNormalize()
 */
class InstanceNormLayer : public NormLayerBase {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    InstanceNormLayer(const InstanceNormLayerBuilder& builder, int layerNumber);

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    void build(const CPUBufferShape& inputShape);
    void loadParameters(const ParameterProvider * weights);
    void setGamma(const std::vector<float>& gamma);
    void setBeta(const std::vector<float>& beta);
    [[nodiscard]] std::unique_ptr<CPUBuffer> forward(const CPUBuffer& input) const;
    [[nodiscard]] nlohmann::json getConfig() const;
    [[nodiscard]] size_t parameterCount() const;

    /**
     * @brief Get scale vector
     *
     * @return Vector with one entry per channel, empty if scaling is disabled or the layer was not
     *         built yet
     */
    [[nodiscard]] const std::vector<float>& gamma() const {
        return gamma_;
    }

    /**
     * @brief Get shift vector
     *
     * @return Vector with one entry per channel, empty if centering is disabled or the layer was
     *         not built yet
     */
    [[nodiscard]] const std::vector<float>& beta() const {
        return beta_;
    }

 private:
    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::vector<float> gamma_;      //!< Per-channel scale
    std::vector<float> beta_;       //!< Per-channel shift
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
