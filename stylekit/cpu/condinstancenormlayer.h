//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Conditional Instance Normalization Layer (Header)
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
 * @brief Conditional instance normalization layer (CPU-based)
 *
 * Works like InstanceNormLayer, but instead of a single gamma/beta pair, this layer stores a table
 * with one row per style for each of them, i.e. two tables of shape (styles, channels). A style
 * selector (a vector with one weight per style) determines the effective parameters as weighted
 * combination of the table rows:
 *
 * @code
 * gamma_eff[c] = sum_s selector[s] * gamma[s][c]
 * beta_eff[c]  = sum_s selector[s] * beta[s][c]
 * @endcode
 *
 * A one-hot selector therefore picks the parameters of a single style, which allows one network to
 * represent multiple styles and to interpolate between them. The default selector picks the first
 * style exclusively.
 *
 * The tables are queried from parameter providers as \c <name>.gamma and \c <name>.beta with
 * \c styles*C elements each (row-major).
 */
class CondInstanceNormLayer : public NormLayerBase {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    CondInstanceNormLayer(const CondInstanceNormLayerBuilder& builder, int layerNumber);

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    void build(const CPUBufferShape& inputShape);
    void loadParameters(const ParameterProvider * weights);
    void setStyleWeights(const std::vector<float>& weights, bool normalize = false);
    void setGammaTable(const std::vector<float>& table);
    void setBetaTable(const std::vector<float>& table);
    [[nodiscard]] std::unique_ptr<CPUBuffer> forward(const CPUBuffer& input) const;
    [[nodiscard]] std::unique_ptr<CPUBuffer> forward(const CPUBuffer& input, const std::vector<float>& styleWeights) const;
    [[nodiscard]] nlohmann::json getConfig() const;
    [[nodiscard]] size_t parameterCount() const;

    [[nodiscard]] int styles() const {
        return styles_;
    }

    [[nodiscard]] const std::vector<float>& styleWeights() const {
        return selector_;
    }

    [[nodiscard]] const std::vector<float>& gammaTable() const {
        return gamma_;
    }

    [[nodiscard]] const std::vector<float>& betaTable() const {
        return beta_;
    }

 private:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    void checkSelector(const std::vector<float>& weights) const;
    static std::vector<float> mixRows(const std::vector<float>& table, const std::vector<float>& weights, int channels);

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    int styles_ = 1;                    //!< Number of styles (rows in the tables)
    std::vector<float> selector_;       //!< Current style selector
    std::vector<float> gamma_;          //!< Scale table (styles x channels)
    std::vector<float> beta_;           //!< Shift table (styles x channels)
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
