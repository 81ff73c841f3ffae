//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Base (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/layerbase.h"
#include "cpubuffer.h"
#include "instancenormlayerbuilder.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit::cpu {

/**
 * @brief Shared state and helpers for the instance normalization layers
 *
 * Keeps the options that are common to InstanceNormLayer and CondInstanceNormLayer and provides
 * the build-time resolution of the channel count as well as the common part of the configuration.
 */
class NormLayerBase : public LayerBase {
 public:
    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------

    /**
     * @brief Compute shape of the output tensor
     *
     * @param inputShape Input shape
     *
     * @return Same as \p inputShape, normalization does not change the shape
     */
    [[nodiscard]] CPUBufferShape computeOutputShape(const CPUBufferShape& inputShape) const {
        return inputShape;
    }

    [[nodiscard]] int axis() const {
        return axis_;
    }

    [[nodiscard]] float epsilon() const {
        return epsilon_;
    }

    [[nodiscard]] bool hasCenter() const {
        return center_;
    }

    [[nodiscard]] bool hasScale() const {
        return scale_;
    }

    [[nodiscard]] Initializer betaInitializer() const {
        return betaInit_;
    }

    [[nodiscard]] Initializer gammaInitializer() const {
        return gammaInit_;
    }

    /**
     * @brief Get number of channels the layer was built for
     *
     * @return Channel count, 0 if the layer was not built yet
     */
    [[nodiscard]] int channels() const {
        return channels_;
    }

 protected:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    template<typename D>
    NormLayerBase(const InstanceNormLayerBuilderTempl<D>& builder, int layerNumber) :
          LayerBase(builder, layerNumber), axis_(builder.axis_), epsilon_(builder.epsilon_),
          center_(builder.center_), scale_(builder.scale_),
          betaInit_(builder.betaInit_), gammaInit_(builder.gammaInit_) {
        if (epsilon_ < 0.0f) THROW_EXCEPTION_ARGS(InvalidConfigException, "Layer %s has negative epsilon", name_.c_str());
    }

    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    int resolveChannels(const CPUBufferShape& inputShape) const;
    void checkInput(const CPUBuffer& input) const;
    void loadTable(const ParameterProvider * weights, const char *suffix, std::vector<float>& target) const;
    [[nodiscard]] nlohmann::json normConfig() const;
    static float initialValue(Initializer init);

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    int axis_ = -1;                             //!< Channel axis (may be negative)
    float epsilon_ = 1e-3f;                     //!< Added to the standard deviation
    bool center_ = true;                        //!< Add beta after normalization
    bool scale_ = true;                         //!< Multiply by gamma after normalization
    Initializer betaInit_ = Initializer::ZEROS; //!< Initial value for beta
    Initializer gammaInit_ = Initializer::ONES; //!< Initial value for gamma
    int channels_ = 0;                          //!< Channel count, set in build()
};


std::unique_ptr<CPUBuffer> instanceNormalize(const CPUBuffer& input, int axis, float epsilon,
                                             const float *gamma = nullptr, const float *beta = nullptr);

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
