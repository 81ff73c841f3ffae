//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Layer Builders (Header)
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
 * @brief Templatized anchor for instance normalization layer builders
 *
 * Carries the options shared by the plain and the conditional instance normalization.
 *
 * @see InstanceNormLayerBuilder, CondInstanceNormLayerBuilder
 */
template<typename D>
struct InstanceNormLayerBuilderTempl : LayerBuilderTempl<D> {

    /**
     * @brief Constructor
     *
     * @param name Name to be assigned to the layer when built
     * @param type Layer type, either LayerType::INSTANCENORM or LayerType::CONDINSTANCENORM
     */
    InstanceNormLayerBuilderTempl(const std::string& name, LayerType type) : LayerBuilderTempl<D>(name, type) {
    }

    /**
     * @brief Set channel axis
     *
     * @param ax Index of the channel axis, negative values count from the end (default: -1)
     *
     * @return Reference to builder object
     */
    D & axis(int ax) {
        axis_ = ax;
        return *(D *)this;
    }

    /**
     * @brief Set value that is added to the standard deviation before dividing by it
     *
     * @param eps Epsilon value (default: 1e-3)
     *
     * @return Reference to builder object
     *
     * @throws InvalidConfigException if \p eps is negative
     */
    D & epsilon(float eps) {
        if (eps < 0.0f) THROW_EXCEPTION_ARGS(InvalidConfigException, "Negative epsilon %f", (double)eps);
        epsilon_ = eps;
        return *(D *)this;
    }

    /**
     * @brief Enable/disable the additive (beta) part of the affine transform
     *
     * @param enable Set to \c false to skip adding beta
     *
     * @return Reference to builder object
     */
    D & center(bool enable) {
        center_ = enable;
        return *(D *)this;
    }

    /**
     * @brief Enable/disable the multiplicative (gamma) part of the affine transform
     *
     * @param enable Set to \c false to skip multiplying by gamma
     *
     * @return Reference to builder object
     */
    D & scale(bool enable) {
        scale_ = enable;
        return *(D *)this;
    }

    D & betaInitializer(Initializer init) {
        betaInit_ = init;
        return *(D *)this;
    }

    D & gammaInitializer(Initializer init) {
        gammaInit_ = init;
        return *(D *)this;
    }

    int axis_ = -1;                             //!< Channel axis
    float epsilon_ = 1e-3f;                     //!< Added to the standard deviation
    bool center_ = true;                        //!< Add beta
    bool scale_ = true;                         //!< Multiply by gamma
    Initializer betaInit_ = Initializer::ZEROS; //!< Initial value for beta
    Initializer gammaInit_ = Initializer::ONES; //!< Initial value for gamma
};


/**
 * @brief Instance normalization layer builder
 */
struct InstanceNormLayerBuilder : InstanceNormLayerBuilderTempl<InstanceNormLayerBuilder> {
    explicit InstanceNormLayerBuilder(const std::string& name) :
        InstanceNormLayerBuilderTempl<InstanceNormLayerBuilder>(name, LayerType::INSTANCENORM) {}
};


/**
 * @brief Conditional instance normalization layer builder
 *
 * In addition to the instance normalization options, this builder carries the number of styles,
 * which is the number of rows in the gamma and beta tables of the layer.
 */
struct CondInstanceNormLayerBuilder : InstanceNormLayerBuilderTempl<CondInstanceNormLayerBuilder> {
    explicit CondInstanceNormLayerBuilder(const std::string& name) :
        InstanceNormLayerBuilderTempl<CondInstanceNormLayerBuilder>(name, LayerType::CONDINSTANCENORM) {}

    /**
     * @brief Set number of styles
     *
     * @param num Number of styles (rows in the parameter tables), must be positive
     *
     * @return Reference to builder object
     *
     * @throws InvalidConfigException if \p num is smaller than 1
     */
    CondInstanceNormLayerBuilder & styles(int num) {
        if (num < 1) THROW_EXCEPTION_ARGS(InvalidConfigException, "Number of styles must be positive (got %d)", num);
        styles_ = num;
        return *this;
    }

    int styles_ = 1;                            //!< Number of styles
};

} // stylekit::cpu namespace

// vim: set expandtab ts=4 sw=4:
