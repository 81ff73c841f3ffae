//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Builder Base (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <memory>
#include <cstdint>

//-------------------------------------- Project  Headers ------------------------------------------

#include "layerflags.h"
#include "../common/skexception.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

class LayerFactory;
struct LayerBuilderBase;

namespace builder_internal {
    void push(LayerFactory * factory, LayerBuilderBase * builder);
}

/**
 * @brief Non-templated root of all layer builders
 *
 * Stores the parameters that every layer has, regardless of its type. The LayerFactory keeps
 * pointers to this type and recovers the concrete builder based on the #type_ field.
 */
struct LayerBuilderBase {
    explicit LayerBuilderBase(const std::string& name, LayerType type) : name_(name), type_(type) {
    }

    virtual ~LayerBuilderBase() = default;

    std::string name_;                      //!< Layer name
    int number_ = -1;                       //!< Layer number (execution order)
    LayerType type_ = LayerType::ILLEGAL;   //!< Layer type, set by the concrete builder
};


/**
 * @brief Templatized anchor for layer builders
 *
 * In order to facilitate the creation of network layers, StyleKit uses a builder pattern which
 * aggregates all parameters in a convenient and flexible way. Once a builder has been fully
 * parameterized, it can be pushed to a LayerFactory instance, which then compiles the supplied
 * builders into layers.
 *
 * The template parameter \p D is the concrete builder type, which allows the setters to return a
 * reference to the most-derived builder for chaining:
 *
 * @code
 * auto * pad = new cpu::ReflectionPadLayerBuilder("pad1");
 * pad->padding(2).number(1).push(factory);
 * @endcode
 */
template<typename D>
struct LayerBuilderTempl : LayerBuilderBase {

    LayerBuilderTempl(const std::string & name, LayerType type) : LayerBuilderBase(name, type) {
    }

    /**
     * @brief Push this builder to a LayerFactory for later compilation
     *
     * @param factory Shared pointer where this builder should be pushed/appended to
     *
     * @pre The builder must have been allocated with \c new, ownership is transferred to the
     *      factory
     *
     * @see LayerFactory::pushBuilder()
     */
    void push(std::shared_ptr<LayerFactory> & factory) {
        builder_internal::push(factory.get(), this);
    }

    /**
     * @brief Set layer number in builder object
     *
     * @param no Layer number, layers are executed in ascending number order
     *
     * @return Reference to builder object
     */
    D & number(int no) {
        if (no < 0) THROW_EXCEPTION_ARGS(StyleKitException, "Illegal layer number %d", no);
        number_ = no;
        return *(D *)this;
    }

    /**
     * @brief Set layer name in builder object
     *
     * @param name Name of the layer, also used as prefix for the parameter names
     *
     * @return Reference to builder object
     */
    D & name(const std::string& name) {
        name_ = name;
        return *(D *)this;
    }
};

} // stylekit namespace


// vim: set expandtab ts=4 sw=4:
