//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Base (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../common/skexception.h"
#include "../cpu/cpubuffershape.h"
#include "parameterprovider.h"
#include "layerbuilder.h"
#include "layerflags.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Common state of all network layers
 *
 * This class keeps track of the information that every layer carries: its name, its number (which
 * defines the execution order inside a network), its type and the input shape it was built for.
 *
 * Layers are not used polymorphically. The concrete layer classes derive from this class to share
 * the bookkeeping, but they are stored and invoked through the cpu::CPULayer variant, which is why
 * there are no virtual functions here and the destructor is not public.
 *
 * The lifecycle of a layer follows these steps:
 *  1. Construction from a builder (via the LayerFactory)
 *  2. A call to \c build() with the (possibly partially known) input shape, which allocates weights
 *  3. An optional call to \c loadParameters() to replace the initial weights
 *  4. Any number of \c forward() calls
 */
class LayerBase {
 public:
    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------

    /**
     * @brief Retrieve layer number
     *
     * @return Layer number, layers in a network are executed in ascending order of this number
     */
    [[nodiscard]] inline int getNumber() const {
        return layerNumber_;
    }

    /**
     * @brief Retrieve layer name
     *
     * @return Layer name
     */
    [[nodiscard]] inline const std::string& getName() const {
        return name_;
    }

    /**
     * @brief Retrieve layer type
     *
     * @return Type of the layer
     */
    [[nodiscard]] inline LayerType getType() const {
        return type_;
    }

    [[nodiscard]] const char * getClassName() const;

    /**
     * @brief Check if layer has been built
     *
     * @retval true if build() was successfully called on the layer
     * @retval false otherwise
     */
    [[nodiscard]] inline bool isBuilt() const {
        return built_;
    }

    /**
     * @brief Retrieve shape that was supplied to build()
     *
     * @return Input shape (may contain unknown dimensions), empty if the layer was not built
     */
    [[nodiscard]] inline const cpu::CPUBufferShape& getInputShape() const {
        return inputShape_;
    }

 protected:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    LayerBase(const LayerBuilderBase& builder, int layerNumber);
    LayerBase(const LayerBase&) = default;
    LayerBase(LayerBase&&) = default;
    LayerBase& operator=(const LayerBase&) = default;
    LayerBase& operator=(LayerBase&&) = default;
    ~LayerBase() = default;

    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    void markBuilt(const cpu::CPUBufferShape& inputShape);
    void assertBuilt() const;

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::string name_;                          //!< Layer identifier
    int layerNumber_ = -1;                      //!< Layer number
    LayerType type_ = LayerType::ILLEGAL;       //!< Layer type
    cpu::CPUBufferShape inputShape_;            //!< Input shape as supplied to build()
    bool built_ = false;                        //!< Indicator that build() was performed
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
