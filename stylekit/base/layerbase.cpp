//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Base
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------


//-------------------------------------- Project  Headers ------------------------------------------

#include "layerbase.h"
#include "../common/logging.h"
#include "layerconfig.h"

namespace stylekit {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Retrieve the registered class name of the layer
 *
 * @return Class name under which the layer is serialized, e.g. \c "InstanceNormalization"
 */
const char * LayerBase::getClassName() const {
    return layerClassName(type_);
}

/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param builder Builder that carries the basic layer information
 * @param layerNumber Number to assign to the layer
 *
 * The provided \p layerNumber is important for the order of execution of the layers, as they are
 * executed sequentially based on that number. Clashes are detected by the LayerFactory.
 */
LayerBase::LayerBase(const LayerBuilderBase& builder, int layerNumber) :
      name_(builder.name_), layerNumber_(layerNumber), type_(builder.type_) {
}


/**
 * @brief Record that the layer was built for a given input shape
 *
 * @param inputShape Shape that was supplied to build()
 */
void LayerBase::markBuilt(const cpu::CPUBufferShape& inputShape) {
    inputShape_ = inputShape;
    built_ = true;
    SKLOGD("Built layer %s (#%d) for input %s", name_.c_str(), layerNumber_, inputShape.toString().c_str());
}


/**
 * @brief Make sure that the layer was built before using it
 *
 * @throws StyleKitException if build() has not been called
 */
void LayerBase::assertBuilt() const {
    if (!built_) THROW_EXCEPTION_ARGS(StyleKitException, "Layer %s has not been built", name_.c_str());
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
