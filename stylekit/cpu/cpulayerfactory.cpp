//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Layer Factory Backend
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

//-------------------------------------- Project  Headers ------------------------------------------

#include "cpulayerfactory.h"

//-------------------------------------- Global Variables ------------------------------------------


namespace stylekit::cpu {

//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Get name/identifier of factory backend
 *
 * @return "CPU" string
 */
std::string CPULayerFactoryBackend::getName() const {
    static std::string name("CPU");
    return name;
}


/**
 * @brief Create layer that executes on the CPU
 *
 * @param type Layer type to create
 * @param builder Builder that contains the parameters for the layer
 * @param layerNumber Number to assign to the layer (layers are executed in ascending number order)
 *
 * @return Created layer
 *
 * @throws StyleKitException in case there was a problem with the layer creation
 */
CPULayer CPULayerFactoryBackend::createLayer(LayerType type, const LayerBuilderBase& builder, int layerNumber) {
    switch (type) {
        case LayerType::REFLECTIONPAD2D:
            return ReflectionPadLayer(concrete<ReflectionPadLayerBuilder>(builder), layerNumber);
        case LayerType::INSTANCENORM:
            return InstanceNormLayer(concrete<InstanceNormLayerBuilder>(builder), layerNumber);
        case LayerType::CONDINSTANCENORM:
            return CondInstanceNormLayer(concrete<CondInstanceNormLayerBuilder>(builder), layerNumber);
        case LayerType::DEPROCESS:
            return DeprocessLayer(concrete<DeprocessLayerBuilder>(builder), layerNumber);
        default:
            THROW_EXCEPTION_ARGS(StyleKitException, "Unsupported layer type %d", (int)type);
    }
}


/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Recover concrete builder type
 *
 * @param builder Builder as stored in the factory
 *
 * @return Reference to the concrete builder
 *
 * @throws StyleKitException if the builder does not match its declared layer type
 */
template<typename B>
const B & CPULayerFactoryBackend::concrete(const LayerBuilderBase& builder) {
    const B * bld = dynamic_cast<const B *>(&builder);
    if (!bld) THROW_EXCEPTION_ARGS(StyleKitException, "Builder %s does not match layer type %d", builder.name_.c_str(), (int)builder.type_);
    return *bld;
}

} // stylekit::cpu namespace


// vim: set expandtab ts=4 sw=4:
