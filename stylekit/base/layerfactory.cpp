//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Factory
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

//-------------------------------------- Project  Headers ------------------------------------------

#include "layerfactory.h"
#include "../cpu/cpulayerfactory.h"
#include "../common/logging.h"

//-------------------------------------- Global Variables ------------------------------------------


namespace stylekit {

//-------------------------------------- Local Definitions -----------------------------------------

namespace builder_internal {

/**
 * @brief Forward a builder from LayerBuilderTempl::push() to a factory
 *
 * @param factory Factory to push to
 * @param builder Builder to push, ownership is transferred to the factory
 */
void push(LayerFactory * factory, LayerBuilderBase * builder) {
    if (!factory) {
        delete builder;
        THROW_EXCEPTION_ARGS(StyleKitException, "Cannot push builder to null factory");
    }
    factory->pushBuilder(builder);
}

} // builder_internal namespace

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Destructor
 *
 * Deallocates the backend and all builders. Layers that were compiled by this factory stay valid.
 */
LayerFactory::~LayerFactory() {
    delete backend_;
    backend_ = nullptr;
    builders_.clear();
}


/**
 * @brief Get name of layer factory (for debug / logging purposes)
 *
 * @return String with the name of the factory backend
 */
std::string LayerFactory::getName() const {
    return backend_->getName();
}


/**
 * @brief Add a builder instance to the list of layers to be built and transfer ownership
 *
 * @param builder Pointer to builder instance, allocated with \c new
 *
 * This function adds the supplied builder object to the internal list of layer builders. A call
 * to compileLayers() will generate the layers that can be used for network inference. The
 * ownership of the supplied \p builder is transferred to the factory, also in case of an error.
 *
 * @throws StyleKitException in case of errors (unsupported layer types or double-use of layer numbers)
 */
void LayerFactory::pushBuilder(LayerBuilderBase * builder) {
    if (!builder) THROW_EXCEPTION_ARGS(StyleKitException, "Null builder supplied");
    std::unique_ptr<LayerBuilderBase> owned(builder);
    if (builder->number_ < 0) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Must identify each layer with a valid number (found %d in builder %s)", builder->number_, builder->name_.c_str());
    }
    if (builder->type_ >= LayerType::LAST_SUPPORTED) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Unsupported layer type %d", (int)builder->type_);
    }
    if (builders_.find(builder->number_) != builders_.end()) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Trying to insert a layer on a position that is already taken (%d)", builder->number_);
    }
    builders_[builder->number_] = std::move(owned);
}


/**
 * @brief Create the actual layer instances based on the builders stored in the factory
 *
 * @return Collection that contains the compiled layers
 *
 * @throws StyleKitException if a layer cannot be created or layer names are not unique
 */
CompiledLayers LayerFactory::compileLayers() {
    CompiledLayers layers;
    for (auto it = builders_.begin(); it != builders_.end(); ++it) {
        layers.setLayer(backend_->createLayer(it->second->type_, *(it->second), it->first));
    }
    SKLOGD("Compiled %d layers using %s backend", (int)layers.numLayers(), getName().c_str());
    return layers;
}


/**
 * @brief Generate a new layer factory instance
 *
 * @return Shared pointer to LayerFactory instance
 *
 * @note This is \b not a singleton pattern, \b new instances are generated with every call to this
 *       function. After the layers have been compiled, it is safe to discard a factory object again.
 */
std::shared_ptr<LayerFactory> LayerFactory::instance() {
    return std::shared_ptr<LayerFactory>(new LayerFactory(new cpu::CPULayerFactoryBackend()));
}


/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param backend Backend to wrap which does the heavy-lifting, ownership is transferred
 */
LayerFactory::LayerFactory(LayerFactoryBackend * backend) : backend_(backend) {
}

} // stylekit namespace


// vim: set expandtab ts=4 sw=4:
