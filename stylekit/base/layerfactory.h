//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Factory (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <map>
#include <memory>
#include <string>

//-------------------------------------- Project  Headers ------------------------------------------

#include "layerbuilder.h"
#include "compiledlayers.h"

namespace stylekit {
//------------------------------------- Public Declarations ----------------------------------------

class LayerFactoryBackend;

/**
 * @brief Factory that turns layer builders into network layers
 *
 * The factory collects a set of builders, each of which describes a single layer, and compiles
 * them into a CompiledLayers collection. The actual layer instantiation is delegated to a
 * LayerFactoryBackend, which currently always is the CPU backend.
 *
 * The usual way to use a layer factory is:
 * @code
 * auto factory = LayerFactory::instance();
 * auto * norm = new cpu::InstanceNormLayerBuilder("norm1");
 * norm->epsilon(1e-5f).number(1).push(factory);
 * CompiledLayers layers = factory->compileLayers();
 * @endcode
 */
class LayerFactory {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    ~LayerFactory();
    LayerFactory(const LayerFactory&) = delete;
    LayerFactory& operator=(const LayerFactory&) = delete;

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    [[nodiscard]] std::string getName() const;
    void pushBuilder(LayerBuilderBase * builder);
    [[nodiscard]] CompiledLayers compileLayers();

    /**
     * @brief Get number of builders that were pushed to the factory
     */
    [[nodiscard]] size_t numBuilders() const {
        return builders_.size();
    }

    static std::shared_ptr<LayerFactory> instance();

 protected:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    explicit LayerFactory(LayerFactoryBackend * backend);

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    LayerFactoryBackend * backend_ = nullptr;                           //!< Backend that creates the layers
    std::map<int, std::unique_ptr<LayerBuilderBase>> builders_;         //!< Builders keyed by layer number
};



/**
 * @brief Interface for layer factory backends
 */
class LayerFactoryBackend {
    friend class LayerFactory;
 public:
    virtual ~LayerFactoryBackend() = default;

    /**
     * @brief Retrieve the name of the factory backend (for debug/logging purposes)
     *
     * @return String with the name of the backend
     */
    [[nodiscard]] virtual std::string getName() const = 0;

    /**
     * @brief Create layer based on the supplied layer type and associated builder object
     *
     * @param type Layer type to build
     * @param builder Builder that contains layer-specific data
     * @param layerNumber Number of the layer to be built
     *
     * @return Layer that has been created
     *
     * @throws StyleKitException in case there was a problem creating the layer
     */
    virtual cpu::CPULayer createLayer(LayerType type, const LayerBuilderBase& builder, int layerNumber) = 0;
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
