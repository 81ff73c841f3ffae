//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Sequential Neural Network (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include "graphmodel.h"
#include "layerfactory.h"
#include "compiledlayers.h"
#include "parameterprovider.h"

//------------------------------------- Public Declarations ----------------------------------------
namespace stylekit {

/**
 * @brief Sequential network of StyleKit layers
 *
 * This class encapsulates a set of layers which are executed in ascending layer-number order, each
 * layer consuming the output of its predecessor. Layers are either added by pushing builders to the
 * factory of the network or by reconstructing the network from a configuration record.
 *
 * To use a network, the following steps should be taken:
 *  1. Instantiate the network and add the layers (or use fromConfig())
 *  2. Call setup() with the input shape, which builds all layers
 *  3. Optionally call loadParameters() to replace the initial weights
 *  4. Call forward() (or predict()) on the network object
 *  5. Repeat 4 ad nauseam
 *
 * Once the layers have been compiled (which happens in setup() or on the first call that needs the
 * layers), no more layers can be added.
 *
 * @code
 * NeuralNetwork net("decoder");
 * net.add(new cpu::ReflectionPadLayerBuilder("pad"));
 * net.add(new cpu::CondInstanceNormLayerBuilder("norm")).styles(4);
 * net.setup({1, 256, 256, 3});
 * auto out = net.forward(image);
 * @endcode
 */
class NeuralNetwork : public GraphModel {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    explicit NeuralNetwork(const std::string& name = "sequential");
    ~NeuralNetwork() override = default;

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------

    /**
     * @brief Add a layer builder to the network
     *
     * @param builder Pointer to builder allocated with \c new, ownership is transferred
     *
     * @return Reference to the supplied builder for further parameterization
     *
     * If the builder has no layer number assigned, it receives the next free number. Parameters of
     * the builder may be changed after adding it, as long as the layers have not been compiled yet.
     */
    template<typename B>
    B & add(B * builder) {
        addBuilder(builder);
        return *builder;
    }

    virtual void setup(const cpu::CPUBufferShape& inputShape);
    void loadParameters(const ParameterProvider * weights);
    [[nodiscard]] std::unique_ptr<cpu::CPUBuffer> forward(const cpu::CPUBuffer& input, const std::vector<float> * styleWeights = nullptr);
    std::unique_ptr<cpu::CPUBuffer> predict(const std::vector<const cpu::CPUBuffer *>& inputs) override;
    [[nodiscard]] cpu::CPUBufferShape computeOutputShape(const cpu::CPUBufferShape& inputShape);
    [[nodiscard]] nlohmann::json getConfig();
    [[nodiscard]] size_t parameterCount();
    [[nodiscard]] cpu::CPULayer * getLayer(const std::string& name);
    [[nodiscard]] CompiledLayers & layers();

    static std::unique_ptr<NeuralNetwork> fromConfig(const nlohmann::json& config);

    [[nodiscard]] const std::string & getName() const {
        return name_;
    }

    [[nodiscard]] bool isSetup() const {
        return setup_;
    }

    /**
     * @brief Get layer factory of this network
     *
     * @return Shared pointer to factory, builders that are pushed to it become part of the network
     */
    [[nodiscard]] std::shared_ptr<LayerFactory> & factory() {
        return factory_;
    }

 protected:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    void addBuilder(LayerBuilderBase * builder);
    void compile();

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::string name_;                              //!< Network name
    std::shared_ptr<LayerFactory> factory_;         //!< Factory that holds the builders until compilation
    CompiledLayers layers_;                         //!< Compiled layers (empty until compile())
    int nextNumber_ = 0;                            //!< Next layer number for builders without one
    bool compiled_ = false;                         //!< Indicator that layers were compiled
    bool setup_ = false;                            //!< Indicator if network was set up
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
