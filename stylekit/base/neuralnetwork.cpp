//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Sequential Neural Network
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <algorithm>

//-------------------------------------- Project  Headers ------------------------------------------

#include "neuralnetwork.h"
#include "layerconfig.h"
#include "../common/logging.h"
#include "../common/performance.h"

//-------------------------------------- Global Variables ------------------------------------------


namespace stylekit {

//-------------------------------------- Local Definitions -----------------------------------------

static const char * SEQUENTIAL_CLASS = "Sequential";

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param name Name of the network
 */
NeuralNetwork::NeuralNetwork(const std::string& name) : name_(name), factory_(LayerFactory::instance()) {
}


/**
 * @brief Setup network for execution
 *
 * @param inputShape Shape of the network input, dimensions other than the channel dimension of
 *                   normalization layers may be unknown
 *
 * Compiles the layers (if not done already) and builds every layer in execution order, using the
 * output shape of each layer as input shape of the next layer.
 *
 * @throws ShapeException, InvalidPaddingException in case a layer cannot be built for the shape
 */
void NeuralNetwork::setup(const cpu::CPUBufferShape& inputShape) {
    compile();
    cpu::CPUBufferShape shape = inputShape;
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        cpu::buildLayer(it->second, shape);
        shape = cpu::layerOutputShape(it->second, shape);
    }
    setup_ = true;
    SKLOGI("Network %s set up with %d layers, input %s -> output %s", name_.c_str(), (int)layers_.numLayers(),
           inputShape.toString().c_str(), shape.toString().c_str());
}


/**
 * @brief Load parameters into all weight-bearing layers
 *
 * @param weights Parameter provider that supplies \c <layer>.gamma and \c <layer>.beta
 *
 * @pre Network has been set up
 *
 * @throws StyleKitException if the network was not set up
 * @throws ShapeException if the provider supplies parameters of unexpected size
 */
void NeuralNetwork::loadParameters(const ParameterProvider * weights) {
    if (!setup_) THROW_EXCEPTION_ARGS(StyleKitException, "Network %s must be set up before loading parameters", name_.c_str());
    if (!weights) THROW_EXCEPTION_ARGS(StyleKitException, "No parameter provider supplied");
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        cpu::loadLayerParameters(it->second, weights);
    }
}


/**
 * @brief Run all layers of the network on an input tensor
 *
 * @param input Input tensor
 * @param styleWeights Optional style selector, which is used for all conditional instance
 *                     normalization layers for this run (without changing the layers)
 *
 * @return New tensor with the network output
 *
 * @throws StyleKitException if the network was not set up, other exceptions as thrown by the layers
 */
std::unique_ptr<cpu::CPUBuffer> NeuralNetwork::forward(const cpu::CPUBuffer& input, const std::vector<float> * styleWeights) {
    if (!setup_) THROW_EXCEPTION_ARGS(StyleKitException, "Network %s was not set up", name_.c_str());
    std::unique_ptr<cpu::CPUBuffer> current;
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        const cpu::CPUBuffer & in = (current) ? *current : input;
        current = cpu::forwardLayer(it->second, in, styleWeights);
    }
    if (!current) return input.copy();
    return current;
}


/**
 * @brief Run network on a list of inputs
 *
 * @param inputs Either a single image tensor, or an image tensor followed by a tensor with style
 *               weights (which is flattened to a selector)
 *
 * @return New tensor with the network output
 *
 * @throws ShapeException if no or more than two inputs are supplied
 *
 * If the network was not set up yet, it is set up using the shape of the image tensor.
 */
std::unique_ptr<cpu::CPUBuffer> NeuralNetwork::predict(const std::vector<const cpu::CPUBuffer *>& inputs) {
    if ((inputs.empty()) || (inputs.size() > 2) || (!inputs[0])) {
        THROW_EXCEPTION_ARGS(ShapeException, "Network %s takes one or two inputs, got %d", name_.c_str(), (int)inputs.size());
    }
    if (!setup_) setup(inputs[0]->shape());
    if ((inputs.size() == 2) && (inputs[1])) {
        cpu::ReadMapping map(*inputs[1]);
        std::vector<float> weights(map.data(), map.data() + inputs[1]->elements());
        return forward(*inputs[0], &weights);
    }
    return forward(*inputs[0]);
}


/**
 * @brief Compute output shape of the network for a given input shape
 *
 * @param inputShape Input shape, may contain unknown dimensions
 *
 * @return Output shape, dimensions that cannot be determined are unknown
 */
cpu::CPUBufferShape NeuralNetwork::computeOutputShape(const cpu::CPUBufferShape& inputShape) {
    compile();
    cpu::CPUBufferShape shape = inputShape;
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        shape = cpu::layerOutputShape(it->second, shape);
    }
    return shape;
}


/**
 * @brief Generate configuration record for the network
 *
 * @return JSON object <tt>{"class_name": "Sequential", "config": {"name": ..., "layers": [...]}}</tt>
 *         with the layer records in execution order
 */
nlohmann::json NeuralNetwork::getConfig() {
    compile();
    nlohmann::json layers = nlohmann::json::array();
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        layers.push_back(cpu::layerRecord(it->second));
    }
    nlohmann::json result;
    result["class_name"] = SEQUENTIAL_CLASS;
    result["config"]["name"] = name_;
    result["config"]["layers"] = layers;
    return result;
}


/**
 * @brief Get total number of parameters in the network
 *
 * @return Number of float parameters over all layers, in execution order this is the layout of a
 *         flat weight file (gamma before beta per layer)
 *
 * @pre Network has been set up
 */
size_t NeuralNetwork::parameterCount() {
    if (!setup_) THROW_EXCEPTION_ARGS(StyleKitException, "Network %s was not set up", name_.c_str());
    size_t total = 0;
    for (auto it = layers_.begin(); it != layers_.end(); ++it) {
        total += cpu::layerParameterCount(it->second);
    }
    return total;
}


/**
 * @brief Retrieve layer by name
 *
 * @param name Layer name
 *
 * @return Pointer to layer, or \c nullptr if there is no such layer
 */
cpu::CPULayer * NeuralNetwork::getLayer(const std::string& name) {
    compile();
    return layers_[name];
}


CompiledLayers & NeuralNetwork::layers() {
    compile();
    return layers_;
}


/**
 * @brief Reconstruct network from a configuration record
 *
 * @param config Record as generated by getConfig()
 *
 * @return Pointer to network that has been compiled, but not set up
 *
 * @throws InvalidConfigException if the record is malformed or contains unknown layer classes
 */
std::unique_ptr<NeuralNetwork> NeuralNetwork::fromConfig(const nlohmann::json& config) {
    if ((!config.is_object()) || (config.value("class_name", std::string()) != SEQUENTIAL_CLASS)) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Network configuration must be of class %s", SEQUENTIAL_CLASS);
    }
    const nlohmann::json & cfg = config.contains("config") ? config.at("config") : config;
    if ((!cfg.is_object()) || (!cfg.contains("layers")) || (!cfg.at("layers").is_array())) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Network configuration does not contain a layer list");
    }
    std::string name = "sequential";
    if (cfg.contains("name")) {
        if (!cfg.at("name").is_string()) THROW_EXCEPTION_ARGS(InvalidConfigException, "Network name must be a string");
        name = cfg.at("name").get<std::string>();
    }
    auto net = std::make_unique<NeuralNetwork>(name);
    int number = 0;
    for (const nlohmann::json & record : cfg.at("layers")) {
        std::unique_ptr<LayerBuilderBase> bld = builderFromRecord(record, number++);
        net->addBuilder(bld.release());
    }
    net->compile();
    return net;
}


/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Add builder to the factory of this network
 *
 * @param builder Builder to add, ownership is transferred
 *
 * @throws StyleKitException if the layers were already compiled or the layer number is taken
 */
void NeuralNetwork::addBuilder(LayerBuilderBase * builder) {
    if (!builder) THROW_EXCEPTION_ARGS(StyleKitException, "Null builder supplied");
    if (compiled_) {
        delete builder;
        THROW_EXCEPTION_ARGS(StyleKitException, "Cannot add layers to network %s after compilation", name_.c_str());
    }
    if (builder->number_ < 0) builder->number_ = nextNumber_;
    nextNumber_ = std::max(nextNumber_, builder->number_ + 1);
    factory_->pushBuilder(builder);
}


/**
 * @brief Compile the builders into layers, unless this was done before
 */
void NeuralNetwork::compile() {
    if (compiled_) return;
    tstamp start = sk_get_stamp();
    layers_ = factory_->compileLayers();
    compiled_ = true;
    SKLOGD("Compiled network %s in %u us", name_.c_str(), sk_elapsed_micros(start, sk_get_stamp()));
}

} // stylekit namespace


// vim: set expandtab ts=4 sw=4:
