//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Arbitrary Style-Transfer Example Main
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------


//--------------------------------------- System Headers -------------------------------------------

#include <fstream>
#include <iterator>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/stylekit.h>
#include "../helpers/jpegio.h"
#include "../helpers/weightfile_provider.h"
#include "../helpers/constant_style_model.h"
#include "cxxopts.hpp"

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

using namespace stylekit;

static std::unique_ptr<cpu::CPUBuffer> readImage(const std::string& imageFile) {
    if (!JPEGIO::isJPEG(imageFile)) {
        THROW_EXCEPTION_ARGS(StyleKitException, "File %s is not a JPEG file", imageFile.c_str());
    }
    return JPEGIO::loadRGBImage(imageFile);
}


static std::unique_ptr<NeuralNetwork> loadNetwork(const std::string& configFile) {
    std::ifstream in(configFile);
    if (!in.is_open()) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot open network configuration %s", configFile.c_str());
    nlohmann::json config = nlohmann::json::parse(in, nullptr, false);
    if (config.is_discarded()) THROW_EXCEPTION_ARGS(InvalidConfigException, "File %s does not contain valid JSON", configFile.c_str());
    return NeuralNetwork::fromConfig(config);
}


static std::vector<float> defaultStyleWeights(NeuralNetwork& net) {
    int styles = 1;
    for (auto & entry : net.layers()) {
        if (auto * cnorm = std::get_if<cpu::CondInstanceNormLayer>(&entry.second)) {
            styles = cnorm->styles();
            break;
        }
    }
    std::vector<float> weights(styles, 0.0f);
    weights[0] = 1.0f;
    return weights;
}


static float outputScale(NeuralNetwork& net) {
    CompiledLayers & layers = net.layers();
    if (layers.empty()) return 255.0f;
    const cpu::CPULayer & last = std::prev(layers.end())->second;
    return std::holds_alternative<cpu::DeprocessLayer>(last) ? 1.0f : 255.0f;
}


int main(int argc, char **argv) {
    cxxopts::Options options(argv[0],"Sample arbitrary style-transfer");
    options.add_options()("h,help","Get program help")
                         ("c,config", "Network configuration (JSON) of the transform network (mandatory)", cxxopts::value<std::string>())
                         ("w,weights", "Use supplied filename as weight file", cxxopts::value<std::string>())
                         ("s,style", "Style JPEG file, uses the content image if not supplied", cxxopts::value<std::string>())
                         ("m,mix", "Comma-separated style weights, one per style of the network", cxxopts::value<std::vector<float>>())
                         ("t,strength", "Stylization strength in [0,1]", cxxopts::value<float>()->default_value("1.0"))
                         ("q,quality", "JPEG quality of the output", cxxopts::value<int>()->default_value("90"))
                         ("warmup", "Run a warm-up pass before stylizing")
                         ("input", "Input (content) JPEG file", cxxopts::value<std::string>())
                         ("output", "Output JPEG file", cxxopts::value<std::string>());
    options.parse_positional({"input","output"});
    auto opts = options.parse(argc, argv);

    if ((opts.count("help") > 0) || (opts.count("input") == 0) || (opts.count("output") == 0) || (opts.count("config") == 0)) {
        std::cout<<options.help()<<std::endl;
        std::cout<<"\nNote that this sample only accepts JPEG images as input and output."<<std::endl;
        return 0;
    }

    try {
        // -------------------------------------------------------
        // Read JPEG images that are to be processed
        // -------------------------------------------------------
        auto content = readImage(opts["input"].as<std::string>());
        auto style = (opts.count("style") > 0) ? readImage(opts["style"].as<std::string>()) : content->copy();
        const cpu::CPUBufferShape & shape = content->shape();
        // -------------------------------------------------------
        // Instantiate and set up transform network, load weights
        // -------------------------------------------------------
        std::shared_ptr<NeuralNetwork> net = loadNetwork(opts["config"].as<std::string>());
        net->setup({1, shape.dim(0), shape.dim(1), shape.dim(2)});
        if (opts.count("weights") > 0) {
            WeightFileProvider weights(opts["weights"].as<std::string>(), *net);
            net->loadParameters(&weights);
        } else {
            SKLOGW("No weight file supplied, using initial parameters");
        }
        std::vector<float> mix = (opts.count("mix") > 0) ? opts["mix"].as<std::vector<float>>() : defaultStyleWeights(*net);
        // -------------------------------------------------------
        // Stylize and save result
        // -------------------------------------------------------
        StyleTransfer transfer(std::make_shared<ConstantStyleModel>(mix), net, outputScale(*net));
        if (opts.count("warmup") > 0) transfer.init();
        auto result = transfer.stylize(*style, *content, opts["strength"].as<float>());
        JPEGIO::saveRGBImage(*result, opts["output"].as<std::string>(), opts["quality"].as<int>());
    } catch (StyleKitException& ex) {
        std::cerr<<ex.what()<<std::endl;
        return 1;
    }
    return 0;
}


// vim: set expandtab ts=4 sw=4:
