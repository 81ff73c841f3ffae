//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Sequential Network Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>

//-------------------------------------- Project  Headers ------------------------------------------

#include <gtest/gtest.h>
#include <stylekit/stylekit.h>
#include "layertestbase.h"

//-------------------------------------- Global Variables ------------------------------------------

//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

using namespace stylekit;
using namespace stylekit::cpu;

int main(int argc,char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

class NetworkTestBase : public ::testing::Test, public LayerTestBase {
 protected:
    /**
     * @brief Assemble a small decoder tail: pad -> conditional norm -> pad -> norm -> deprocess
     */
    static std::unique_ptr<NeuralNetwork> buildNetwork(int styles) {
        auto net = std::make_unique<NeuralNetwork>("decoder");
        net->add(new ReflectionPadLayerBuilder("pad1")).padding(2);
        net->add(new CondInstanceNormLayerBuilder("cnorm")).styles(styles).epsilon(1e-5f);
        net->add(new ReflectionPadLayerBuilder("pad2")).padding(1, 0, 1, 0);
        net->add(new InstanceNormLayerBuilder("norm")).center(false);
        net->add(new DeprocessLayerBuilder("deprocess")).activation(ActType::TANH);
        return net;
    }
};


TEST_F(NetworkTestBase, SetupAndShapes) {
    auto net = buildNetwork(2);
    EXPECT_FALSE(net->isSetup());
    EXPECT_EQ(net->computeOutputShape({1, 8, 10, 3}), CPUBufferShape({1, 13, 15, 3}));
    net->setup({CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, 3});
    EXPECT_TRUE(net->isSetup());
    EXPECT_EQ(net->layers().numLayers(), 5u);
    // gamma+beta of conditional norm (2 styles x 3) plus gamma of plain norm
    EXPECT_EQ(net->parameterCount(), 2u * 6u + 3u);
    auto input = generateRandomData({1, 8, 10, 3}, 0.0f, 255.0f);
    auto output = net->forward(*input);
    EXPECT_EQ(output->shape(), CPUBufferShape({1, 13, 15, 3}));
}


TEST_F(NetworkTestBase, LayerOrder) {
    auto net = buildNetwork(1);
    int expected = 0;
    for (auto it = net->layers().begin(); it != net->layers().end(); ++it) {
        EXPECT_EQ(it->first, expected);
        EXPECT_EQ(layerBase(it->second).getNumber(), expected);
        expected++;
    }
    ASSERT_NE(net->getLayer("norm"), nullptr);
    EXPECT_TRUE(std::holds_alternative<InstanceNormLayer>(*net->getLayer("norm")));
    EXPECT_EQ(net->getLayer("conv"), nullptr);
    EXPECT_THROW(net->add(new DeprocessLayerBuilder("late")), StyleKitException);
}


TEST_F(NetworkTestBase, MatchesLayerChain) {
    auto net = buildNetwork(3);
    CPUBufferShape shape({2, 6, 6, 4});
    net->setup(shape);
    auto input = generateRandomData(shape, -1.0f, 1.0f);
    auto expected = reflectionPad2D(*input, 2, 2, 2, 2);
    expected = instanceNormalize(*expected, -1, 1e-5f, std::vector<float>(4, 1.0f).data(), std::vector<float>(4, 0.0f).data());
    expected = reflectionPad2D(*expected, 1, 0, 1, 0);
    expected = instanceNormalize(*expected, -1, 1e-3f, std::vector<float>(4, 1.0f).data(), nullptr);
    expected = deprocessImage(*expected, ActType::TANH);
    expectNear(*net->forward(*input), toVector(*expected), 1e-3f);
}


TEST_F(NetworkTestBase, StyleWeightsPerCall) {
    auto net = std::make_unique<NeuralNetwork>("styled");
    net->add(new ReflectionPadLayerBuilder("pad"));
    net->add(new CondInstanceNormLayerBuilder("cnorm")).styles(2);
    net->add(new DeprocessLayerBuilder("deprocess"));
    CPUBufferShape shape({1, 5, 5, 2});
    net->setup(shape);
    MemoryParameterProvider weights;
    weights.set("cnorm.gamma", std::vector<float>{1.0f, 1.0f, 2.0f, 2.0f});
    weights.set("cnorm.beta", std::vector<float>{0.0f, 0.0f, 5.0f, -5.0f});
    net->loadParameters(&weights);
    auto input = generateRandomData(shape, 0.0f, 1.0f);
    auto first = net->forward(*input);
    std::vector<float> sel = {0.0f, 1.0f};
    auto second = net->forward(*input, &sel);
    EXPECT_NE(toVector(*first), toVector(*second));
    // the per-call selector does not change the layer
    expectNear(*net->forward(*input), toVector(*first), 0.0f);
    // selector passed through predict() as second input
    CPUBuffer selbuf({1, 2}, sel.data());
    expectNear(*net->predict({input.get(), &selbuf}), toVector(*second), 0.0f);
    std::vector<float> bad = {1.0f};
    EXPECT_THROW((void)net->forward(*input, &bad), ShapeException);
}


TEST_F(NetworkTestBase, ConfigRoundTrip) {
    auto net = buildNetwork(4);
    nlohmann::json cfg = net->getConfig();
    EXPECT_EQ(cfg["class_name"], "Sequential");
    EXPECT_EQ(cfg["config"]["name"], "decoder");
    ASSERT_EQ(cfg["config"]["layers"].size(), 5u);
    EXPECT_EQ(cfg["config"]["layers"][1]["class_name"], "ConditionalInstanceNormalization");
    auto copy = NeuralNetwork::fromConfig(nlohmann::json::parse(cfg.dump()));
    EXPECT_EQ(copy->getConfig(), cfg);
    CPUBufferShape shape({1, 7, 7, 3});
    net->setup(shape);
    copy->setup(shape);
    auto input = generateRandomData(shape, 0.0f, 1.0f);
    expectNear(*copy->forward(*input), toVector(*net->forward(*input)), 0.0f);
}


TEST_F(NetworkTestBase, InvalidConfig) {
    EXPECT_THROW(NeuralNetwork::fromConfig(nlohmann::json::parse(R"({"class_name": "Model", "config": {"layers": []}})")), InvalidConfigException);
    EXPECT_THROW(NeuralNetwork::fromConfig(nlohmann::json::parse(R"({"class_name": "Sequential", "config": {}})")), InvalidConfigException);
    EXPECT_THROW(NeuralNetwork::fromConfig(nlohmann::json::parse(R"({"class_name": "Sequential", "config": {"layers": [{"class_name": "Dense"}]}})")),
                 InvalidConfigException);
}


TEST_F(NetworkTestBase, NotSetUp) {
    auto net = buildNetwork(1);
    auto input = generateRandomData({1, 4, 4, 3}, 0.0f, 1.0f);
    EXPECT_THROW((void)net->forward(*input), StyleKitException);
    MemoryParameterProvider weights;
    EXPECT_THROW(net->loadParameters(&weights), StyleKitException);
    // predict() sets the network up on demand
    auto output = net->predict({input.get()});
    EXPECT_TRUE(net->isSetup());
    EXPECT_EQ(output->shape(), CPUBufferShape({1, 9, 9, 3}));
}


TEST_F(NetworkTestBase, EmptyNetwork) {
    NeuralNetwork net;
    auto input = generateRandomData({1, 2, 2, 1}, 0.0f, 1.0f);
    net.setup(input->shape());
    EXPECT_EQ(toVector(*net.forward(*input)), toVector(*input));
}

// vim: set expandtab ts=4 sw=4:
