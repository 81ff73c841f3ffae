//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Deprocessing Layer Unit Tests
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

class DeprocessLayerTest : public ::testing::Test, public LayerTestBase {
};


TEST_F(DeprocessLayerTest, TanhRange) {
    CPUBuffer input({1, 1, 5, 1});
    {
        WriteMapping map(input);
        const float vals[5] = {-1.0f, -0.5f, 0.0f, 0.5f, 1.0f};
        for (int i=0; i < 5; i++) map.data()[i] = vals[i];
    }
    DeprocessLayerBuilder bld("deprocess");
    bld.activation(ActType::TANH);
    DeprocessLayer layer(bld, 0);
    layer.build(input.shape());
    auto output = layer.forward(input);
    expectNear(*output, {0.0f, 63.75f, 127.5f, 191.25f, 255.0f}, 1e-4f);
}


TEST_F(DeprocessLayerTest, SigmoidIdentity) {
    auto input = generateRandomData({2, 7, 3, 3}, -100.0f, 400.0f);
    DeprocessLayerBuilder bld("deprocess");
    DeprocessLayer layer(bld, 0);
    EXPECT_EQ(layer.activation(), ActType::SIGMOID);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    EXPECT_EQ(output->shape(), input->shape());
    EXPECT_EQ(toVector(*output), toVector(*input));
    EXPECT_NE(output.get(), input.get());
}


TEST_F(DeprocessLayerTest, InputUntouched) {
    auto input = generateRandomData({1, 4, 4, 3}, -1.0f, 1.0f);
    std::vector<float> before = toVector(*input);
    auto output = deprocessImage(*input, ActType::TANH);
    EXPECT_EQ(toVector(*input), before);
    EXPECT_EQ(output->shape(), input->shape());
}


TEST_F(DeprocessLayerTest, UnsupportedMode) {
    auto input = generateRandomData({1, 2, 2, 3}, -1.0f, 1.0f);
    EXPECT_THROW(deprocessImage(*input, (ActType)7), InvalidConfigException);
    DeprocessLayerBuilder bld("deprocess");
    bld.activation((ActType)7);
    EXPECT_THROW(DeprocessLayer(bld, 0), InvalidConfigException);
    nlohmann::json record = {{"class_name", "DeprocessStylizedImage"}, {"config", {{"name", "dp"}, {"activation", "relu"}}}};
    EXPECT_THROW((void)builderFromRecord(record, 0), InvalidConfigException);
}


TEST_F(DeprocessLayerTest, Configuration) {
    DeprocessLayerBuilder bld("dp");
    bld.activation(ActType::TANH);
    DeprocessLayer layer(bld, 3);
    nlohmann::json cfg = layer.getConfig();
    EXPECT_EQ(cfg["name"], "dp");
    EXPECT_EQ(cfg["activation"], "tanh");
    EXPECT_STREQ(layer.getClassName(), "DeprocessStylizedImage");
    EXPECT_EQ(layer.computeOutputShape({1, CPUBufferShape::UNKNOWN, 3, 3}), CPUBufferShape({1, CPUBufferShape::UNKNOWN, 3, 3}));
}

// vim: set expandtab ts=4 sw=4:
