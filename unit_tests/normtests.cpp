//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Instance Normalization Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cmath>
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

class NormLayerTest : public ::testing::Test, public LayerTestBase {
};

struct NormParam {
    NormParam(int b, int h, int w, int c, float e) : batch(b), height(h), width(w), channels(c), epsilon(e) {}
    int batch;
    int height;
    int width;
    int channels;
    float epsilon;
};

class ParamNormTest : public NormLayerTest, public ::testing::WithParamInterface<NormParam> {
};


TEST_P(ParamNormTest, UnitMoments) {
    const NormParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, -10.0f, 30.0f);
    InstanceNormLayerBuilder bld("norm");
    bld.epsilon(p.epsilon);
    InstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    ASSERT_EQ(output->shape(), input->shape());
    for (int b=0; b < p.batch; b++) {
        for (int c=0; c < p.channels; c++) {
            double mean, var;
            channelMoments(*output, b, c, mean, var);
            EXPECT_NEAR(mean, 0.0, 1e-4);
            EXPECT_NEAR(var, 1.0, 1e-2);
        }
    }
}


TEST_P(ParamNormTest, AffineMatchesReference) {
    const NormParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, -1.0f, 1.0f, 99);
    std::vector<float> gamma(p.channels), beta(p.channels);
    for (int c=0; c < p.channels; c++) {
        gamma[c] = 0.5f + 0.25f * (float)c;
        beta[c] = -1.0f + 0.1f * (float)c;
    }
    InstanceNormLayerBuilder bld("norm");
    bld.epsilon(p.epsilon);
    InstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    layer.setGamma(gamma);
    layer.setBeta(beta);
    auto output = layer.forward(*input);
    std::vector<float> ref = computeInstanceNorm(toVector(*input), p.batch, p.height, p.width, p.channels, p.epsilon, gamma, beta);
    expectNear(*output, ref, 1e-4f);
}


TEST_F(NormLayerTest, ExactMomentsWithoutEpsilon) {
    // only channel 1 carries varying data, the others are random
    auto input = generateRandomData({1, 4, 4, 3}, -1.0f, 1.0f);
    {
        WriteMapping map(*input);
        for (int i=0; i < 16; i++) map.data()[i*3+1] = (float)(i * i) - 3.0f * (float)i;
    }
    InstanceNormLayerBuilder bld("norm");
    bld.epsilon(0.0f);
    InstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    double mean, var;
    channelMoments(*output, 0, 1, mean, var);
    EXPECT_NEAR(mean, 0.0, 1e-6);
    EXPECT_NEAR(var, 1.0, 1e-6);
}


TEST_F(NormLayerTest, IndependentAffineFlags) {
    auto input = generateRandomData({1, 5, 5, 2}, 0.0f, 4.0f);
    std::vector<float> none;
    std::vector<float> shift = {3.0f, -2.0f};
    std::vector<float> mul = {2.0f, 0.5f};
    {
        InstanceNormLayerBuilder bld("center_only");
        bld.scale(false);
        InstanceNormLayer layer(bld, 0);
        layer.build(input->shape());
        EXPECT_TRUE(layer.gamma().empty());
        layer.setBeta(shift);
        EXPECT_THROW(layer.setGamma(mul), ShapeException);
        expectNear(*layer.forward(*input), computeInstanceNorm(toVector(*input), 1, 5, 5, 2, 1e-3f, none, shift), 1e-4f);
        EXPECT_EQ(layer.parameterCount(), 2u);
    }
    {
        InstanceNormLayerBuilder bld("scale_only");
        bld.center(false);
        InstanceNormLayer layer(bld, 0);
        layer.build(input->shape());
        EXPECT_TRUE(layer.beta().empty());
        layer.setGamma(mul);
        expectNear(*layer.forward(*input), computeInstanceNorm(toVector(*input), 1, 5, 5, 2, 1e-3f, mul, none), 1e-4f);
    }
}


TEST_F(NormLayerTest, Initializers) {
    InstanceNormLayerBuilder bld("init");
    bld.gammaInitializer(Initializer::ZEROS).betaInitializer(Initializer::ONES);
    InstanceNormLayer layer(bld, 0);
    layer.build({1, 3, 3, 4});
    EXPECT_EQ(layer.gamma(), std::vector<float>(4, 0.0f));
    EXPECT_EQ(layer.beta(), std::vector<float>(4, 1.0f));
    auto output = layer.forward(*generateRandomData({1, 3, 3, 4}, 0.0f, 1.0f));
    expectNear(*output, std::vector<float>(36, 1.0f), 1e-6f);
}


TEST_F(NormLayerTest, ChannelAxis) {
    // channels on axis 1 of a (batch, channels, height, width) tensor
    auto input = generateRandomData({2, 3, 4, 5}, -2.0f, 2.0f);
    InstanceNormLayerBuilder bld("nchw");
    bld.axis(1).epsilon(0.0f);
    InstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    EXPECT_EQ(layer.channels(), 3);
    auto output = layer.forward(*input);
    std::vector<float> data = toVector(*output);
    for (int plane=0; plane < 6; plane++) {
        double mean = 0.0, var = 0.0;
        for (int i=0; i < 20; i++) mean += data[plane*20+i];
        mean /= 20.0;
        for (int i=0; i < 20; i++) var += (data[plane*20+i] - mean) * (data[plane*20+i] - mean);
        var /= 20.0;
        EXPECT_NEAR(mean, 0.0, 1e-5);
        EXPECT_NEAR(var, 1.0, 1e-4);
    }
}


TEST_F(NormLayerTest, UnknownChannels) {
    InstanceNormLayerBuilder bld("norm");
    InstanceNormLayer layer(bld, 0);
    EXPECT_THROW(layer.build({1, 8, 8, CPUBufferShape::UNKNOWN}), ShapeException);
    EXPECT_NO_THROW(layer.build({CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, 8}));
    InstanceNormLayerBuilder badaxis("axis");
    badaxis.axis(4);
    InstanceNormLayer other(badaxis, 1);
    EXPECT_THROW(other.build({1, 8, 8, 3}), ShapeException);
}


TEST_F(NormLayerTest, ChannelMismatch) {
    InstanceNormLayerBuilder bld("norm");
    InstanceNormLayer layer(bld, 0);
    auto input = generateRandomData({1, 4, 4, 3}, 0.0f, 1.0f);
    EXPECT_THROW((void)layer.forward(*input), StyleKitException);
    layer.build({1, 4, 4, 5});
    EXPECT_THROW((void)layer.forward(*input), ShapeException);
}


TEST_F(NormLayerTest, LoadParameters) {
    InstanceNormLayerBuilder bld("norm");
    InstanceNormLayer layer(bld, 0);
    layer.build({1, 4, 4, 3});
    MemoryParameterProvider weights;
    weights.set("norm.gamma", std::vector<float>{1.0f, 2.0f, 3.0f});
    layer.loadParameters(&weights);
    EXPECT_EQ(layer.gamma(), std::vector<float>({1.0f, 2.0f, 3.0f}));
    // beta was not supplied and keeps its initial value
    EXPECT_EQ(layer.beta(), std::vector<float>(3, 0.0f));
    weights.set("norm.beta", std::vector<float>{1.0f, 2.0f});
    EXPECT_THROW(layer.loadParameters(&weights), ShapeException);
}


TEST_F(NormLayerTest, NegativeEpsilon) {
    InstanceNormLayerBuilder bld("norm");
    EXPECT_THROW(bld.epsilon(-1.0f), InvalidConfigException);
}


INSTANTIATE_TEST_CASE_P(Norm, ParamNormTest, testing::Values(
    NormParam(1, 4, 4, 3, 1e-3f),
    NormParam(2, 8, 8, 16, 1e-3f),
    NormParam(3, 16, 5, 2, 1e-5f),
    NormParam(1, 32, 32, 8, 0.0f)));

// vim: set expandtab ts=4 sw=4:
