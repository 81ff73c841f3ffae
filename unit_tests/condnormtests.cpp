//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Conditional Instance Normalization Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>
#include <vector>

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

class CondNormLayerTest : public ::testing::Test, public LayerTestBase {
 protected:
    /**
     * @brief Generate a table with one distinct row per style
     */
    static std::vector<float> generateTable(int styles, int channels, float base, float step) {
        std::vector<float> table((size_t)styles * channels);
        for (int s=0; s < styles; s++) {
            for (int c=0; c < channels; c++) table[s * channels + c] = base + step * (float)(s * channels + c);
        }
        return table;
    }

    static std::vector<float> row(const std::vector<float>& table, int index, int channels) {
        return std::vector<float>(table.begin() + index * channels, table.begin() + (index + 1) * channels);
    }

    static std::vector<float> oneHot(int styles, int index) {
        std::vector<float> sel(styles, 0.0f);
        sel[index] = 1.0f;
        return sel;
    }
};

struct CondNormParam {
    CondNormParam(int s, int b, int h, int w, int c) : styles(s), batch(b), height(h), width(w), channels(c) {}
    int styles;
    int batch;
    int height;
    int width;
    int channels;
};

class ParamCondNormTest : public CondNormLayerTest, public ::testing::WithParamInterface<CondNormParam> {
};


TEST_P(ParamCondNormTest, OneHotMatchesInstanceNorm) {
    const CondNormParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, -3.0f, 3.0f);
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(p.styles);
    CondInstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    std::vector<float> gamma = generateTable(p.styles, p.channels, 0.5f, 0.125f);
    std::vector<float> beta = generateTable(p.styles, p.channels, -2.0f, 0.25f);
    layer.setGammaTable(gamma);
    layer.setBetaTable(beta);
    for (int s=0; s < p.styles; s++) {
        InstanceNormLayerBuilder plainbld("norm");
        InstanceNormLayer plain(plainbld, 1);
        plain.build(input->shape());
        plain.setGamma(row(gamma, s, p.channels));
        plain.setBeta(row(beta, s, p.channels));
        auto expected = plain.forward(*input);
        auto output = layer.forward(*input, oneHot(p.styles, s));
        expectNear(*output, toVector(*expected), 1e-5f);
    }
}


TEST_P(ParamCondNormTest, WeightedMix) {
    const CondNormParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, 0.0f, 1.0f, 3);
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(p.styles);
    CondInstanceNormLayer layer(bld, 0);
    layer.build(input->shape());
    std::vector<float> gamma = generateTable(p.styles, p.channels, 1.0f, 0.5f);
    std::vector<float> beta = generateTable(p.styles, p.channels, 0.0f, -0.5f);
    layer.setGammaTable(gamma);
    layer.setBetaTable(beta);
    std::vector<float> sel(p.styles);
    for (int s=0; s < p.styles; s++) sel[s] = 1.0f / (float)(s + 2);
    std::vector<float> geff(p.channels, 0.0f), beff(p.channels, 0.0f);
    for (int s=0; s < p.styles; s++) {
        for (int c=0; c < p.channels; c++) {
            geff[c] += sel[s] * gamma[s * p.channels + c];
            beff[c] += sel[s] * beta[s * p.channels + c];
        }
    }
    layer.setStyleWeights(sel);
    std::vector<float> ref = computeInstanceNorm(toVector(*input), p.batch, p.height, p.width, p.channels, 1e-3f, geff, beff);
    expectNear(*layer.forward(*input), ref, 1e-4f);
}


TEST_F(CondNormLayerTest, DefaultSelector) {
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(3);
    CondInstanceNormLayer layer(bld, 0);
    EXPECT_EQ(layer.styleWeights(), oneHot(3, 0));
    auto input = generateRandomData({1, 6, 6, 2}, -1.0f, 1.0f);
    layer.build(input->shape());
    std::vector<float> beta = generateTable(3, 2, 1.0f, 1.0f);
    layer.setBetaTable(beta);
    expectNear(*layer.forward(*input), toVector(*layer.forward(*input, oneHot(3, 0))), 0.0f);
    EXPECT_EQ(layer.parameterCount(), 12u);
}


TEST_F(CondNormLayerTest, SelectorMismatch) {
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(4);
    CondInstanceNormLayer layer(bld, 0);
    auto input = generateRandomData({1, 4, 4, 3}, 0.0f, 1.0f);
    layer.build(input->shape());
    EXPECT_THROW(layer.setStyleWeights({1.0f, 0.0f}), ShapeException);
    EXPECT_THROW((void)layer.forward(*input, std::vector<float>(5, 0.2f)), ShapeException);
    EXPECT_THROW(layer.setGammaTable(std::vector<float>(3, 1.0f)), ShapeException);
}


TEST_F(CondNormLayerTest, InvalidStyleCount) {
    CondInstanceNormLayerBuilder bld("cnorm");
    EXPECT_THROW(bld.styles(0), InvalidConfigException);
    bld.styles_ = -1;
    EXPECT_THROW(CondInstanceNormLayer(bld, 0), InvalidConfigException);
}


TEST_F(CondNormLayerTest, NormalizedWeights) {
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(4);
    CondInstanceNormLayer layer(bld, 0);
    layer.setStyleWeights({1.0f, 3.0f, 0.0f, 4.0f}, true);
    std::vector<float> expected = {0.125f, 0.375f, 0.0f, 0.5f};
    for (int i=0; i < 4; i++) EXPECT_FLOAT_EQ(layer.styleWeights()[i], expected[i]);
    // zero sum keeps the weights as they are
    layer.setStyleWeights({0.0f, 0.0f, 0.0f, 0.0f}, true);
    EXPECT_EQ(layer.styleWeights(), std::vector<float>(4, 0.0f));
    // without normalization weights are taken verbatim
    layer.setStyleWeights({2.0f, -1.0f, 0.0f, 0.0f});
    EXPECT_EQ(layer.styleWeights(), std::vector<float>({2.0f, -1.0f, 0.0f, 0.0f}));
}


TEST_F(CondNormLayerTest, LoadTables) {
    CondInstanceNormLayerBuilder bld("cnorm");
    bld.styles(2);
    CondInstanceNormLayer layer(bld, 0);
    layer.build({1, 4, 4, 3});
    MemoryParameterProvider weights;
    std::vector<float> gamma = generateTable(2, 3, 1.0f, 1.0f);
    std::vector<float> beta = generateTable(2, 3, 0.0f, 2.0f);
    weights.set("cnorm.gamma", gamma);
    weights.set("cnorm.beta", beta);
    layer.loadParameters(&weights);
    EXPECT_EQ(layer.gammaTable(), gamma);
    EXPECT_EQ(layer.betaTable(), beta);
    weights.set("cnorm.gamma", std::vector<float>(3, 1.0f));
    EXPECT_THROW(layer.loadParameters(&weights), ShapeException);
}


INSTANTIATE_TEST_CASE_P(CondNorm, ParamCondNormTest, testing::Values(
    CondNormParam(1, 1, 4, 4, 3),
    CondNormParam(4, 1, 8, 8, 16),
    CondNormParam(3, 2, 5, 7, 2),
    CondNormParam(16, 1, 9, 9, 32)));

// vim: set expandtab ts=4 sw=4:
