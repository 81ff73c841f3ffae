//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Style Transfer Unit Tests
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

/**
 * @brief Style model that maps an image to a (1,1,1,dims) tensor filled with the image mean
 */
class MeanStyleModel : public GraphModel {
 public:
    explicit MeanStyleModel(int dims) : dims_(dims) {
    }

    std::unique_ptr<CPUBuffer> predict(const std::vector<const CPUBuffer *>& inputs) override {
        EXPECT_EQ(inputs.size(), 1u);
        lastShape_ = inputs[0]->shape();
        calls_++;
        double sum = 0.0;
        inputs[0]->with([&](const float * data) {
            for (size_t i=0; i < inputs[0]->elements(); i++) sum += data[i];
        });
        auto out = std::make_unique<CPUBuffer>(CPUBufferShape({1, 1, 1, dims_}));
        out->fill((float)(sum / (double)inputs[0]->elements()));
        return out;
    }

    int dims_;
    int calls_ = 0;
    CPUBufferShape lastShape_;
};


/**
 * @brief Transform model that adds the first bottleneck value to the content image
 */
class ShiftTransformModel : public GraphModel {
 public:
    std::unique_ptr<CPUBuffer> predict(const std::vector<const CPUBuffer *>& inputs) override {
        EXPECT_EQ(inputs.size(), 2u);
        lastShape_ = inputs[0]->shape();
        ReadMapping bottleneck(*inputs[1]);
        auto out = inputs[0]->copy();
        WriteMapping map(*out);
        for (size_t i=0; i < out->elements(); i++) map.data()[i] += bottleneck.data()[0];
        return out;
    }

    CPUBufferShape lastShape_;
};


class StyleTransferTest : public ::testing::Test, public LayerTestBase {
 protected:
    void SetUp() override {
        styleNet_ = std::make_shared<MeanStyleModel>(8);
        transformNet_ = std::make_shared<ShiftTransformModel>();
    }

    static float mean(const CPUBuffer& buffer) {
        std::vector<float> data = toVector(buffer);
        double sum = 0.0;
        for (float v : data) sum += v;
        return (float)(sum / (double)data.size());
    }

    std::shared_ptr<MeanStyleModel> styleNet_;
    std::shared_ptr<ShiftTransformModel> transformNet_;
};


TEST_F(StyleTransferTest, StyleParameters) {
    StyleTransfer transfer(styleNet_, transformNet_);
    auto style = generateConstantData({6, 4, 3}, 51.0f);
    auto params = transfer.predictStyleParameters(*style);
    EXPECT_EQ(styleNet_->lastShape_, CPUBufferShape({1, 6, 4, 3}));
    EXPECT_EQ(params->shape(), CPUBufferShape({1, 1, 1, 8}));
    expectNear(*params, std::vector<float>(8, 0.2f), 1e-6f);
}


TEST_F(StyleTransferTest, FullStrength) {
    StyleTransfer transfer(styleNet_, transformNet_);
    auto style = generateRandomData({10, 12, 3}, 0.0f, 255.0f);
    auto content = generateRandomData({5, 7, 3}, 0.0f, 255.0f, 11);
    auto result = transfer.stylize(*style, *content);
    EXPECT_EQ(styleNet_->calls_, 1);
    EXPECT_EQ(transformNet_->lastShape_, CPUBufferShape({1, 5, 7, 3}));
    ASSERT_EQ(result->shape(), CPUBufferShape({5, 7, 3}));
    std::vector<float> expected = toVector(*content);
    float shift = mean(*style);
    for (float & v : expected) v += shift;
    expectNear(*result, expected, 1e-2f);
}


TEST_F(StyleTransferTest, BlendedStrength) {
    StyleTransfer transfer(styleNet_, transformNet_);
    auto style = generateConstantData({4, 4, 3}, 200.0f);
    auto content = generateConstantData({4, 4, 3}, 100.0f);
    auto result = transfer.stylize(*style, *content, 0.25f);
    EXPECT_EQ(styleNet_->calls_, 2);
    // content + 0.25 * 200 + 0.75 * 100
    expectNear(*result, std::vector<float>(48, 225.0f), 1e-3f);
    auto nostyle = transfer.stylize(*style, *content, 0.0f);
    expectNear(*nostyle, std::vector<float>(48, 200.0f), 1e-3f);
}


TEST_F(StyleTransferTest, InvalidStrength) {
    StyleTransfer transfer(styleNet_, transformNet_);
    auto image = generateConstantData({4, 4, 3}, 1.0f);
    EXPECT_THROW((void)transfer.stylize(*image, *image, 1.5f), InvalidConfigException);
    EXPECT_THROW((void)transfer.stylize(*image, *image, -0.1f), InvalidConfigException);
}


TEST_F(StyleTransferTest, WarmUp) {
    StyleTransfer transfer(styleNet_, transformNet_);
    transfer.init();
    EXPECT_EQ(styleNet_->lastShape_, CPUBufferShape({1, StyleTransfer::WARMUP_HEIGHT, StyleTransfer::WARMUP_WIDTH, 3}));
    EXPECT_EQ(transformNet_->lastShape_, CPUBufferShape({1, StyleTransfer::WARMUP_HEIGHT, StyleTransfer::WARMUP_WIDTH, 3}));
}


TEST_F(StyleTransferTest, MissingModel) {
    EXPECT_THROW(StyleTransfer(nullptr, transformNet_), StyleKitException);
    EXPECT_THROW(StyleTransfer(styleNet_, nullptr), StyleKitException);
}


/**
 * @brief Style model that ignores the image and returns a fixed selector
 */
class FixedStyleModel : public GraphModel {
 public:
    explicit FixedStyleModel(const std::vector<float>& weights) : weights_(weights) {
    }

    std::unique_ptr<CPUBuffer> predict(const std::vector<const CPUBuffer *>& inputs) override {
        (void)inputs;
        return std::make_unique<CPUBuffer>(CPUBufferShape({1, (int)weights_.size()}), weights_.data());
    }

    std::vector<float> weights_;
};


TEST_F(StyleTransferTest, NetworkAsTransform) {
    auto net = std::make_shared<NeuralNetwork>("transform");
    net->add(new CondInstanceNormLayerBuilder("cnorm")).styles(2).epsilon(0.0f);
    net->add(new DeprocessLayerBuilder("deprocess"));
    CPUBufferShape shape({1, 6, 6, 3});
    net->setup(shape);
    MemoryParameterProvider weights;
    std::vector<float> gamma = {0.1f, 0.2f, 0.3f, 0.05f, 0.05f, 0.05f};
    std::vector<float> beta = {0.5f, 0.5f, 0.5f, 0.25f, 0.5f, 0.75f};
    weights.set("cnorm.gamma", gamma);
    weights.set("cnorm.beta", beta);
    net->loadParameters(&weights);
    StyleTransfer transfer(std::make_shared<FixedStyleModel>(std::vector<float>{0.0f, 1.0f}), net);
    auto content = generateRandomData({6, 6, 3}, 0.0f, 255.0f);
    auto result = transfer.stylize(*content, *content);
    ASSERT_EQ(result->shape(), CPUBufferShape({6, 6, 3}));
    std::vector<float> ref = computeInstanceNorm(toVector(*content), 1, 6, 6, 3, 0.0f, {0.05f, 0.05f, 0.05f}, {0.25f, 0.5f, 0.75f});
    for (float & v : ref) v *= 255.0f;
    expectNear(*result, ref, 1e-2f);
}

TEST_F(StyleTransferTest, PixelRangeTransform) {
    auto net = std::make_shared<NeuralNetwork>("transform");
    net->add(new DeprocessLayerBuilder("deprocess")).activation(ActType::TANH);
    StyleTransfer transfer(std::make_shared<FixedStyleModel>(std::vector<float>{1.0f}), net, 1.0f);
    EXPECT_FLOAT_EQ(transfer.outputScale(), 1.0f);
    auto content = generateConstantData({4, 5, 3}, 0.0f);
    auto result = transfer.stylize(*content, *content);
    ASSERT_EQ(result->shape(), CPUBufferShape({4, 5, 3}));
    expectNear(*result, std::vector<float>(4 * 5 * 3, 127.5f), 1e-4f);
}

TEST_F(StyleTransferTest, InvalidOutputScale) {
    auto style = std::make_shared<FixedStyleModel>(std::vector<float>{1.0f});
    auto net = std::make_shared<NeuralNetwork>("transform");
    EXPECT_THROW(StyleTransfer(style, net, 0.0f), InvalidConfigException);
    EXPECT_THROW(StyleTransfer(style, net, -255.0f), InvalidConfigException);
}

// vim: set expandtab ts=4 sw=4:
