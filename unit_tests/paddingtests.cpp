//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Reflection Padding Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <atomic>
#include <cstring>
#include <memory>
#include <thread>
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

class PaddingLayerTest : public ::testing::Test, public LayerTestBase {
 protected:
    static ReflectionPadLayer createLayer(int top, int bottom, int left, int right, DimOrdering order = DimOrdering::CHANNELS_LAST) {
        ReflectionPadLayerBuilder bld("pad");
        bld.padding(top, bottom, left, right).dimOrdering(order).number(1);
        return ReflectionPadLayer(bld, bld.number_);
    }

    /**
     * @brief Crop the padded border off a padded (NHWC) tensor
     */
    static std::vector<float> centerCrop(const CPUBuffer& padded, int top, int bottom, int left, int right) {
        const CPUBufferShape & shape = padded.shape();
        int batch = shape.dim(0), height = shape.dim(1), width = shape.dim(2), channels = shape.dim(3);
        std::vector<float> data = toVector(padded);
        std::vector<float> result;
        for (int b=0; b < batch; b++) {
            for (int y=top; y < height - bottom; y++) {
                for (int x=left; x < width - right; x++) {
                    for (int c=0; c < channels; c++) {
                        result.push_back(data[(((size_t)b * height + y) * width + x) * channels + c]);
                    }
                }
            }
        }
        return result;
    }
};


struct PadParam {
    PadParam(int b, int h, int w, int c, int t, int bo, int l, int r) :
        batch(b), height(h), width(w), channels(c), top(t), bottom(bo), left(l), right(r) {}
    int batch;
    int height;
    int width;
    int channels;
    int top;
    int bottom;
    int left;
    int right;
};

class ParamPaddingTest : public PaddingLayerTest, public ::testing::WithParamInterface<PadParam> {
};


TEST_P(ParamPaddingTest, MatchesReference) {
    const PadParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, -1.0f, 1.0f);
    ReflectionPadLayer layer = createLayer(p.top, p.bottom, p.left, p.right);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    ASSERT_EQ(output->shape(), CPUBufferShape({p.batch, p.height + p.top + p.bottom, p.width + p.left + p.right, p.channels}));
    std::vector<float> ref = computeReflectionPad(toVector(*input), p.batch, p.height, p.width, p.channels, p.top, p.bottom, p.left, p.right);
    expectNear(*output, ref, 0.0f);
}


TEST_P(ParamPaddingTest, CenterCropRestoresInput) {
    const PadParam & p = GetParam();
    auto input = generateRandomData({p.batch, p.height, p.width, p.channels}, -5.0f, 5.0f, 17);
    std::vector<float> before = toVector(*input);
    auto output = reflectionPad2D(*input, p.top, p.bottom, p.left, p.right);
    EXPECT_EQ(centerCrop(*output, p.top, p.bottom, p.left, p.right), before);
    // input must not be touched
    EXPECT_EQ(toVector(*input), before);
}


TEST_P(ParamPaddingTest, MirrorSymmetry) {
    const PadParam & p = GetParam();
    auto input = generateRampData({p.batch, p.height, p.width, p.channels});
    auto output = reflectionPad2D(*input, p.top, p.bottom, p.left, p.right);
    const CPUBufferShape & oshape = output->shape();
    int oheight = oshape.dim(1), owidth = oshape.dim(2);
    std::vector<float> data = toVector(*output);
    auto at = [&](int b, int y, int x, int c) {
        return data[(((size_t)b * oheight + y) * owidth + x) * p.channels + c];
    };
    for (int b=0; b < p.batch; b++) {
        for (int y=0; y < oheight; y++) {
            for (int c=0; c < p.channels; c++) {
                for (int k=0; k < p.left; k++) EXPECT_EQ(at(b, y, p.left - 1 - k, c), at(b, y, p.left + 1 + k, c));
                int last = p.left + p.width - 1;
                for (int k=0; k < p.right; k++) EXPECT_EQ(at(b, y, last + 1 + k, c), at(b, y, last - 1 - k, c));
            }
        }
        for (int x=0; x < owidth; x++) {
            for (int c=0; c < p.channels; c++) {
                for (int k=0; k < p.top; k++) EXPECT_EQ(at(b, p.top - 1 - k, x, c), at(b, p.top + 1 + k, x, c));
                int last = p.top + p.height - 1;
                for (int k=0; k < p.bottom; k++) EXPECT_EQ(at(b, last + 1 + k, x, c), at(b, last - 1 - k, x, c));
            }
        }
    }
}


TEST_F(PaddingLayerTest, ZeroTensorShape) {
    auto input = generateConstantData({1, 4, 4, 3}, 0.0f);
    ReflectionPadLayer layer = createLayer(1, 1, 1, 1);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    ASSERT_EQ(output->shape(), CPUBufferShape({1, 6, 6, 3}));
    expectNear(*output, std::vector<float>(6*6*3, 0.0f), 0.0f);
}


TEST_F(PaddingLayerTest, ZeroPaddingIsCopy) {
    auto input = generateRandomData({2, 3, 5, 2}, 0.0f, 1.0f);
    ReflectionPadLayer layer = createLayer(0, 0, 0, 0);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    EXPECT_EQ(output->shape(), input->shape());
    EXPECT_EQ(toVector(*output), toVector(*input));
}


TEST_F(PaddingLayerTest, SingleRowValues) {
    // a single row [1 2 3 4] padded by 2 on both sides must read [3 2 1 2 3 4 3 2]
    CPUBuffer input({1, 2, 4, 1});
    {
        WriteMapping map(input);
        const float vals[8] = {1, 2, 3, 4, 5, 6, 7, 8};
        memcpy(map.data(), vals, sizeof(vals));
    }
    auto output = reflectionPad2D(input, 0, 0, 2, 2);
    std::vector<float> expected = {3, 2, 1, 2, 3, 4, 3, 2, 7, 6, 5, 6, 7, 8, 7, 6};
    EXPECT_EQ(toVector(*output), expected);
}


TEST_F(PaddingLayerTest, ChannelsFirst) {
    const int batch = 2, channels = 3, height = 5, width = 4;
    auto input = generateRandomData({batch, channels, height, width}, -1.0f, 1.0f);
    ReflectionPadLayer layer = createLayer(2, 1, 3, 1, DimOrdering::CHANNELS_FIRST);
    layer.build(input->shape());
    auto output = layer.forward(*input);
    ASSERT_EQ(output->shape(), CPUBufferShape({batch, channels, height + 3, width + 4}));
    // every (batch, channel) plane is a single-channel NHWC image
    std::vector<float> in = toVector(*input);
    std::vector<float> ref = computeReflectionPad(in, batch * channels, height, width, 1, 2, 1, 3, 1);
    expectNear(*output, ref, 0.0f);
}


TEST_F(PaddingLayerTest, InvalidPadding) {
    auto input = generateRandomData({1, 4, 5, 2}, 0.0f, 1.0f);
    EXPECT_THROW(reflectionPad2D(*input, 4, 0, 0, 0), InvalidPaddingException);
    EXPECT_THROW(reflectionPad2D(*input, 0, 0, 0, 5), InvalidPaddingException);
    EXPECT_THROW(reflectionPad2D(*input, -1, 0, 0, 0), InvalidPaddingException);
    EXPECT_NO_THROW(reflectionPad2D(*input, 3, 3, 4, 4));
    ReflectionPadLayer layer = createLayer(4, 4, 1, 1);
    EXPECT_THROW(layer.build(input->shape()), InvalidPaddingException);
    ReflectionPadLayerBuilder bld("neg");
    EXPECT_THROW(bld.padding(-2), InvalidPaddingException);
}


TEST_F(PaddingLayerTest, NonImageInput) {
    auto input = generateRandomData({4, 4, 3}, 0.0f, 1.0f);
    EXPECT_THROW(reflectionPad2D(*input, 1, 1, 1, 1), ShapeException);
}


TEST_F(PaddingLayerTest, OutputShapePropagation) {
    ReflectionPadLayer layer = createLayer(1, 2, 3, 4);
    EXPECT_EQ(layer.computeOutputShape({1, 10, 20, 3}), CPUBufferShape({1, 13, 27, 3}));
    CPUBufferShape partial({CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, 20, 3});
    EXPECT_EQ(layer.computeOutputShape(partial), CPUBufferShape({CPUBufferShape::UNKNOWN, CPUBufferShape::UNKNOWN, 27, 3}));
    EXPECT_NO_THROW(layer.build(partial));
    EXPECT_STREQ(layer.getClassName(), "ReflectionPadding2D");
}


INSTANTIATE_TEST_CASE_P(Padding, ParamPaddingTest, testing::Values(
    PadParam(1, 4, 4, 3, 1, 1, 1, 1),
    PadParam(1, 8, 6, 1, 3, 3, 2, 2),
    PadParam(2, 5, 7, 4, 4, 0, 6, 1),
    PadParam(3, 2, 2, 2, 1, 1, 1, 1),
    PadParam(1, 16, 9, 8, 2, 5, 0, 8)));

TEST_F(PaddingLayerTest, EmptyAxisWithoutPadding) {
    CPUBuffer rowless({1, 0, 4, 2});
    auto output = reflectionPad2D(rowless, 0, 0, 1, 1);
    EXPECT_EQ(output->shape(), CPUBufferShape({1, 0, 6, 2}));
    EXPECT_THROW((void)reflectionPad2D(rowless, 1, 0, 0, 0), InvalidPaddingException);
    CPUBuffer empty({1, 0, 0, 3});
    ReflectionPadLayer layer = createLayer(0, 0, 0, 0);
    layer.build(empty.shape());
    auto copy = layer.forward(empty);
    EXPECT_EQ(copy->shape(), empty.shape());
}


TEST_F(PaddingLayerTest, ConcurrentReaders) {
    auto input = generateRandomData({1, 64, 64, 3}, 0.0f, 1.0f);
    const std::vector<float> expected = toVector(*reflectionPad2D(*input, 1, 1, 1, 1));
    std::atomic<int> failures{0};
    auto worker = [&]() {
        for (int i=0; i < 200; i++) {
            try {
                auto out = reflectionPad2D(*input, 1, 1, 1, 1);
                if (toVector(*out) != expected) failures++;
            } catch (StyleKitException&) {
                failures++;
            }
        }
    };
    std::thread first(worker);
    std::thread second(worker);
    first.join();
    second.join();
    EXPECT_EQ(failures.load(), 0);
}

// vim: set expandtab ts=4 sw=4:
