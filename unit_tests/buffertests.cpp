//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// CPU Buffer Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <atomic>
#include <chrono>
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

class BufferTest : public ::testing::Test, public LayerTestBase {
};


TEST_F(BufferTest, ShapeBasics) {
    CPUBufferShape shape({2, 3, 4, 5});
    EXPECT_EQ(shape.rank(), 4);
    EXPECT_EQ(shape.elements(), 120u);
    EXPECT_EQ(shape.bytes(), 120u * sizeof(float));
    EXPECT_EQ(shape.dim(-1), 5);
    EXPECT_EQ(shape.stride(1), 20u);
    EXPECT_EQ(shape.toString(), "[2,3,4,5]");
    EXPECT_THROW((void)shape.dim(4), ShapeException);
    EXPECT_THROW(CPUBufferShape({1, -3}), ShapeException);
}


TEST_F(BufferTest, PartialShapes) {
    CPUBufferShape shape({CPUBufferShape::UNKNOWN, 8, CPUBufferShape::UNKNOWN, 3});
    EXPECT_FALSE(shape.isFullyDefined());
    EXPECT_EQ(shape.toString(), "[?,8,?,3]");
    EXPECT_THROW((void)shape.elements(), ShapeException);
    EXPECT_THROW(CPUBuffer buf(shape), ShapeException);
    EXPECT_EQ(shape.withDim(0, 1), CPUBufferShape({1, 8, CPUBufferShape::UNKNOWN, 3}));
}


TEST_F(BufferTest, ExpandAndSqueeze) {
    CPUBufferShape shape({4, 4, 3});
    CPUBufferShape batched = shape.expandDims(0);
    EXPECT_EQ(batched, CPUBufferShape({1, 4, 4, 3}));
    EXPECT_EQ(batched.squeeze(0), shape);
    EXPECT_THROW((void)shape.squeeze(0), ShapeException);
}


TEST_F(BufferTest, CopyAndReshape) {
    auto buf = generateRampData({2, 3, 4});
    auto cp = buf->copy();
    EXPECT_EQ(toVector(*cp), toVector(*buf));
    auto flat = buf->reshape({24});
    EXPECT_EQ(flat->shape(), CPUBufferShape({24}));
    EXPECT_EQ(toVector(*flat), toVector(*buf));
    EXPECT_THROW((void)buf->reshape({5, 5}), ShapeException);
    auto scaled = buf->scale(0.5f);
    EXPECT_FLOAT_EQ(toVector(*scaled)[7], 3.5f);
    EXPECT_FLOAT_EQ(toVector(*buf)[7], 7.0f);
}


TEST_F(BufferTest, MappingModes) {
    CPUBuffer buf({2, 2});
    const CPUBuffer & cbuf = buf;
    // mapping attempts must come from another thread, the lock is not recursive
    auto tryRead = [&cbuf]() {
        bool ok = false;
        std::thread thr([&]() {
            const float * ptr = cbuf.map();
            ok = (ptr != nullptr);
            if (ptr) cbuf.unmap();
        });
        thr.join();
        return ok;
    };
    auto tryWrite = [&buf]() {
        bool ok = false;
        std::thread thr([&]() {
            float * ptr = buf.map();
            ok = (ptr != nullptr);
            if (ptr) buf.unmap();
        });
        thr.join();
        return ok;
    };
    {
        WriteMapping map(buf);
        EXPECT_FALSE(tryRead());
        EXPECT_FALSE(tryWrite());
    }
    {
        ReadMapping first(cbuf);
        ReadMapping second(cbuf);
        EXPECT_EQ(first.data(), second.data());
        EXPECT_TRUE(tryRead());
        EXPECT_FALSE(tryWrite());
    }
    EXPECT_TRUE(tryRead());
    EXPECT_TRUE(tryWrite());
}


TEST_F(BufferTest, ReaderWaitsForWriter) {
    CPUBuffer buf({4});
    std::atomic<bool> written{false};
    std::vector<float> seen;
    std::thread reader;
    {
        WriteMapping map(buf);
        reader = std::thread([&]() {
            seen = toVector(buf);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        for (int i=0; i < 4; i++) map.data()[i] = (float)(i + 1);
        written = true;
    }
    reader.join();
    EXPECT_TRUE(written.load());
    EXPECT_EQ(seen, std::vector<float>({1, 2, 3, 4}));
}

// vim: set expandtab ts=4 sw=4:
