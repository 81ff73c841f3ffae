//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Configuration Unit Tests
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>

//-------------------------------------- Project  Headers ------------------------------------------

#include <gtest/gtest.h>
#include <stylekit/stylekit.h>

//-------------------------------------- Global Variables ------------------------------------------

//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

using namespace stylekit;
using namespace stylekit::cpu;
using json = nlohmann::json;

int main(int argc,char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

/**
 * @brief Create a layer from a configuration record via the layer factory
 */
static CPULayer createFromRecord(const json& record) {
    auto factory = LayerFactory::instance();
    factory->pushBuilder(builderFromRecord(record, 0).release());
    CompiledLayers layers = factory->compileLayers();
    EXPECT_EQ(layers.numLayers(), 1u);
    return *layers[0];
}


TEST(LayerConfig, PaddingForms) {
    PaddingSpec scalar = paddingFromConfig(json(3));
    EXPECT_EQ(scalar.top, 3);
    EXPECT_EQ(scalar.right, 3);
    PaddingSpec pair = paddingFromConfig(json::parse("[2, 5]"));
    EXPECT_EQ(pair.top, 2);
    EXPECT_EQ(pair.bottom, 2);
    EXPECT_EQ(pair.left, 5);
    EXPECT_EQ(pair.right, 5);
    PaddingSpec nested = paddingFromConfig(json::parse("[[1, 2], [3, 4]]"));
    EXPECT_EQ(nested.top, 1);
    EXPECT_EQ(nested.bottom, 2);
    EXPECT_EQ(nested.left, 3);
    EXPECT_EQ(nested.right, 4);
}


TEST(LayerConfig, MalformedPadding) {
    EXPECT_THROW((void)paddingFromConfig(json::parse("[1, 2, 3]")), InvalidConfigException);
    EXPECT_THROW((void)paddingFromConfig(json::parse("[[1, 2, 3], [1, 1]]")), InvalidConfigException);
    EXPECT_THROW((void)paddingFromConfig(json::parse("[[1], [1, 1]]")), InvalidConfigException);
    EXPECT_THROW((void)paddingFromConfig(json::parse("\"same\"")), InvalidConfigException);
    json negative = {{"class_name", "ReflectionPadding2D"}, {"config", {{"padding", -1}}}};
    EXPECT_THROW((void)builderFromRecord(negative, 0), InvalidPaddingException);
}


TEST(LayerConfig, PaddingRoundTrip) {
    json record = json::parse(R"({"class_name": "ReflectionPadding2D",
                                  "config": {"name": "pad1", "padding": [2, 3], "dim_ordering": "channels_first"}})");
    CPULayer layer = createFromRecord(record);
    ASSERT_TRUE(std::holds_alternative<ReflectionPadLayer>(layer));
    const auto & pad = std::get<ReflectionPadLayer>(layer);
    EXPECT_EQ(pad.top(), 2);
    EXPECT_EQ(pad.left(), 3);
    EXPECT_EQ(pad.dimOrdering(), DimOrdering::CHANNELS_FIRST);
    json out = layerRecord(layer);
    EXPECT_EQ(out["class_name"], "ReflectionPadding2D");
    EXPECT_EQ(out["config"]["padding"], json::parse("[[2, 2], [3, 3]]"));
    EXPECT_EQ(out["config"]["dim_ordering"], "channelsFirst");
    EXPECT_EQ(layerRecord(createFromRecord(out)), out);
}


TEST(LayerConfig, NormRoundTrip) {
    json record = json::parse(R"({"class_name": "ConditionalInstanceNormalization",
                                  "config": {"name": "cin", "axis": -1, "epsilon": 0.00001, "center": false,
                                             "scale": true, "beta_initializer": "zeros",
                                             "gamma_initializer": {"class_name": "Ones", "config": {}},
                                             "style_num": 4}})");
    CPULayer layer = createFromRecord(record);
    ASSERT_TRUE(std::holds_alternative<CondInstanceNormLayer>(layer));
    const auto & norm = std::get<CondInstanceNormLayer>(layer);
    EXPECT_EQ(norm.styles(), 4);
    EXPECT_FALSE(norm.hasCenter());
    EXPECT_TRUE(norm.hasScale());
    EXPECT_FLOAT_EQ(norm.epsilon(), 1e-5f);
    json out = layerRecord(layer);
    EXPECT_EQ(out["config"]["style_num"], 4);
    EXPECT_EQ(out["config"]["beta_initializer"]["class_name"], "Zeros");
    EXPECT_EQ(out["config"]["gamma_initializer"]["class_name"], "Ones");
    EXPECT_EQ(layerRecord(createFromRecord(out)), out);
}


TEST(LayerConfig, Defaults) {
    CPULayer norm = createFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {}})"));
    const auto & inorm = std::get<InstanceNormLayer>(norm);
    EXPECT_EQ(inorm.axis(), -1);
    EXPECT_FLOAT_EQ(inorm.epsilon(), 1e-3f);
    EXPECT_TRUE(inorm.hasCenter());
    EXPECT_TRUE(inorm.hasScale());
    EXPECT_EQ(inorm.gammaInitializer(), Initializer::ONES);
    EXPECT_EQ(inorm.betaInitializer(), Initializer::ZEROS);
    CPULayer pad = createFromRecord(json::parse(R"({"class_name": "ReflectionPadding2D"})"));
    EXPECT_EQ(std::get<ReflectionPadLayer>(pad).bottom(), 1);
    CPULayer dep = createFromRecord(json::parse(R"({"class_name": "DeprocessStylizedImage", "config": {"name": "d"}})"));
    EXPECT_EQ(std::get<DeprocessLayer>(dep).activation(), ActType::SIGMOID);
    EXPECT_EQ(layerBase(dep).getName(), "d");
}


TEST(LayerConfig, UnknownClass) {
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "Conv2D", "config": {}})"), 0), InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"config": {}})"), 0), InvalidConfigException);
    EXPECT_THROW((void)layerTypeFromClassName("BatchNormalization"), InvalidConfigException);
}


TEST(LayerConfig, MalformedOptions) {
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"epsilon": "small"}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"gamma_initializer": "glorot"}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "ReflectionPadding2D", "config": {"dim_ordering": "nhwc"}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "ConditionalInstanceNormalization", "config": {"style_num": 0}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "DeprocessStylizedImage", "config": []})"), 0),
                 InvalidConfigException);
    // numeric options must not be truncated or coerced
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"axis": -1.7}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "ConditionalInstanceNormalization", "config": {"style_num": 2.9}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"epsilon": true}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"center": 1}})"), 0),
                 InvalidConfigException);
    EXPECT_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"scale": "yes"}})"), 0),
                 InvalidConfigException);
    EXPECT_NO_THROW((void)builderFromRecord(json::parse(R"({"class_name": "InstanceNormalization", "config": {"axis": 3, "epsilon": 1, "center": false}})"), 0));
}


TEST(LayerConfig, ClassNames) {
    for (int t=(int)LayerType::REFLECTIONPAD2D; t < (int)LayerType::LAST_SUPPORTED; t++) {
        EXPECT_EQ(layerTypeFromClassName(layerClassName((LayerType)t)), (LayerType)t);
    }
    EXPECT_EQ(dimOrderingFromName("tf"), DimOrdering::CHANNELS_LAST);
    EXPECT_EQ(dimOrderingFromName("th"), DimOrdering::CHANNELS_FIRST);
    EXPECT_EQ(activationFromName("tanh"), ActType::TANH);
    EXPECT_THROW((void)activationFromName("linear"), InvalidConfigException);
}


TEST(LayerFactoryTest, DuplicateNumbers) {
    auto factory = LayerFactory::instance();
    auto * first = new InstanceNormLayerBuilder("a");
    first->number(2).push(factory);
    auto * second = new DeprocessLayerBuilder("b");
    second->number(2);
    EXPECT_THROW(second->push(factory), StyleKitException);
    auto * third = new ReflectionPadLayerBuilder("c");
    EXPECT_THROW(factory->pushBuilder(third), StyleKitException);
    EXPECT_EQ(factory->numBuilders(), 1u);
    EXPECT_EQ(factory->getName(), "CPU");
}

// vim: set expandtab ts=4 sw=4:
