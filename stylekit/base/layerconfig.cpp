//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Layer Configuration Records
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>

//-------------------------------------- Project  Headers ------------------------------------------

#include "layerconfig.h"
#include "../cpu/reflectionpadlayerbuilder.h"
#include "../cpu/instancenormlayerbuilder.h"
#include "../cpu/deprocesslayerbuilder.h"

namespace stylekit {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------

using json = nlohmann::json;

namespace {

struct ClassEntry {
    LayerType type;
    const char * name;
};

const ClassEntry CLASS_NAMES[] = {
    {LayerType::REFLECTIONPAD2D, "ReflectionPadding2D"},
    {LayerType::INSTANCENORM, "InstanceNormalization"},
    {LayerType::CONDINSTANCENORM, "ConditionalInstanceNormalization"},
    {LayerType::DEPROCESS, "DeprocessStylizedImage"}
};


/**
 * @brief Parse a (before, after) padding pair
 *
 * @param cfg Either a single number (same padding on both sides) or an array with two numbers
 * @param[out] before Padding before the data
 * @param[out] after Padding after the data
 */
void parsePair(const json& cfg, int& before, int& after) {
    if (cfg.is_number_integer()) {
        before = after = cfg.get<int>();
        return;
    }
    if ((!cfg.is_array()) || (cfg.size() != 2)) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Padding pair must have exactly 2 entries, got %s", cfg.dump().c_str());
    }
    if ((!cfg[0].is_number_integer()) || (!cfg[1].is_number_integer())) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Padding values must be integers, got %s", cfg.dump().c_str());
    }
    before = cfg[0].get<int>();
    after = cfg[1].get<int>();
}


/**
 * @brief Read typed options from a layer configuration
 *
 * @throws InvalidConfigException if the option has the wrong JSON type
 */
int intOption(const json& cfg, const char *key) {
    const json & val = cfg.at(key);
    if (!val.is_number_integer()) THROW_EXCEPTION_ARGS(InvalidConfigException, "Option %s must be an integer, got %s", key, val.dump().c_str());
    return val.get<int>();
}

float floatOption(const json& cfg, const char *key) {
    const json & val = cfg.at(key);
    if (!val.is_number()) THROW_EXCEPTION_ARGS(InvalidConfigException, "Option %s must be a number, got %s", key, val.dump().c_str());
    return val.get<float>();
}

bool boolOption(const json& cfg, const char *key) {
    const json & val = cfg.at(key);
    if (!val.is_boolean()) THROW_EXCEPTION_ARGS(InvalidConfigException, "Option %s must be a boolean, got %s", key, val.dump().c_str());
    return val.get<bool>();
}


/**
 * @brief Apply the options that all instance normalization variants share
 */
template<typename D>
void applyNormOptions(cpu::InstanceNormLayerBuilderTempl<D>& bld, const json& cfg) {
    if (cfg.contains("axis")) bld.axis(intOption(cfg, "axis"));
    if (cfg.contains("epsilon")) bld.epsilon(floatOption(cfg, "epsilon"));
    if (cfg.contains("center")) bld.center(boolOption(cfg, "center"));
    if (cfg.contains("scale")) bld.scale(boolOption(cfg, "scale"));
    if (cfg.contains("beta_initializer")) bld.betaInitializer(initializerFromConfig(cfg.at("beta_initializer")));
    if (cfg.contains("gamma_initializer")) bld.gammaInitializer(initializerFromConfig(cfg.at("gamma_initializer")));
}


std::unique_ptr<LayerBuilderBase> createBuilder(LayerType type, const std::string& name, const json& cfg) {
    switch (type) {
        case LayerType::REFLECTIONPAD2D: {
            auto * bld = new cpu::ReflectionPadLayerBuilder(name);
            std::unique_ptr<LayerBuilderBase> result(bld);
            if (cfg.contains("padding")) {
                PaddingSpec pad = paddingFromConfig(cfg.at("padding"));
                bld->padding(pad.top, pad.bottom, pad.left, pad.right);
            }
            if (cfg.contains("dim_ordering")) bld->dimOrdering(dimOrderingFromName(cfg.at("dim_ordering").get<std::string>()));
            return result;
        }
        case LayerType::INSTANCENORM: {
            auto * bld = new cpu::InstanceNormLayerBuilder(name);
            std::unique_ptr<LayerBuilderBase> result(bld);
            applyNormOptions(*bld, cfg);
            return result;
        }
        case LayerType::CONDINSTANCENORM: {
            auto * bld = new cpu::CondInstanceNormLayerBuilder(name);
            std::unique_ptr<LayerBuilderBase> result(bld);
            applyNormOptions(*bld, cfg);
            if (cfg.contains("style_num")) bld->styles(intOption(cfg, "style_num"));
            return result;
        }
        case LayerType::DEPROCESS: {
            auto * bld = new cpu::DeprocessLayerBuilder(name);
            std::unique_ptr<LayerBuilderBase> result(bld);
            if (cfg.contains("activation")) bld->activation(activationFromName(cfg.at("activation").get<std::string>()));
            return result;
        }
        default:
            THROW_EXCEPTION_ARGS(InvalidConfigException, "Unsupported layer type %d", (int)type);
    }
}

} // anonymous namespace

/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Get serialized name of an axis ordering
 *
 * @param order Axis ordering
 *
 * @return Either \c "channelsLast" or \c "channelsFirst"
 */
const char * dimOrderingName(DimOrdering order) {
    return (order == DimOrdering::CHANNELS_FIRST) ? "channelsFirst" : "channelsLast";
}


/**
 * @brief Parse serialized axis ordering
 *
 * @param name Ordering name, the Keras spellings (\c channels_last, \c tf, ...) are accepted as well
 *
 * @return Parsed axis ordering, \c "default" maps to DimOrdering::CHANNELS_LAST
 *
 * @throws InvalidConfigException if the name is not known
 */
DimOrdering dimOrderingFromName(const std::string& name) {
    if ((name == "default") || (name == "channelsLast") || (name == "channels_last") || (name == "tf")) {
        return DimOrdering::CHANNELS_LAST;
    }
    if ((name == "channelsFirst") || (name == "channels_first") || (name == "th")) {
        return DimOrdering::CHANNELS_FIRST;
    }
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unknown dimension ordering \"%s\"", name.c_str());
}


const char * activationName(ActType act) {
    switch (act) {
        case ActType::SIGMOID:
            return "sigmoid";
        case ActType::TANH:
            return "tanh";
    }
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unsupported activation %d", (int)act);
}


/**
 * @brief Parse activation name of a deprocessing layer
 *
 * @param name Activation name, either \c "sigmoid" or \c "tanh"
 *
 * @return Activation type
 *
 * @throws InvalidConfigException for any other name
 */
ActType activationFromName(const std::string& name) {
    if (name == "sigmoid") return ActType::SIGMOID;
    if (name == "tanh") return ActType::TANH;
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unsupported deprocessing activation \"%s\"", name.c_str());
}


/**
 * @brief Generate serialized form of an initializer
 *
 * @param init Initializer
 *
 * @return JSON object like <tt>{"class_name": "Zeros", "config": {}}</tt>
 */
json initializerConfig(Initializer init) {
    json result;
    result["class_name"] = (init == Initializer::ONES) ? "Ones" : "Zeros";
    result["config"] = json::object();
    return result;
}


/**
 * @brief Parse serialized initializer
 *
 * @param cfg Either an object with a \c class_name entry or a plain string (\c "zeros" / \c "ones")
 *
 * @return Initializer
 *
 * @throws InvalidConfigException for unknown initializers or malformed input
 */
Initializer initializerFromConfig(const json& cfg) {
    std::string name;
    if (cfg.is_string()) name = cfg.get<std::string>();
    else if (cfg.is_object() && cfg.contains("class_name") && cfg.at("class_name").is_string()) name = cfg.at("class_name").get<std::string>();
    else THROW_EXCEPTION_ARGS(InvalidConfigException, "Malformed initializer %s", cfg.dump().c_str());
    if ((name == "Zeros") || (name == "zeros")) return Initializer::ZEROS;
    if ((name == "Ones") || (name == "ones")) return Initializer::ONES;
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unsupported initializer \"%s\"", name.c_str());
}


/**
 * @brief Parse padding option of a reflection padding layer
 *
 * @param cfg Padding option, which may be one of the following:
 *            - a single integer, used on all four sides
 *            - a pair <tt>[v, h]</tt>, where \e v is used on top and bottom and \e h on left and right
 *            - a nested pair <tt>[[top, bottom], [left, right]]</tt>
 *
 * @return Parsed padding
 *
 * @throws InvalidConfigException if a pair does not have exactly 2 entries or values are not integers
 *
 * Negative values are not checked here, they are rejected by the layer builder.
 */
PaddingSpec paddingFromConfig(const json& cfg) {
    PaddingSpec result;
    if (cfg.is_number_integer()) {
        result.top = result.bottom = result.left = result.right = cfg.get<int>();
        return result;
    }
    if ((!cfg.is_array()) || (cfg.size() != 2)) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Padding must be a scalar or a pair, got %s", cfg.dump().c_str());
    }
    parsePair(cfg[0], result.top, result.bottom);
    parsePair(cfg[1], result.left, result.right);
    return result;
}


const char * layerClassName(LayerType type) {
    for (const ClassEntry& entry : CLASS_NAMES) {
        if (entry.type == type) return entry.name;
    }
    THROW_EXCEPTION_ARGS(InvalidConfigException, "No class name for layer type %d", (int)type);
}


/**
 * @brief Resolve layer type from its registered class name
 *
 * @param name Class name as found in a configuration record
 *
 * @return Layer type
 *
 * @throws InvalidConfigException if the class name is not registered
 */
LayerType layerTypeFromClassName(const std::string& name) {
    for (const ClassEntry& entry : CLASS_NAMES) {
        if (name == entry.name) return entry.type;
    }
    THROW_EXCEPTION_ARGS(InvalidConfigException, "Unknown layer class \"%s\"", name.c_str());
}


/**
 * @brief Wrap a layer configuration into a class-name tagged record
 *
 * @param type Layer type
 * @param config Layer options as returned by the \c getConfig() method of the layer
 *
 * @return JSON object of the form <tt>{"class_name": ..., "config": ...}</tt>
 */
json makeLayerRecord(LayerType type, const json& config) {
    json record;
    record["class_name"] = layerClassName(type);
    record["config"] = config;
    return record;
}


/**
 * @brief Create a layer builder from a configuration record
 *
 * @param record Class-name tagged configuration record
 * @param layerNumber Number to assign to the builder
 *
 * @return Pointer to builder with all options from the record applied
 *
 * @throws InvalidConfigException if the class name is unknown or the record is malformed
 *
 * Options that are missing from the record keep their default values. When no \c name option is
 * present, the layer is named after its class and number.
 */
std::unique_ptr<LayerBuilderBase> builderFromRecord(const json& record, int layerNumber) {
    if ((!record.is_object()) || (!record.contains("class_name")) || (!record.at("class_name").is_string())) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Layer record without class name: %s", record.dump().c_str());
    }
    std::string clsname = record.at("class_name").get<std::string>();
    LayerType type = layerTypeFromClassName(clsname);
    json cfg = record.contains("config") ? record.at("config") : json::object();
    if (!cfg.is_object()) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Configuration of %s is not an object", clsname.c_str());
    }
    try {
        std::string name = cfg.contains("name") ? cfg.at("name").get<std::string>() : clsname + "_" + std::to_string(layerNumber);
        std::unique_ptr<LayerBuilderBase> bld = createBuilder(type, name, cfg);
        bld->number_ = layerNumber;
        return bld;
    } catch (nlohmann::json::exception& ex) {
        THROW_EXCEPTION_ARGS(InvalidConfigException, "Malformed configuration for %s: %s", clsname.c_str(), ex.what());
    }
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
