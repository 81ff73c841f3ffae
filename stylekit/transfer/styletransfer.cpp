//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Arbitrary Style Transfer
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <random>
#include <vector>

//-------------------------------------- Project  Headers ------------------------------------------

#include "styletransfer.h"
#include "../common/logging.h"
#include "../common/performance.h"

namespace stylekit {

//-------------------------------------- Global Variables ------------------------------------------


//-------------------------------------- Local Definitions -----------------------------------------


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/

/**
 * @brief Constructor
 *
 * @param styleNet Style-prediction model, receives a batched style image and returns the style
 *                 representation (bottleneck)
 * @param transformNet Style-transfer model, receives a batched content image and a bottleneck and
 *                     returns the batched stylized image
 * @param outputScale Factor that is applied to the transform output to obtain pixel values
 *
 * @throws StyleKitException if any of the models is missing
 * @throws InvalidConfigException if \p outputScale is not positive
 */
StyleTransfer::StyleTransfer(std::shared_ptr<GraphModel> styleNet, std::shared_ptr<GraphModel> transformNet, float outputScale) :
      styleNet_(std::move(styleNet)), transformNet_(std::move(transformNet)), outputScale_(outputScale) {
    if ((!styleNet_) || (!transformNet_)) THROW_EXCEPTION_ARGS(StyleKitException, "Style transfer requires a style and a transform model");
    if (!(outputScale_ > 0.0f)) THROW_EXCEPTION_ARGS(InvalidConfigException, "Output scale %f must be positive", (double)outputScale_);
}


/**
 * @brief Warm up both models
 *
 * Runs a single stylization on random data, where the same image serves as style and content.
 */
void StyleTransfer::init() {
    cpu::CPUBuffer input({WARMUP_HEIGHT, WARMUP_WIDTH, 3});
    std::mt19937 rng(0x5eed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    {
        cpu::WriteMapping map(input);
        float * ptr = map.data();
        for (size_t i = 0; i < input.elements(); i++) ptr[i] = dist(rng);
    }
    std::unique_ptr<cpu::CPUBuffer> res = stylize(input, input);
    SKLOGI("Style transfer warmed up, output %s", res->shape().toString().c_str());
}


/**
 * @brief Compute style representation for a style image
 *
 * @param styleImage Style image with shape (height, width, channels) and values in [0,255]
 *
 * @return Style representation as returned by the style network
 */
std::unique_ptr<cpu::CPUBuffer> StyleTransfer::predictStyleParameters(const cpu::CPUBuffer& styleImage) const {
    std::unique_ptr<cpu::CPUBuffer> input = normalizeImage(styleImage);
    return styleNet_->predict({input.get()});
}


/**
 * @brief Render content image in a style
 *
 * @param contentImage Content image with shape (height, width, channels) and values in [0,255]
 * @param bottleneck Style representation as returned by predictStyleParameters()
 *
 * @return Stylized image with shape (height, width, channels), transform output multiplied by the
 *         output scale
 *
 * @throws ShapeException if the transform network does not return a single image
 */
std::unique_ptr<cpu::CPUBuffer> StyleTransfer::produceStylized(const cpu::CPUBuffer& contentImage, const cpu::CPUBuffer& bottleneck) const {
    std::unique_ptr<cpu::CPUBuffer> input = normalizeImage(contentImage);
    std::unique_ptr<cpu::CPUBuffer> image = transformNet_->predict({input.get(), &bottleneck});
    if ((!image) || (image->shape().rank() < 1)) THROW_EXCEPTION_ARGS(ShapeException, "Transform network returned no image");
    std::unique_ptr<cpu::CPUBuffer> scaled = (outputScale_ != 1.0f) ? image->scale(outputScale_) : std::move(image);
    return scaled->reshape(scaled->shape().squeeze(0));
}


/**
 * @brief Stylize an image
 *
 * @param styleImage Image that provides the style, shape (height, width, channels)
 * @param contentImage Image to be stylized, shape (height, width, channels)
 * @param strength Style strength in [0,1], values below 1 blend the style representation with the
 *                 representation of the content image itself
 *
 * @return Stylized content image
 *
 * @throws InvalidConfigException if \p strength is outside [0,1]
 * @throws ShapeException if the style representations of both images differ in shape
 */
std::unique_ptr<cpu::CPUBuffer> StyleTransfer::stylize(const cpu::CPUBuffer& styleImage, const cpu::CPUBuffer& contentImage, float strength) const {
    if ((strength < 0.0f) || (strength > 1.0f)) THROW_EXCEPTION_ARGS(InvalidConfigException, "Style strength %f outside [0,1]", (double)strength);
    tstamp start = sk_get_stamp();
    std::unique_ptr<cpu::CPUBuffer> style = predictStyleParameters(styleImage);
    if (strength < 1.0f) {
        std::unique_ptr<cpu::CPUBuffer> content = predictStyleParameters(contentImage);
        if (content->shape() != style->shape()) {
            THROW_EXCEPTION_ARGS(ShapeException, "Style representations differ in shape (%s vs %s)",
                                 style->shape().toString().c_str(), content->shape().toString().c_str());
        }
        cpu::WriteMapping dst(*style);
        cpu::ReadMapping src(*content);
        float * out = dst.data();
        const float * in = src.data();
        for (size_t i = 0; i < style->elements(); i++) out[i] = strength * out[i] + (1.0f - strength) * in[i];
    }
    std::unique_ptr<cpu::CPUBuffer> stylized = produceStylized(contentImage, *style);
    SKLOGI("Stylization complete in %u ms", sk_elapsed_millis(start, sk_get_stamp()));
    return stylized;
}


/*##################################################################################################
#                               N O N -  P U B L I C  F U N C T I O N S                            #
##################################################################################################*/

/**
 * @brief Scale image to [0,1] and add a batch dimension
 *
 * @param image Image in pixel range
 *
 * @return Batched image in [0,1]
 */
std::unique_ptr<cpu::CPUBuffer> StyleTransfer::normalizeImage(const cpu::CPUBuffer& image) {
    std::unique_ptr<cpu::CPUBuffer> scaled = image.scale(1.0f / 255.0f);
    return scaled->reshape(image.shape().expandDims(0));
}

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
