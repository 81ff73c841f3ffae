//--------------------------------------------------------------------------------------------------
// StyleKit                                                               (c) Fyusion Inc. 2016-2022
//--------------------------------------------------------------------------------------------------
// Arbitrary Style Transfer (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <memory>

//-------------------------------------- Project  Headers ------------------------------------------

#include "../base/graphmodel.h"
#include "../cpu/cpubuffer.h"

//------------------------------------- Public Declarations ----------------------------------------

namespace stylekit {

/**
 * @brief Arbitrary image stylization using a style-prediction and a style-transfer model
 *
 * This class composes two models:
 *   - the \e style network, which maps a style image to a (bottleneck) style representation
 *   - the \e transform network, which takes a content image and a style representation and
 *     renders the content image in that style
 *
 * Images are supplied as 3D tensors of shape (height, width, 3) with pixel values in the range
 * [0,255]. Both models receive batched images with values scaled to [0,1]. The output of the
 * transform network is multiplied by an output scale. The default of 255 maps a transform output in
 * [0,1] to pixel range, transform networks that already end in pixel range (for example with a
 * tanh DeprocessLayer) use a scale of 1.
 *
 * @code
 * StyleTransfer transfer(styleNet, transformNet);
 * transfer.init();
 * auto result = transfer.stylize(*style, *content, 0.8f);
 * @endcode
 */
class StyleTransfer {
 public:
    // ------------------------------------------------------------------------
    // Constructor / Destructor
    // ------------------------------------------------------------------------
    StyleTransfer(std::shared_ptr<GraphModel> styleNet, std::shared_ptr<GraphModel> transformNet, float outputScale = 255.0f);

    // ------------------------------------------------------------------------
    // Public methods
    // ------------------------------------------------------------------------
    void init();
    [[nodiscard]] std::unique_ptr<cpu::CPUBuffer> predictStyleParameters(const cpu::CPUBuffer& styleImage) const;
    [[nodiscard]] std::unique_ptr<cpu::CPUBuffer> produceStylized(const cpu::CPUBuffer& contentImage, const cpu::CPUBuffer& bottleneck) const;
    [[nodiscard]] std::unique_ptr<cpu::CPUBuffer> stylize(const cpu::CPUBuffer& styleImage, const cpu::CPUBuffer& contentImage,
                                                          float strength = 1.0f) const;

    /**
     * @brief Size of the random image that is used to warm up the models in init()
     */
    static constexpr int WARMUP_HEIGHT = 240;
    static constexpr int WARMUP_WIDTH = 320;

    [[nodiscard]] float outputScale() const {
        return outputScale_;
    }

 private:
    // ------------------------------------------------------------------------
    // Non-public methods
    // ------------------------------------------------------------------------
    static std::unique_ptr<cpu::CPUBuffer> normalizeImage(const cpu::CPUBuffer& image);

    // ------------------------------------------------------------------------
    // Member variables
    // ------------------------------------------------------------------------
    std::shared_ptr<GraphModel> styleNet_;          //!< Maps style images to style representations
    std::shared_ptr<GraphModel> transformNet_;      //!< Renders content images in a given style
    float outputScale_ = 255.0f;                    //!< Factor that maps transform output to pixel range
};

} // stylekit namespace

// vim: set expandtab ts=4 sw=4:
