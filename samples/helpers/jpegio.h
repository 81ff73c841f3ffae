//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Barebones JPEG I/O (Header)
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

#pragma once

//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <string>
#include <memory>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/cpu/cpubuffer.h>

//------------------------------------- Public Declarations ----------------------------------------


/**
 * @brief Simple JPEG reader/writer
 *
 * Images are exchanged as CPU buffers of shape (height, width, 3) holding RGB values in the pixel
 * range [0,255]. Grayscale JPEG files are expanded to RGB when reading.
 */
class JPEGIO {
 public:
    static bool isJPEG(const std::string& name);
    static void saveRGBImage(const stylekit::cpu::CPUBuffer& image, const std::string& name, int quality=90);
    static std::unique_ptr<stylekit::cpu::CPUBuffer> loadRGBImage(const std::string& name);
};


// vim: set expandtab ts=4 sw=4:
