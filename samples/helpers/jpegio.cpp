//--------------------------------------------------------------------------------------------------
// StyleKit Samples                                                            (c) Fyusion Inc. 2022
//--------------------------------------------------------------------------------------------------
// Barebones JPEG I/O
// Creator: Martin Wawro
// SPDX-License-Identifier: MIT
//--------------------------------------------------------------------------------------------------

//--------------------------------------- System Headers -------------------------------------------

#include <cstdio>
#include <cstdint>
#include <cstring>
#include <csetjmp>
#include <cmath>
#include <vector>
#include <jpeglib.h>

//-------------------------------------- Project  Headers ------------------------------------------

#include <stylekit/common/skexception.h>
#include "jpegio.h"

//-------------------------------------- Global Variables ------------------------------------------

//-------------------------------------- Local Definitions -----------------------------------------

using stylekit::StyleKitException;
using stylekit::cpu::CPUBuffer;
using stylekit::cpu::CPUBufferShape;

namespace {

/**
 * libjpeg error manager that jumps back to the caller instead of terminating the process
 */
struct ErrorManager {
    struct jpeg_error_mgr pub;              //!< Must be first member
    jmp_buf jump;                           //!< Return point on error
    char message[JMSG_LENGTH_MAX];          //!< Formatted libjpeg error message
};


void onJPEGError(j_common_ptr info) {
    auto * mgr = reinterpret_cast<ErrorManager *>(info->err);
    (*info->err->format_message)(info, mgr->message);
    longjmp(mgr->jump, 1);
}


/**
 * @brief Decode JPEG stream into interleaved 8-bit RGB data
 *
 * @param in Opened input file
 * @param[out] pixels Decoded pixel data
 * @param[out] width Image width
 * @param[out] height Image height
 * @param err Error manager that receives the error message on failure
 *
 * @retval true if image was decoded
 * @retval false otherwise, check \p err for the reason
 *
 * @note Keep non-trivial objects out of this function, libjpeg errors return via longjmp
 */
bool decode(FILE *in, std::vector<uint8_t>& pixels, int& width, int& height, ErrorManager& err) {
    struct jpeg_decompress_struct jdcomp;
    jdcomp.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = onJPEGError;
    if (setjmp(err.jump)) {
        jpeg_destroy_decompress(&jdcomp);
        return false;
    }
    jpeg_create_decompress(&jdcomp);
    jpeg_stdio_src(&jdcomp, in);
    jpeg_read_header(&jdcomp, TRUE);
    jdcomp.out_color_space = JCS_RGB;
    jpeg_start_decompress(&jdcomp);
    width = (int)jdcomp.output_width;
    height = (int)jdcomp.output_height;
    if (jdcomp.output_components != 3) {
        snprintf(err.message, sizeof(err.message), "unsupported number of channels (%d)", jdcomp.output_components);
        jpeg_destroy_decompress(&jdcomp);
        return false;
    }
    pixels.resize((size_t)width * (size_t)height * 3);
    while (jdcomp.output_scanline < jdcomp.output_height) {
        JSAMPROW ptr = pixels.data() + (size_t)jdcomp.output_scanline * 3 * width;
        jpeg_read_scanlines(&jdcomp, &ptr, 1);
    }
    jpeg_finish_decompress(&jdcomp);
    jpeg_destroy_decompress(&jdcomp);
    return true;
}


/**
 * @brief Encode interleaved 8-bit RGB data as JPEG
 *
 * @see decode()
 */
bool encode(FILE *out, const uint8_t *pixels, int width, int height, int quality, ErrorManager& err) {
    struct jpeg_compress_struct jcomp;
    jcomp.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = onJPEGError;
    if (setjmp(err.jump)) {
        jpeg_destroy_compress(&jcomp);
        return false;
    }
    jpeg_create_compress(&jcomp);
    jpeg_stdio_dest(&jcomp, out);
    jcomp.input_components = 3;
    jcomp.in_color_space = JCS_RGB;
    jcomp.image_width = width;
    jcomp.image_height = height;
    jpeg_set_defaults(&jcomp);
    jpeg_set_quality(&jcomp, quality, TRUE);
    jpeg_start_compress(&jcomp, TRUE);
    while ((int)jcomp.next_scanline < height) {
        JSAMPROW rowptr = const_cast<JSAMPROW>(pixels + (size_t)jcomp.next_scanline * 3 * width);
        jpeg_write_scanlines(&jcomp, &rowptr, 1);
    }
    jpeg_finish_compress(&jcomp);
    jpeg_destroy_compress(&jcomp);
    return true;
}

} // anonymous namespace


/*##################################################################################################
#                                   P U B L I C  F U N C T I O N S                                 #
##################################################################################################*/


/**
 * @brief Store an RGB image as JPEG
 *
 * @param image Image buffer of shape (height, width, 3), values are clamped to [0,255]
 * @param name Filename
 * @param quality JPEG quality setting (0..100)
 *
 * @throws StyleKitException if the buffer is not an RGB image or the file cannot be written
 */
void JPEGIO::saveRGBImage(const CPUBuffer& image, const std::string& name, int quality) {
    const CPUBufferShape & shape = image.shape();
    if ((shape.rank() != 3) || (shape.dim(2) != 3)) {
        THROW_EXCEPTION_ARGS(StyleKitException, "Cannot store buffer %s as RGB image", shape.toString().c_str());
    }
    int height = shape.dim(0);
    int width = shape.dim(1);
    std::vector<uint8_t> rgb(image.elements());
    image.with([&rgb](const float *src) {
        for (size_t i=0; i < rgb.size(); i++) {
            float val = std::round(src[i]);
            rgb[i] = (uint8_t)((val < 0.f) ? 0.f : ((val > 255.f) ? 255.f : val));
        }
    });
    FILE *outfile = fopen(name.c_str(), "wb");
    if (!outfile) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot open file %s for writing", name.c_str());
    ErrorManager err{};
    bool ok = encode(outfile, rgb.data(), width, height, quality, err);
    if (fclose(outfile) != 0) ok = false;
    if (!ok) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot write JPEG file %s: %s", name.c_str(), err.message);
}


/**
 * @brief Read RGB image from JPEG file
 *
 * @param name Input file name.
 *
 * @return Image buffer of shape (height, width, 3) with values in [0,255]
 *
 * @throws StyleKitException if the file cannot be opened or decoded
 */
std::unique_ptr<CPUBuffer> JPEGIO::loadRGBImage(const std::string& name) {
    FILE * in = fopen(name.c_str(), "rb");
    if (!in) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot open file %s for reading", name.c_str());
    std::vector<uint8_t> rgb;
    int width = 0, height = 0;
    ErrorManager err{};
    bool ok = decode(in, rgb, width, height, err);
    fclose(in);
    if (!ok) THROW_EXCEPTION_ARGS(StyleKitException, "Cannot read JPEG file %s: %s", name.c_str(), err.message);
    auto image = std::make_unique<CPUBuffer>(CPUBufferShape{height, width, 3});
    {
        stylekit::cpu::WriteMapping map(*image);
        float * dst = map.data();
        for (size_t i=0; i < rgb.size(); i++) dst[i] = (float)rgb[i];
    }
    return image;
}


/**
 * @brief Check if a file is a JPEG file
 *
 * @param name Name of file to check for being a JPEG image
 *
 * @retval true if file starts with a JPEG start-of-image marker
 * @retval false otherwise
 *
 * @note This check is rather crude but works for most purposes
 */
bool JPEGIO::isJPEG(const std::string& name) {
    static const uint8_t expected[3] = {0xFF, 0xD8, 0xFF};
    FILE *in = fopen(name.c_str(),"rb");
    if (!in) return false;
    uint8_t buf[3];
    size_t read = fread(buf, 1, sizeof(buf), in);
    fclose(in);
    return (read == sizeof(buf)) && (!memcmp(buf, expected, sizeof(buf)));
}


// vim: set expandtab ts=4 sw=4:
