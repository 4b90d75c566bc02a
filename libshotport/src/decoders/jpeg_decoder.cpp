//
// Created by the shotport authors on 19/10/25.
//

#include "../../include/jpeg_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <jpeglib.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace shotport {

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
    std::vector<std::string>* warnings = nullptr;
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg warnings (corrupt data, premature end) to the decode result.
 * Trace messages (level > 0) are ignored.
 */
void jpeg_emit_message(const j_common_ptr cinfo, const int msg_level) {
    if (msg_level >= 0) return;
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    if (err->warnings) {
        err->warnings->push_back(std::string("libjpeg: ") + err->msg);
    }
}

/**
 * @brief RAII wrapper for a libjpeg decompressor.
 */
struct JpegRead {
    jpeg_decompress_struct cinfo{};
    bool created = false;

    ~JpegRead() {
        if (created) jpeg_destroy_decompress(&cinfo);
    }
};

} // namespace

bool JpegDecoder::matches_signature(const std::span<const unsigned char> header) const noexcept {
    return header.size() >= 3 && header[0] == 0xFF && header[1] == 0xD8 && header[2] == 0xFF;
}

DecodedImage JpegDecoder::decode(const std::span<const unsigned char> bytes) const {
    if (!matches_signature(bytes)) {
        throw DecodeError("Not a JPEG file (missing SOI marker)");
    }

    DecodedImage result;
    JpegErrorMgr jerr{};
    jerr.warnings = &result.warnings;

    try {
        JpegRead rd;
        // error handlers must be set before any possible error
        rd.cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_error_exit_throw;
        jerr.pub.emit_message = jpeg_emit_message;

        jpeg_create_decompress(&rd.cinfo);
        rd.created = true;

        jpeg_mem_src(&rd.cinfo, const_cast<unsigned char *>(bytes.data()), static_cast<unsigned long>(bytes.size()));

        if (jpeg_read_header(&rd.cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        Logger::log(LogLevel::Debug,
                    std::string("JPEG ") + (rd.cinfo.progressive_mode ? "progressive" : "baseline") +
                    ", components: " + std::to_string(rd.cinfo.num_components),
                    "jpeg_decoder");

        rd.cinfo.out_color_space = JCS_RGB;
        jpeg_start_decompress(&rd.cinfo);

        if (rd.cinfo.output_components != 3) {
            throw std::runtime_error("Unexpected output components: " + std::to_string(rd.cinfo.output_components));
        }

        RasterImage &image = result.image;
        image.width = rd.cinfo.output_width;
        image.height = rd.cinfo.output_height;
        image.layout = PixelLayout::Rgb;
        image.bit_depth = 8;
        image.pixels.resize(image.row_bytes() * image.height);

        const std::size_t row_stride = image.row_bytes();
        while (rd.cinfo.output_scanline < rd.cinfo.output_height) {
            JSAMPROW row_ptr = image.pixels.data() + static_cast<std::size_t>(rd.cinfo.output_scanline) * row_stride;
            jpeg_read_scanlines(&rd.cinfo, &row_ptr, 1);
        }

        jpeg_finish_decompress(&rd.cinfo);
    } catch (const std::exception &e) {
        throw DecodeError(std::string("Invalid JPEG: ") + e.what());
    }

    Logger::log(LogLevel::Debug,
                "JPEG decoded: " + std::to_string(result.image.width) + "x" + std::to_string(result.image.height),
                "jpeg_decoder");
    return result;
}

} // namespace shotport
