//
// Created by the shotport authors on 19/10/25.
//

#include "../../include/png_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/exif_block.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring> // IDE may say it's unused, but it's lying to you
#include <stdexcept>
#include <string>
#include <vector>

namespace shotport {

    namespace {

        /**
         * @brief libpng error handler that throws a C++ exception.
         * @param msg The error message from libpng.
         */
        void png_error_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
            throw std::runtime_error(msg);
        }

        /**
         * @brief libpng warning handler.
         * @param msg The warning message from libpng.
         */
        void png_warning_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
        }

        /**
         * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
         * Ensures png_destroy_read_struct is called even if exceptions occur.
         */
        struct PngRead {
            png_structp png = nullptr;
            png_infop info = nullptr;

            explicit PngRead() = default;

            ~PngRead() {
                if (png || info) png_destroy_read_struct(&png, &info, nullptr);
            }
        };

        /**
         * @brief Cursor over the in-memory PNG handed to png_set_read_fn.
         */
        struct MemoryReader {
            std::span<const unsigned char> data;
            std::size_t offset = 0;
        };

        void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
            auto *reader = static_cast<MemoryReader *>(png_get_io_ptr(png));
            if (reader->data.size() - reader->offset < length) {
                png_error(png, "Read past end of PNG data");
            }
            std::memcpy(out, reader->data.data() + reader->offset, length);
            reader->offset += length;
        }

        /**
         * @brief Reads the image into a canonical RGB/RGBA buffer.
         * @param png The libpng read struct, positioned after png_read_info.
         * @param info The libpng info struct.
         * @return The decoded raster.
         */
        RasterImage read_canonical(png_structp png, png_infop info) {
            png_uint_32 width, height;
            int bit_depth, color_type;
            png_get_IHDR(png, info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

            if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(png);
            if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(png);
            if (png_get_valid(png, info, PNG_INFO_tRNS)) png_set_tRNS_to_alpha(png);
            if (color_type == PNG_COLOR_TYPE_GRAY || color_type == PNG_COLOR_TYPE_GRAY_ALPHA) png_set_gray_to_rgb(png);
            png_set_interlace_handling(png);

            png_read_update_info(png, info);
            // now the buffer is rgb or rgba, at 8 or 16 bits

            RasterImage image;
            image.width = width;
            image.height = height;
            image.bit_depth = static_cast<std::uint8_t>(png_get_bit_depth(png, info));
            image.layout = (png_get_color_type(png, info) & PNG_COLOR_MASK_ALPHA) ? PixelLayout::Rgba : PixelLayout::Rgb;

            const std::size_t rowbytes = png_get_rowbytes(png, info);
            if (rowbytes != image.row_bytes()) {
                throw std::runtime_error("Rowbytes mismatch, expected RGB(A) at 8 or 16 bits");
            }

            image.pixels.resize(rowbytes * height);
            std::vector<png_bytep> row_pointers(height);
            for (png_uint_32 y = 0; y < height; ++y) {
                row_pointers[y] = image.pixels.data() + y * rowbytes;
            }

            png_read_image(png, row_pointers.data());
            png_read_end(png, info);

            return image;
        }

        /**
         * @brief Walks the raw chunk stream and fills the carry-over set.
         */
        void collect_chunks(const std::span<const unsigned char> bytes, DecodedImage &out) {
            for (auto &chunk : parse_png_chunks(bytes)) {
                const std::string type(chunk.type_name());

                if (!chunk.crc_ok) {
                    if (chunk.is_ancillary()) {
                        out.warnings.push_back("Dropped " + type + " chunk with bad CRC");
                    }
                    continue;
                }
                // bKGD layout depends on the color type; only the RGB form matches the output
                if (chunk.is("bKGD") && chunk.data.size() != 6) {
                    out.warnings.push_back("Dropped bKGD chunk not in RGB form");
                    continue;
                }
                if (chunk.is("eXIf") && !has_tiff_header(chunk.data)) {
                    out.warnings.push_back("Source eXIf chunk has no TIFF header; kept verbatim");
                }

                const bool retained = out.chunks.add(std::move(chunk));
                Logger::log(LogLevel::Debug, (retained ? "Kept chunk " : "Skipped chunk ") + type, "png_decoder");
            }
        }

    } // namespace

    bool PngDecoder::matches_signature(const std::span<const unsigned char> header) const noexcept {
        return has_png_signature(header);
    }

    DecodedImage PngDecoder::decode(const std::span<const unsigned char> bytes) const {
        if (!has_png_signature(bytes)) {
            throw DecodeError("Not a PNG file (bad signature)");
        }

        DecodedImage result;
        try {
            PngRead rd;
            rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
            if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
            png_set_error_fn(rd.png, nullptr, png_error_fn, png_warning_fn);

            rd.info = png_create_info_struct(rd.png);
            if (!rd.info) throw std::runtime_error("png_create_info_struct failed");
            if (setjmp(png_jmpbuf(rd.png))) throw std::runtime_error("libpng error");

            png_set_benign_errors(rd.png, 1);

            MemoryReader reader{bytes, 0};
            png_set_read_fn(rd.png, &reader, read_from_memory);
            png_read_info(rd.png, rd.info);

            result.image = read_canonical(rd.png, rd.info);
            collect_chunks(bytes, result);
        } catch (const std::exception &e) {
            throw DecodeError(std::string("Invalid PNG: ") + e.what());
        }

        Logger::log(LogLevel::Debug,
                    "PNG decoded: " + std::to_string(result.image.width) + "x" + std::to_string(result.image.height) +
                    ", " + std::to_string(result.chunks.size()) + " ancillary chunks retained",
                    "png_decoder");
        return result;
    }

} // namespace shotport
