//
// Created by the shotport authors on 06/11/25.
//

#include "../../include/png_assembler.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace shotport {

    namespace {

        void png_error_fn(png_structp, const png_const_charp msg) {
            throw std::runtime_error(msg);
        }

        void png_warning_fn(png_structp, const png_const_charp msg) {
            Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
        }

        /**
         * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
         * Ensures png_destroy_write_struct is called even if exceptions occur.
         */
        struct PngWrite {
            png_structp png = nullptr;
            png_infop info = nullptr;

            explicit PngWrite() = default;

            ~PngWrite() {
                if (png || info) png_destroy_write_struct(&png, &info);
            }
        };

        void write_to_memory(const png_structp png, const png_bytep data, const png_size_t length) {
            auto *out = static_cast<std::vector<unsigned char> *>(png_get_io_ptr(png));
            out->insert(out->end(), data, data + length);
        }

        void flush_noop(png_structp) {}

        int png_color_type_of(const RasterImage& image) {
            return image.has_alpha() ? PNG_COLOR_TYPE_RGBA : PNG_COLOR_TYPE_RGB;
        }

        void validate(const RasterImage& image) {
            if (image.width == 0 || image.height == 0) {
                throw AssemblyError("Image has zero dimensions (" + std::to_string(image.width) + "x" +
                                    std::to_string(image.height) + ")");
            }
            if (image.width > PNG_UINT_31_MAX || image.height > PNG_UINT_31_MAX) {
                throw AssemblyError("Image dimensions exceed the PNG limit");
            }
            if (image.layout != PixelLayout::Rgb && image.layout != PixelLayout::Rgba) {
                throw AssemblyError("Unsupported color type");
            }
            if (image.bit_depth != 8 && image.bit_depth != 16) {
                throw AssemblyError("Unsupported bit depth: " + std::to_string(image.bit_depth));
            }
            if (image.pixels.size() != image.row_bytes() * image.height) {
                throw AssemblyError("Pixel buffer size " + std::to_string(image.pixels.size()) +
                                    " does not match " + std::to_string(image.row_bytes() * image.height));
            }
        }

    } // namespace

    std::vector<unsigned char> make_ihdr_payload(const RasterImage& image) {
        std::vector<unsigned char> ihdr(13);
        png_save_uint_32(ihdr.data(), image.width);
        png_save_uint_32(ihdr.data() + 4, image.height);
        ihdr[8] = image.bit_depth;
        ihdr[9] = static_cast<unsigned char>(png_color_type_of(image));
        ihdr[10] = PNG_COMPRESSION_TYPE_BASE;
        ihdr[11] = PNG_FILTER_TYPE_BASE;
        ihdr[12] = PNG_INTERLACE_NONE;
        return ihdr;
    }

    std::vector<unsigned char> default_chunk_payload(const std::string_view type, const RasterImage& image) {
        if (type == "sRGB") {
            return {kDefaultRenderingIntent};
        }
        if (type == "eXIf") {
            return build_default_exif();
        }
        if (type == "pHYs") {
            std::vector<unsigned char> phys(9);
            png_save_uint_32(phys.data(), kDefaultPixelsPerMeter);
            png_save_uint_32(phys.data() + 4, kDefaultPixelsPerMeter);
            phys[8] = PNG_RESOLUTION_METER;
            return phys;
        }
        if (type == "sBIT") {
            return std::vector<unsigned char>(image.channels(), 8);
        }
        throw std::invalid_argument("No default payload for chunk type " + std::string(type));
    }

    PngAssembler::PngAssembler(const AssemblerOptions options) : options_(options) {
        options_.compression_level = std::clamp(options_.compression_level, 0, 9);
    }

    std::vector<PngChunk> PngAssembler::encode_idat(const RasterImage& image) const {
        std::vector<unsigned char> encoded;
        try {
            PngWrite wr;
            wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
            if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
            png_set_error_fn(wr.png, nullptr, png_error_fn, png_warning_fn);
            wr.info = png_create_info_struct(wr.png);
            if (!wr.info) throw std::runtime_error("png_create_info_struct failed");
            if (setjmp(png_jmpbuf(wr.png))) throw std::runtime_error("libpng write error");

            png_set_write_fn(wr.png, &encoded, write_to_memory, flush_noop);

            png_set_compression_level(wr.png, options_.compression_level);
            png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
            png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

            png_set_IHDR(wr.png, wr.info, image.width, image.height, image.bit_depth, png_color_type_of(image),
                         PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
            png_write_info(wr.png, wr.info);

            const std::size_t rowbytes = image.row_bytes();
            for (png_uint_32 y = 0; y < image.height; ++y) {
                // libpng does not modify rows on write without transforms
                auto row = const_cast<png_bytep>(image.pixels.data() + y * rowbytes);
                png_write_row(wr.png, row);
            }
            png_write_end(wr.png, nullptr);
        } catch (const std::exception& e) {
            throw AssemblyError(std::string("IDAT encoding failed: ") + e.what());
        }

        std::vector<PngChunk> idat;
        for (auto& chunk : parse_png_chunks(encoded)) {
            if (chunk.is("IDAT")) idat.push_back(std::move(chunk));
        }
        if (idat.empty()) {
            throw AssemblyError("libpng produced no IDAT chunk");
        }
        return idat;
    }

    AssembledPng PngAssembler::assemble(const RasterImage& image, const AncillaryChunkSet& chunks) const {
        validate(image);

        AssembledPng result;

        // preserve the source chunk if present, else synthesize the default
        auto injected = [&](const std::string_view type) {
            if (const PngChunk* src = chunks.preserved(type)) {
                if (type == "sBIT" && src->data.size() != image.channels()) {
                    result.warnings.push_back("Source sBIT has " + std::to_string(src->data.size()) +
                                              " channels, output has " + std::to_string(image.channels()) +
                                              "; default written");
                } else {
                    return *src;
                }
            }
            return PngChunk(type, default_chunk_payload(type, image));
        };

        std::vector<PngChunk> out;
        out.reserve(chunks.carried().size() + 8);
        out.emplace_back("IHDR", make_ihdr_payload(image));
        out.push_back(injected("sRGB"));
        out.insert(out.end(), chunks.carried().begin(), chunks.carried().end());
        out.push_back(injected("eXIf"));
        out.push_back(injected("pHYs"));
        out.push_back(injected("sBIT"));
        for (auto& idat : encode_idat(image)) {
            out.push_back(std::move(idat));
        }
        out.emplace_back("IEND", std::vector<unsigned char>{});

        result.bytes = serialize_png(out);
        Logger::log(LogLevel::Debug,
                    "Assembled PNG: " + std::to_string(out.size()) + " chunks, " +
                    std::to_string(result.bytes.size()) + " bytes",
                    "png_assembler");
        return result;
    }

    std::vector<unsigned char> restore_chunk_layout(const std::span<const unsigned char> png) {
        std::optional<PngChunk> ihdr;
        std::array<std::optional<PngChunk>, kInjectedChunkTypes.size()> injected{};
        std::vector<PngChunk> middle;
        std::vector<PngChunk> idat;

        for (auto& chunk : parse_png_chunks(png)) {
            if (chunk.is("IHDR")) {
                if (!ihdr) ihdr = std::move(chunk);
                continue;
            }
            if (chunk.is("IDAT")) {
                idat.push_back(std::move(chunk));
                continue;
            }
            if (chunk.is("IEND")) {
                continue;
            }
            const auto it = std::find(kInjectedChunkTypes.begin(), kInjectedChunkTypes.end(), chunk.type_name());
            if (it != kInjectedChunkTypes.end()) {
                auto& slot = injected[static_cast<std::size_t>(it - kInjectedChunkTypes.begin())];
                if (!slot) slot = std::move(chunk);
                continue;
            }
            middle.push_back(std::move(chunk));
        }

        if (!ihdr) {
            throw std::runtime_error("PNG stream has no IHDR chunk");
        }

        std::vector<PngChunk> out;
        out.reserve(middle.size() + idat.size() + 6);
        out.push_back(std::move(*ihdr));
        if (injected[0]) out.push_back(std::move(*injected[0])); // sRGB
        for (auto& c : middle) out.push_back(std::move(c));
        for (std::size_t i = 1; i < injected.size(); ++i) {       // eXIf, pHYs, sBIT
            if (injected[i]) out.push_back(std::move(*injected[i]));
        }
        for (auto& c : idat) out.push_back(std::move(c));
        out.emplace_back("IEND", std::vector<unsigned char>{});

        return serialize_png(out);
    }

} // namespace shotport
