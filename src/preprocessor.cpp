// src/preprocessor.cpp
#include "chunkvault/preprocessor.hpp"
#include "chunkvault/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <csetjmp>
#include <cstdio> // jpeglib.h needs FILE
#include <cstdlib>
#include <memory>

#include <jpeglib.h>

namespace ChunkVault
{
    namespace Preprocess
    {
        namespace
        {
            // libjpeg reports fatal errors through error_exit, which must not return.
            // We jump back to the setjmp in the calling function and throw from there.
            struct JpegErrorManager
            {
                jpeg_error_mgr pub;
                jmp_buf jump;
                char message[JMSG_LENGTH_MAX];
            };

            void onJpegError(j_common_ptr cinfo)
            {
                auto *err = reinterpret_cast<JpegErrorManager *>(cinfo->err);
                (*cinfo->err->format_message)(cinfo, err->message);
                std::longjmp(err->jump, 1);
            }

            // Warnings (e.g. premature end of data) are counted, not printed
            void onJpegMessage(j_common_ptr cinfo, int msg_level)
            {
                if (msg_level < 0)
                {
                    cinfo->err->num_warnings++;
                }
            }

            struct MemoryDestination
            {
                unsigned char *buffer = nullptr;
                unsigned long size = 0;

                ~MemoryDestination() { std::free(buffer); }
            };

            int toLibjpegQuality(double quality)
            {
                int q = static_cast<int>(std::lround(quality * 100.0));
                return std::min(100, std::max(1, q));
            }

            void requireValidQuality(double quality)
            {
                if (!(quality > 0.0 && quality <= 1.0))
                {
                    throw PreprocessingError("quality must be in (0, 1], got " + std::to_string(quality));
                }
            }
        } // namespace

        bool Preprocessor::isReducible(const std::string &content_type)
        {
            std::string type = content_type.substr(0, content_type.find(';'));
            type.erase(std::remove_if(type.begin(), type.end(), [](unsigned char c)
                                      { return std::isspace(c); }),
                       type.end());
            std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return type == "image/jpeg" || type == "image/jpg" || type == "image/pjpeg";
        }

        RasterImage Preprocessor::decodeJpeg(const std::vector<char> &jpeg)
        {
            if (jpeg.empty())
            {
                throw PreprocessingError("empty image payload");
            }

            // Held on the heap so a longjmp out of libjpeg leaves the pointer itself intact
            auto image = std::make_unique<RasterImage>();
            jpeg_decompress_struct dinfo;
            JpegErrorManager jerr;
            dinfo.err = jpeg_std_error(&jerr.pub);
            jerr.pub.error_exit = onJpegError;
            jerr.pub.emit_message = onJpegMessage;

            if (setjmp(jerr.jump))
            {
                jpeg_destroy_decompress(&dinfo);
                throw PreprocessingError(std::string("cannot decode JPEG: ") + jerr.message);
            }

            jpeg_create_decompress(&dinfo);
            jpeg_mem_src(&dinfo, reinterpret_cast<unsigned char *>(const_cast<char *>(jpeg.data())),
                         static_cast<unsigned long>(jpeg.size()));
            jpeg_read_header(&dinfo, TRUE);
            jpeg_start_decompress(&dinfo);

            image->width = dinfo.output_width;
            image->height = dinfo.output_height;
            image->components = dinfo.output_components;
            const size_t row_stride = image->width * static_cast<size_t>(image->components);
            image->pixels.resize(row_stride * image->height);

            while (dinfo.output_scanline < dinfo.output_height)
            {
                JSAMPROW row = &image->pixels[static_cast<size_t>(dinfo.output_scanline) * row_stride];
                jpeg_read_scanlines(&dinfo, &row, 1);
            }
            jpeg_finish_decompress(&dinfo);
            long warnings = jerr.pub.num_warnings;
            jpeg_destroy_decompress(&dinfo);

            if (warnings > 0)
            {
                throw PreprocessingError("JPEG data is corrupt or truncated");
            }
            return std::move(*image);
        }

        std::vector<char> Preprocessor::encodeJpeg(const RasterImage &image, double quality)
        {
            requireValidQuality(quality);
            if (image.width == 0 || image.height == 0 ||
                image.pixels.size() != image.width * image.height * static_cast<size_t>(image.components))
            {
                throw PreprocessingError("raster dimensions do not match pixel data");
            }

            J_COLOR_SPACE color_space;
            switch (image.components)
            {
            case 1:
                color_space = JCS_GRAYSCALE;
                break;
            case 3:
                color_space = JCS_RGB;
                break;
            case 4:
                color_space = JCS_CMYK;
                break;
            default:
                throw PreprocessingError("unsupported component count " + std::to_string(image.components));
            }

            // Held on the heap so its contents survive a longjmp intact
            auto destination = std::make_unique<MemoryDestination>();
            jpeg_compress_struct cinfo;
            JpegErrorManager jerr;
            cinfo.err = jpeg_std_error(&jerr.pub);
            jerr.pub.error_exit = onJpegError;
            jerr.pub.emit_message = onJpegMessage;

            if (setjmp(jerr.jump))
            {
                jpeg_destroy_compress(&cinfo);
                throw PreprocessingError(std::string("cannot encode JPEG: ") + jerr.message);
            }

            jpeg_create_compress(&cinfo);
            jpeg_mem_dest(&cinfo, &destination->buffer, &destination->size);
            cinfo.image_width = static_cast<JDIMENSION>(image.width);
            cinfo.image_height = static_cast<JDIMENSION>(image.height);
            cinfo.input_components = image.components;
            cinfo.in_color_space = color_space;
            jpeg_set_defaults(&cinfo);
            jpeg_set_quality(&cinfo, toLibjpegQuality(quality), TRUE);
            jpeg_start_compress(&cinfo, TRUE);

            const size_t row_stride = image.width * static_cast<size_t>(image.components);
            while (cinfo.next_scanline < cinfo.image_height)
            {
                JSAMPROW row = const_cast<JSAMPROW>(&image.pixels[static_cast<size_t>(cinfo.next_scanline) * row_stride]);
                jpeg_write_scanlines(&cinfo, &row, 1);
            }
            jpeg_finish_compress(&cinfo);
            jpeg_destroy_compress(&cinfo);

            return std::vector<char>(reinterpret_cast<const char *>(destination->buffer),
                                     reinterpret_cast<const char *>(destination->buffer) + destination->size);
        }

        std::vector<char> Preprocessor::reduce(const std::vector<char> &payload,
                                               const std::string &content_type,
                                               double quality)
        {
            requireValidQuality(quality);
            if (!isReducible(content_type))
            {
                return payload;
            }

            std::vector<char> reencoded = encodeJpeg(decodeJpeg(payload), quality);
            if (reencoded.size() >= payload.size())
            {
                return payload;
            }
            return reencoded;
        }

    } // namespace Preprocess
} // namespace ChunkVault
