// include/chunkvault/preprocessor.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ChunkVault
{
    namespace Preprocess
    {

        // Decoded 8-bit raster, rows packed top to bottom.
        struct RasterImage
        {
            size_t width = 0;
            size_t height = 0;
            int components = 0; // 1 (grayscale), 3 (RGB) or 4 (CMYK)
            std::vector<unsigned char> pixels;
        };

        // Optional lossy size reduction before chunking. Only JPEG payloads are
        // re-encoded; everything else passes through unchanged.
        class Preprocessor
        {
        public:
            // True for the content types reduce() will actually re-encode.
            static bool isReducible(const std::string &content_type);

            // Returns a new buffer, never touches payload. quality is in (0, 1].
            // The result is never larger than payload.
            // Throws PreprocessingError on a bad quality or undecodable image data.
            static std::vector<char> reduce(const std::vector<char> &payload,
                                            const std::string &content_type,
                                            double quality);

            // Throws PreprocessingError on corrupt input, including data libjpeg
            // only warns about (truncated streams).
            static RasterImage decodeJpeg(const std::vector<char> &jpeg);

            static std::vector<char> encodeJpeg(const RasterImage &image, double quality);
        };

    } // namespace Preprocess
} // namespace ChunkVault
