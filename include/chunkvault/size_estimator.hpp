// include/chunkvault/size_estimator.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ChunkVault
{
    namespace Chunks
    {

        class SizeEstimator
        {
        public:
            // Estimated fragment count for a raw payload of raw_bytes once base64 encoded.
            // Uses a 1.34 expansion factor, so it can overshoot by one fragment.
            // Meant for pre-allocation and progress; never for validation.
            // 0 bytes -> 0 chunks (stored inline).
            static size_t estimateChunkCount(uint64_t raw_bytes, size_t max_fragment_size);

            // Exact base64 length of raw_bytes of input.
            static uint64_t encodedLength(uint64_t raw_bytes);

            // Authoritative fragment count for an already-encoded payload.
            static size_t chunkCountForEncodedLength(uint64_t encoded_length, size_t max_fragment_size);

            // "0 Bytes", "512 Bytes", "1.5 KB", "2.54 MB"...
            static std::string formatFileSize(uint64_t bytes);
        };

    } // namespace Chunks
} // namespace ChunkVault
