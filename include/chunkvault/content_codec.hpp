// include/chunkvault/content_codec.hpp
#pragma once

#include <string>
#include <vector>

namespace ChunkVault
{
    namespace Codec
    {

        // Binary-to-text encoding and content digests, backed by OpenSSL.
        class ContentCodec
        {
        public:
            // Standard base64 with '=' padding, no line breaks.
            static std::string encodeBase64(const std::vector<char> &raw);

            // Inverse of encodeBase64. Throws std::invalid_argument on malformed input.
            static std::vector<char> decodeBase64(const std::string &encoded);

            // SHA-256 of data as a lowercase hex string.
            static std::string sha256Hex(const std::string &data);

            // num_bytes of cryptographically random data as hex (2 * num_bytes characters).
            static std::string randomHex(size_t num_bytes);
        };

    } // namespace Codec
} // namespace ChunkVault
