// src/content_codec.cpp
#include "chunkvault/content_codec.hpp"
#include <climits>   // For INT_MAX
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

// Link OpenSSL::Crypto for these
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace ChunkVault
{
    namespace Codec
    {
        namespace
        {
            std::string toHex(const unsigned char *bytes, size_t len)
            {
                std::stringstream ss;
                for (size_t i = 0; i < len; i++)
                {
                    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
                }
                return ss.str();
            }
        } // namespace

        std::string ContentCodec::encodeBase64(const std::vector<char> &raw)
        {
            if (raw.empty())
            {
                return std::string();
            }
            if (raw.size() > static_cast<size_t>(INT_MAX / 4) * 3)
            {
                throw std::length_error("Payload too large to base64 encode in one block.");
            }

            // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a NUL terminator
            std::string encoded(4 * ((raw.size() + 2) / 3) + 1, '\0');
            int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&encoded[0]),
                                          reinterpret_cast<const unsigned char *>(raw.data()),
                                          static_cast<int>(raw.size()));
            if (written < 0)
            {
                throw std::runtime_error("Base64 encoding failed.");
            }
            encoded.resize(static_cast<size_t>(written));
            return encoded;
        }

        std::vector<char> ContentCodec::decodeBase64(const std::string &encoded)
        {
            if (encoded.empty())
            {
                return {};
            }
            if (encoded.size() % 4 != 0)
            {
                throw std::invalid_argument("Base64 input length is not a multiple of 4.");
            }
            if (encoded.size() > static_cast<size_t>(INT_MAX))
            {
                throw std::length_error("Base64 input too large to decode in one block.");
            }

            std::vector<char> decoded(encoded.size() / 4 * 3);
            int written = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(decoded.data()),
                                          reinterpret_cast<const unsigned char *>(encoded.data()),
                                          static_cast<int>(encoded.size()));
            if (written < 0)
            {
                throw std::invalid_argument("Malformed base64 input.");
            }

            // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
            size_t padding = 0;
            if (encoded[encoded.size() - 1] == '=')
                padding++;
            if (encoded[encoded.size() - 2] == '=')
                padding++;
            decoded.resize(static_cast<size_t>(written) - padding);
            return decoded;
        }

        std::string ContentCodec::sha256Hex(const std::string &data)
        {
            unsigned char hash[SHA256_DIGEST_LENGTH];
            SHA256_CTX sha256;

            if (!SHA256_Init(&sha256))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
            if (!data.empty() && !SHA256_Update(&sha256, data.data(), data.size()))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            if (!SHA256_Final(hash, &sha256))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            return toHex(hash, SHA256_DIGEST_LENGTH);
        }

        std::string ContentCodec::randomHex(size_t num_bytes)
        {
            std::vector<unsigned char> buffer(num_bytes);
            if (num_bytes > 0 && RAND_bytes(buffer.data(), static_cast<int>(num_bytes)) != 1)
            {
                throw std::runtime_error("RAND_bytes failed to produce random data.");
            }
            return toHex(buffer.data(), buffer.size());
        }

    } // namespace Codec
} // namespace ChunkVault
