// src/size_estimator.cpp
#include "chunkvault/size_estimator.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace ChunkVault
{
    namespace Chunks
    {
        namespace
        {
            uint64_t ceilDiv(uint64_t numerator, uint64_t denominator)
            {
                return numerator / denominator + (numerator % denominator != 0 ? 1 : 0);
            }

            void requirePositive(size_t max_fragment_size)
            {
                if (max_fragment_size == 0)
                {
                    throw std::invalid_argument("max_fragment_size must be positive");
                }
            }
        } // namespace

        size_t SizeEstimator::estimateChunkCount(uint64_t raw_bytes, size_t max_fragment_size)
        {
            requirePositive(max_fragment_size);
            // ceil(raw_bytes * 1.34) without going through floating point.
            // Split at 100 so the multiply cannot wrap; saturate past that.
            uint64_t whole = raw_bytes / 100;
            uint64_t estimated_encoded = std::numeric_limits<uint64_t>::max();
            if (whole <= (std::numeric_limits<uint64_t>::max() - 134) / 134)
            {
                estimated_encoded = whole * 134 + ceilDiv(raw_bytes % 100 * 134, 100);
            }
            return static_cast<size_t>(ceilDiv(estimated_encoded, max_fragment_size));
        }

        uint64_t SizeEstimator::encodedLength(uint64_t raw_bytes)
        {
            return 4 * ceilDiv(raw_bytes, 3);
        }

        size_t SizeEstimator::chunkCountForEncodedLength(uint64_t encoded_length, size_t max_fragment_size)
        {
            requirePositive(max_fragment_size);
            return static_cast<size_t>(ceilDiv(encoded_length, max_fragment_size));
        }

        std::string SizeEstimator::formatFileSize(uint64_t bytes)
        {
            if (bytes == 0)
                return "0 Bytes";

            static const char *units[] = {"Bytes", "KB", "MB", "GB"};
            double value = static_cast<double>(bytes);
            size_t unit = 0;
            while (value >= 1024.0 && unit < 3)
            {
                value /= 1024.0;
                unit++;
            }

            // Up to two decimals, trailing zeros dropped ("1.5 KB", not "1.50 KB")
            std::ostringstream out;
            out << std::fixed << std::setprecision(2) << value;
            std::string number = out.str();
            number.erase(number.find_last_not_of('0') + 1);
            if (number.back() == '.')
                number.pop_back();
            return number + " " + units[unit];
        }

    } // namespace Chunks
} // namespace ChunkVault
