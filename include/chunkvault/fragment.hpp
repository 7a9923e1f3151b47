// include/chunkvault/fragment.hpp
#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace ChunkVault
{
    namespace Chunks
    {

        // Current UTC time in ISO 8601 ("YYYY-MM-DDTHH:MM:SSZ").
        std::string currentTimestamp();

        // One bounded slice of an encoded payload, stored as an independent record.
        struct Fragment
        {
            std::string document_id;
            size_t chunk_index = 0;
            size_t total_chunks = 0;
            std::string content;        // Slice of the base64 payload
            std::string content_digest; // SHA-256 hex of content
            std::string owner_id;
            std::string created_at;

            Fragment() = default;

            // Builds a fragment and computes its digest
            Fragment(std::string doc_id, size_t index, size_t total, std::string slice,
                     std::string owner, std::string timestamp);

            // True when content_digest matches the content actually held
            bool digestMatches() const;

            // Length of the JSON document this fragment is stored as
            size_t serializedSize() const;

            nlohmann::json toJson() const;
            static Fragment fromJson(const nlohmann::json &j);
        };

        void to_json(nlohmann::json &j, const Fragment &f);
        void from_json(const nlohmann::json &j, Fragment &f);

    } // namespace Chunks
} // namespace ChunkVault
