// src/fragment.cpp
#include "chunkvault/fragment.hpp"
#include "chunkvault/content_codec.hpp"

#include <chrono>
#include <ctime>

namespace ChunkVault
{
    namespace Chunks
    {

        std::string currentTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_c = std::chrono::system_clock::to_time_t(now);
            std::tm utc{};
            gmtime_r(&now_c, &utc);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return buf;
        }

        Fragment::Fragment(std::string doc_id, size_t index, size_t total, std::string slice,
                           std::string owner, std::string timestamp)
            : document_id(std::move(doc_id)),
              chunk_index(index),
              total_chunks(total),
              content(std::move(slice)),
              owner_id(std::move(owner)),
              created_at(std::move(timestamp))
        {
            content_digest = Codec::ContentCodec::sha256Hex(content);
        }

        bool Fragment::digestMatches() const
        {
            return Codec::ContentCodec::sha256Hex(content) == content_digest;
        }

        size_t Fragment::serializedSize() const
        {
            return toJson().dump().size();
        }

        void to_json(nlohmann::json &j, const Fragment &f)
        {
            j = nlohmann::json{
                {"documentId", f.document_id},
                {"chunkIndex", f.chunk_index},
                {"totalChunks", f.total_chunks},
                {"content", f.content},
                {"contentDigest", f.content_digest},
                {"ownerId", f.owner_id},
                {"createdAt", f.created_at}};
        }

        void from_json(const nlohmann::json &j, Fragment &f)
        {
            j.at("documentId").get_to(f.document_id);
            j.at("chunkIndex").get_to(f.chunk_index);
            j.at("totalChunks").get_to(f.total_chunks);
            j.at("content").get_to(f.content);
            j.at("contentDigest").get_to(f.content_digest);
            j.at("ownerId").get_to(f.owner_id);
            j.at("createdAt").get_to(f.created_at);
        }

        nlohmann::json Fragment::toJson() const
        {
            return *this; // Uses the to_json helper function
        }

        Fragment Fragment::fromJson(const nlohmann::json &j)
        {
            Fragment fragment;
            j.get_to(fragment);
            return fragment;
        }

    } // namespace Chunks
} // namespace ChunkVault
