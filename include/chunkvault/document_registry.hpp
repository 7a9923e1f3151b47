// include/chunkvault/document_registry.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chunkvault/chunk_config.hpp"

namespace ChunkVault
{
    namespace Registry
    {

        enum class DocumentStatus
        {
            Pending, // Identifier reserved, chunks not confirmed
            Ready    // chunk_count is authoritative
        };

        struct DocumentRecord
        {
            std::string document_id;
            std::string owner_id;
            std::string filename;
            std::string content_type;
            uint64_t original_size_bytes = 0; // As uploaded
            uint64_t stored_size_bytes = 0;   // After preprocessing, before encoding
            size_t chunk_count = 0;
            DocumentStatus status = DocumentStatus::Pending;
            std::string created_at;

            nlohmann::json toJson() const;
            static DocumentRecord fromJson(const nlohmann::json &j);
        };

        void to_json(nlohmann::json &j, const DocumentRecord &r);
        void from_json(const nlohmann::json &j, DocumentRecord &r);

        // Owner of document identifiers and of each document's chunk count.
        class DocumentRegistry
        {
        public:
            virtual ~DocumentRegistry() = default;

            // Allocates a fresh identifier and stores a Pending record for it.
            virtual DocumentRecord reserve(const std::string &owner_id,
                                           const std::string &filename,
                                           const std::string &content_type,
                                           uint64_t original_size_bytes) = 0;

            virtual std::optional<DocumentRecord> get(const std::string &document_id) = 0;

            // Records the confirmed chunk count and flips the record to Ready.
            // Throws DocumentNotFoundError for an unknown id.
            virtual DocumentRecord markReady(const std::string &document_id,
                                             size_t chunk_count,
                                             uint64_t stored_size_bytes) = 0;

            // Returns false if the id was unknown.
            virtual bool remove(const std::string &document_id) = 0;
        };

        // One JSON file per document under the metadata directory.
        class FileDocumentRegistry : public DocumentRegistry
        {
        public:
            explicit FileDocumentRegistry(const Config::ChunkConfig &config);

            DocumentRecord reserve(const std::string &owner_id,
                                   const std::string &filename,
                                   const std::string &content_type,
                                   uint64_t original_size_bytes) override;
            std::optional<DocumentRecord> get(const std::string &document_id) override;
            DocumentRecord markReady(const std::string &document_id,
                                     size_t chunk_count,
                                     uint64_t stored_size_bytes) override;
            bool remove(const std::string &document_id) override;

            // Get the full path where a record would be stored
            std::filesystem::path getFullPath(const std::string &document_id) const;

        private:
            std::filesystem::path metadata_dir;
            std::mutex mtx;

            void save(const DocumentRecord &record) const;
            std::optional<DocumentRecord> load(const std::string &document_id) const;
        };

    } // namespace Registry
} // namespace ChunkVault
