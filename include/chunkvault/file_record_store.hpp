// include/chunkvault/file_record_store.hpp
#pragma once

#include <filesystem>
#include <mutex>

#include "chunkvault/chunk_config.hpp"
#include "chunkvault/record_store.hpp"

namespace ChunkVault
{
    namespace Storage
    {

        // Stores each fragment as <chunks dir>/<documentId>/<chunkIndex>.json.
        class FileRecordStore : public RecordStore
        {
        public:
            explicit FileRecordStore(const Config::ChunkConfig &config);

            void put(const Chunks::Fragment &fragment) override;
            std::optional<Chunks::Fragment> getByIndex(const std::string &document_id,
                                                       size_t chunk_index) override;
            std::vector<Chunks::Fragment> queryAll(const std::string &document_id) override;
            bool remove(const std::string &document_id, size_t chunk_index) override;
            size_t removeAll(const std::string &document_id) override;

            // Get the full path where a fragment would be stored
            std::filesystem::path getFullPath(const std::string &document_id, size_t chunk_index) const;

        private:
            std::filesystem::path chunks_dir;
            size_t record_size_ceiling;
            std::mutex write_mtx; // Serializes the exists-check and rename in put()

            std::filesystem::path documentDir(const std::string &document_id) const;
            Chunks::Fragment loadFragment(const std::filesystem::path &path,
                                          const std::string &document_id,
                                          std::optional<size_t> chunk_index) const;
        };

    } // namespace Storage
} // namespace ChunkVault
