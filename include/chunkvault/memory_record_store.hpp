// include/chunkvault/memory_record_store.hpp
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "chunkvault/record_store.hpp"

namespace ChunkVault
{
    namespace Storage
    {

        // Process-local store. Used by the tests and for running the service without disk state.
        class MemoryRecordStore : public RecordStore
        {
        public:
            explicit MemoryRecordStore(size_t record_size_ceiling);

            void put(const Chunks::Fragment &fragment) override;
            std::optional<Chunks::Fragment> getByIndex(const std::string &document_id,
                                                       size_t chunk_index) override;
            std::vector<Chunks::Fragment> queryAll(const std::string &document_id) override;
            bool remove(const std::string &document_id, size_t chunk_index) override;
            size_t removeAll(const std::string &document_id) override;

            // Total fragments held across all documents
            size_t size() const;

        private:
            size_t record_size_ceiling;
            // documentId -> chunkIndex -> fragment
            std::unordered_map<std::string, std::map<size_t, Chunks::Fragment>> records;
            mutable std::mutex mtx;
        };

    } // namespace Storage
} // namespace ChunkVault
