// src/memory_record_store.cpp
#include "chunkvault/memory_record_store.hpp"
#include "chunkvault/errors.hpp"

namespace ChunkVault
{
    namespace Storage
    {

        MemoryRecordStore::MemoryRecordStore(size_t record_size_ceiling)
            : record_size_ceiling(record_size_ceiling)
        {
        }

        void MemoryRecordStore::put(const Chunks::Fragment &fragment)
        {
            size_t size = fragment.serializedSize();
            if (size > record_size_ceiling)
            {
                throw StoreError("record of " + std::to_string(size) + " bytes exceeds ceiling of " +
                                     std::to_string(record_size_ceiling),
                                 fragment.document_id, fragment.chunk_index);
            }

            std::lock_guard<std::mutex> lock(mtx);
            auto &document = records[fragment.document_id];
            if (!document.emplace(fragment.chunk_index, fragment).second)
            {
                throw StoreError("fragment already exists", fragment.document_id, fragment.chunk_index);
            }
        }

        std::optional<Chunks::Fragment> MemoryRecordStore::getByIndex(const std::string &document_id,
                                                                      size_t chunk_index)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto doc_it = records.find(document_id);
            if (doc_it == records.end())
            {
                return std::nullopt;
            }
            auto it = doc_it->second.find(chunk_index);
            if (it == doc_it->second.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<Chunks::Fragment> MemoryRecordStore::queryAll(const std::string &document_id)
        {
            std::lock_guard<std::mutex> lock(mtx);
            std::vector<Chunks::Fragment> result;
            auto doc_it = records.find(document_id);
            if (doc_it != records.end())
            {
                for (const auto &entry : doc_it->second)
                {
                    result.push_back(entry.second);
                }
            }
            return result;
        }

        bool MemoryRecordStore::remove(const std::string &document_id, size_t chunk_index)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto doc_it = records.find(document_id);
            if (doc_it == records.end())
            {
                return false;
            }
            bool erased = doc_it->second.erase(chunk_index) > 0;
            if (doc_it->second.empty())
            {
                records.erase(doc_it);
            }
            return erased;
        }

        size_t MemoryRecordStore::removeAll(const std::string &document_id)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto doc_it = records.find(document_id);
            if (doc_it == records.end())
            {
                return 0;
            }
            size_t count = doc_it->second.size();
            records.erase(doc_it);
            return count;
        }

        size_t MemoryRecordStore::size() const
        {
            std::lock_guard<std::mutex> lock(mtx);
            size_t total = 0;
            for (const auto &document : records)
            {
                total += document.second.size();
            }
            return total;
        }

    } // namespace Storage
} // namespace ChunkVault
