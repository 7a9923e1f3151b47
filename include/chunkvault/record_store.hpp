// include/chunkvault/record_store.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/fragment.hpp"

namespace ChunkVault
{
    namespace Storage
    {

        // Backing record store for fragments. Every operation reports failure by
        // throwing StoreError; transient() marks the ones worth retrying.
        class RecordStore
        {
        public:
            virtual ~RecordStore() = default;

            // Persist a fragment. Rejects a second put for the same (documentId, chunkIndex)
            // and any record whose serialized form exceeds the store's ceiling.
            virtual void put(const Chunks::Fragment &fragment) = 0;

            virtual std::optional<Chunks::Fragment> getByIndex(const std::string &document_id,
                                                               size_t chunk_index) = 0;

            // All fragments stored for the document, in no particular order.
            virtual std::vector<Chunks::Fragment> queryAll(const std::string &document_id) = 0;

            // Returns false if there was nothing to delete.
            virtual bool remove(const std::string &document_id, size_t chunk_index) = 0;

            // Returns the number of fragments deleted.
            virtual size_t removeAll(const std::string &document_id) = 0;
        };

    } // namespace Storage
} // namespace ChunkVault
