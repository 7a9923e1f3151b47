// include/chunkvault/chunk_reader.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "chunkvault/cancellation.hpp"
#include "chunkvault/chunk_config.hpp"
#include "chunkvault/fragment.hpp"
#include "chunkvault/record_store.hpp"
#include "chunkvault/retry.hpp"
#include "chunkvault/thread_pool.hpp"

namespace ChunkVault
{
    namespace Chunks
    {

        // Fetches every fragment of a document and puts the encoded payload back
        // together. Reads have no side effects and can be repeated freely.
        class ChunkReader
        {
        public:
            ChunkReader(std::shared_ptr<Storage::RecordStore> store, const Config::ChunkConfig &config);

            // chunk_count must be the value recorded in the document registry.
            // Throws ChunkReconstructionError, StoreError or OperationCancelled.
            std::string readChunked(const std::string &document_id,
                                    size_t chunk_count,
                                    const Concurrency::CancellationToken *cancel = nullptr);

            // Validates the fragment set (count, index coverage, duplicates,
            // totalChunks, digests) and concatenates the content in index order.
            // Arrival order of fragments does not matter.
            static std::string assemble(const std::string &document_id,
                                        size_t chunk_count,
                                        std::vector<Fragment> fragments);

        private:
            std::shared_ptr<Storage::RecordStore> store;
            Config::ReadStrategy strategy;
            Concurrency::RetryPolicy retry_policy;
            // Worker count is the read concurrency cap; null when reads are sequential
            std::unique_ptr<Concurrency::ThreadPool> pool;

            std::vector<Fragment> fetchPerIndex(const std::string &document_id,
                                                size_t chunk_count,
                                                const Concurrency::CancellationToken *cancel);
            std::vector<Fragment> fetchRange(const std::string &document_id,
                                             const Concurrency::CancellationToken *cancel);
            std::optional<Fragment> fetchOne(const std::string &document_id,
                                             size_t chunk_index,
                                             const Concurrency::CancellationToken *cancel);
        };

    } // namespace Chunks
} // namespace ChunkVault
