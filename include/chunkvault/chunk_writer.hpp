// include/chunkvault/chunk_writer.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "chunkvault/cancellation.hpp"
#include "chunkvault/chunk_config.hpp"
#include "chunkvault/record_store.hpp"
#include "chunkvault/retry.hpp"

namespace ChunkVault
{
    namespace Chunks
    {

        // Splits an encoded payload into fragments of at most max_fragment_size
        // characters and persists them. Either every fragment is written or, on
        // failure, the ones this call wrote are deleted again.
        class ChunkWriter
        {
        public:
            ChunkWriter(std::shared_ptr<Storage::RecordStore> store, const Config::ChunkConfig &config);

            // Returns the authoritative chunk count (0 for an empty payload).
            // Throws ChunkWriteError. The caller records the count in the
            // document registry only after this returns.
            size_t writeChunked(const std::string &document_id,
                                const std::string &owner_id,
                                const std::string &encoded_payload,
                                const Concurrency::CancellationToken *cancel = nullptr);

            // Split without persisting; fragment i holds characters [i * max, (i + 1) * max).
            static std::vector<std::string> split(const std::string &encoded_payload, size_t max_fragment_size);

        private:
            std::shared_ptr<Storage::RecordStore> store;
            size_t max_fragment_size;
            size_t record_size_ceiling;
            Concurrency::RetryPolicy retry_policy;

            // Deletes the given indices; returns a description of whatever could not be deleted.
            std::string rollback(const std::string &document_id, const std::vector<size_t> &written);
        };

    } // namespace Chunks
} // namespace ChunkVault
