// src/chunk_writer.cpp
#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fragment.hpp"
#include "chunkvault/size_estimator.hpp"

#include <iostream>

namespace ChunkVault
{
    namespace Chunks
    {

        ChunkWriter::ChunkWriter(std::shared_ptr<Storage::RecordStore> store, const Config::ChunkConfig &config)
            : store(std::move(store)),
              max_fragment_size(config.max_fragment_size),
              record_size_ceiling(config.record_size_ceiling),
              retry_policy(Concurrency::RetryPolicy::fromConfig(config))
        {
            if (!this->store)
            {
                throw std::invalid_argument("ChunkWriter requires a record store");
            }
            config.validate();
        }

        std::vector<std::string> ChunkWriter::split(const std::string &encoded_payload, size_t max_fragment_size)
        {
            size_t total = SizeEstimator::chunkCountForEncodedLength(encoded_payload.size(), max_fragment_size);
            std::vector<std::string> slices;
            slices.reserve(total);
            for (size_t start = 0; start < encoded_payload.size(); start += max_fragment_size)
            {
                slices.push_back(encoded_payload.substr(start, max_fragment_size));
            }
            return slices;
        }

        std::string ChunkWriter::rollback(const std::string &document_id, const std::vector<size_t> &written)
        {
            std::string failures;
            for (size_t index : written)
            {
                try
                {
                    size_t attempts = 0;
                    Concurrency::withRetries(
                        retry_policy, [&]
                        { return store->remove(document_id, index); },
                        attempts);
                }
                catch (const StoreError &e)
                {
                    std::cerr << "Rollback could not delete chunk " << index << " of document " << document_id
                              << ": " << e.what() << std::endl;
                    if (!failures.empty())
                        failures += "; ";
                    failures += e.what();
                }
            }
            return failures;
        }

        size_t ChunkWriter::writeChunked(const std::string &document_id,
                                         const std::string &owner_id,
                                         const std::string &encoded_payload,
                                         const Concurrency::CancellationToken *cancel)
        {
            if (encoded_payload.empty())
            {
                return 0;
            }

            ChunkWriteError::Details details;
            details.document_id = document_id;

            // Refuse to mix with an earlier chunk set. Re-uploads get a new document id.
            try
            {
                std::vector<Fragment> existing = Concurrency::withRetries(
                    retry_policy, [&]
                    { return store->queryAll(document_id); },
                    details.attempts);
                if (!existing.empty())
                {
                    details.cause = "document already has " + std::to_string(existing.size()) + " stored fragment(s)";
                    throw ChunkWriteError(details);
                }
            }
            catch (const StoreError &e)
            {
                details.cause = e.what();
                throw ChunkWriteError(details);
            }

            // First pass: the count is known from the payload length alone
            const size_t total = SizeEstimator::chunkCountForEncodedLength(encoded_payload.size(), max_fragment_size);
            std::vector<std::string> slices = split(encoded_payload, max_fragment_size);
            const std::string created_at = currentTimestamp();
            std::vector<size_t> written;
            written.reserve(total);

            auto fail = [&](std::optional<size_t> index, std::string cause)
            {
                details.failed_index = index;
                details.cause = std::move(cause);
                details.fragments_written = written.size();
                details.rollback_failure = rollback(document_id, written);
                details.rolled_back = details.rollback_failure.empty();
                std::cerr << "Chunked write of document " << document_id << " failed, rolled back "
                          << written.size() << " fragment(s)" << std::endl;
                throw ChunkWriteError(details);
            };

            for (size_t index = 0; index < total; ++index)
            {
                if (Concurrency::isCancelled(cancel))
                {
                    details.cancelled = true;
                    details.attempts = 0;
                    fail(std::nullopt, "cancelled before chunk " + std::to_string(index));
                }

                Fragment fragment(document_id, index, total, std::move(slices[index]), owner_id, created_at);

                size_t record_size = fragment.serializedSize();
                if (record_size > record_size_ceiling)
                {
                    details.attempts = 0;
                    fail(index, "record of " + std::to_string(record_size) + " bytes exceeds ceiling of " +
                                    std::to_string(record_size_ceiling));
                }

                try
                {
                    Concurrency::withRetries(
                        retry_policy, [&]
                        { store->put(fragment); },
                        details.attempts);
                }
                catch (const StoreError &e)
                {
                    fail(index, e.what());
                }
                written.push_back(index);
            }

            std::cout << "Wrote " << total << " chunk(s) for document " << document_id << std::endl;
            return total;
        }

    } // namespace Chunks
} // namespace ChunkVault
