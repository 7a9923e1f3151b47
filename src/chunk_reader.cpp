// src/chunk_reader.cpp
#include "chunkvault/chunk_reader.hpp"
#include "chunkvault/errors.hpp"

#include <algorithm>
#include <future>
#include <iostream>

namespace ChunkVault
{
    namespace Chunks
    {

        ChunkReader::ChunkReader(std::shared_ptr<Storage::RecordStore> store, const Config::ChunkConfig &config)
            : store(std::move(store)),
              strategy(config.read_strategy),
              retry_policy(Concurrency::RetryPolicy::fromConfig(config))
        {
            if (!this->store)
            {
                throw std::invalid_argument("ChunkReader requires a record store");
            }
            config.validate();
            if (strategy == Config::ReadStrategy::PerIndex && config.read_concurrency > 1)
            {
                pool = std::make_unique<Concurrency::ThreadPool>(config.read_concurrency, "chunk-reader");
            }
        }

        std::string ChunkReader::readChunked(const std::string &document_id,
                                             size_t chunk_count,
                                             const Concurrency::CancellationToken *cancel)
        {
            if (chunk_count == 0)
            {
                return std::string();
            }

            std::vector<Fragment> fragments = strategy == Config::ReadStrategy::RangeQuery
                                                  ? fetchRange(document_id, cancel)
                                                  : fetchPerIndex(document_id, chunk_count, cancel);

            // A cancelled read never returns data, even if every fetch made it back
            if (Concurrency::isCancelled(cancel))
            {
                throw OperationCancelled(document_id);
            }
            return assemble(document_id, chunk_count, std::move(fragments));
        }

        std::optional<Fragment> ChunkReader::fetchOne(const std::string &document_id,
                                                      size_t chunk_index,
                                                      const Concurrency::CancellationToken *cancel)
        {
            if (Concurrency::isCancelled(cancel))
            {
                throw OperationCancelled(document_id);
            }
            size_t attempts = 0;
            return Concurrency::withRetries(
                retry_policy, [&]
                { return store->getByIndex(document_id, chunk_index); },
                attempts);
        }

        std::vector<Fragment> ChunkReader::fetchRange(const std::string &document_id,
                                                      const Concurrency::CancellationToken *cancel)
        {
            if (Concurrency::isCancelled(cancel))
            {
                throw OperationCancelled(document_id);
            }
            size_t attempts = 0;
            return Concurrency::withRetries(
                retry_policy, [&]
                { return store->queryAll(document_id); },
                attempts);
        }

        namespace
        {
            // Per-index fetch outcomes, gathered until every index has been tried
            struct FetchOutcome
            {
                std::vector<Fragment> fragments;
                bool cancelled = false;
                bool all_transient = true;
                std::vector<size_t> failed;
                std::string failure_messages;

                // Runs get() and files its result or failure under index
                template <class Get>
                void collect(size_t index, Get &&get)
                {
                    try
                    {
                        std::optional<Fragment> fragment = get();
                        if (fragment)
                        {
                            fragments.push_back(std::move(*fragment));
                        }
                    }
                    catch (const OperationCancelled &)
                    {
                        cancelled = true;
                    }
                    catch (const StoreError &e)
                    {
                        fail(index, e.what(), e.transient());
                    }
                    catch (const std::exception &e)
                    {
                        fail(index, "chunk " + std::to_string(index) + ": " + e.what(), false);
                    }
                }

                void fail(size_t index, const std::string &message, bool transient)
                {
                    failed.push_back(index);
                    all_transient = all_transient && transient;
                    if (!failure_messages.empty())
                        failure_messages += "; ";
                    failure_messages += message;
                }

                std::vector<Fragment> take(const std::string &document_id, size_t chunk_count)
                {
                    if (cancelled)
                    {
                        throw OperationCancelled(document_id);
                    }
                    if (!failed.empty())
                    {
                        std::cerr << "Failed to fetch " << failed.size() << " of " << chunk_count
                                  << " chunk(s) for document " << document_id << std::endl;
                        std::optional<size_t> single =
                            failed.size() == 1 ? std::optional<size_t>(failed.front()) : std::nullopt;
                        throw StoreError(std::to_string(failed.size()) + " chunk fetch(es) failed: " + failure_messages,
                                         document_id, single, all_transient);
                    }
                    return std::move(fragments);
                }
            };
        } // namespace

        std::vector<Fragment> ChunkReader::fetchPerIndex(const std::string &document_id,
                                                         size_t chunk_count,
                                                         const Concurrency::CancellationToken *cancel)
        {
            FetchOutcome outcome;
            outcome.fragments.reserve(chunk_count);

            if (!pool)
            {
                for (size_t index = 0; index < chunk_count && !outcome.cancelled; ++index)
                {
                    outcome.collect(index, [&]
                                    { return fetchOne(document_id, index, cancel); });
                }
                return outcome.take(document_id, chunk_count);
            }

            // Fan out over the pool; its size caps how many reads are in flight
            std::vector<std::future<std::optional<Fragment>>> pending;
            pending.reserve(chunk_count);
            for (size_t index = 0; index < chunk_count; ++index)
            {
                pending.push_back(pool->enqueue([this, document_id, index, cancel]()
                                                { return fetchOne(document_id, index, cancel); }));
            }

            // Fan in. Every future is drained before anything is thrown, since the
            // tasks reference this reader and the caller's cancellation token.
            for (size_t index = 0; index < pending.size(); ++index)
            {
                outcome.collect(index, [&]
                                { return pending[index].get(); });
            }
            return outcome.take(document_id, chunk_count);
        }

        std::string ChunkReader::assemble(const std::string &document_id,
                                          size_t chunk_count,
                                          std::vector<Fragment> fragments)
        {
            ChunkReconstructionError::Details details;
            details.document_id = document_id;
            details.expected = chunk_count;
            details.received = fragments.size();

            std::vector<size_t> seen(chunk_count, 0);
            for (const Fragment &fragment : fragments)
            {
                size_t index = fragment.chunk_index;
                if (index >= chunk_count)
                {
                    details.out_of_range.push_back(index);
                    continue;
                }
                if (++seen[index] == 2)
                {
                    details.duplicates.push_back(index);
                }
                if (fragment.total_chunks != chunk_count)
                {
                    details.total_mismatch.push_back(index);
                }
                if (fragment.document_id != document_id || !fragment.digestMatches())
                {
                    details.corrupt.push_back(index);
                }
            }
            for (size_t index = 0; index < chunk_count; ++index)
            {
                if (seen[index] == 0)
                {
                    details.missing.push_back(index);
                }
            }

            std::sort(details.duplicates.begin(), details.duplicates.end());
            std::sort(details.out_of_range.begin(), details.out_of_range.end());
            std::sort(details.total_mismatch.begin(), details.total_mismatch.end());
            std::sort(details.corrupt.begin(), details.corrupt.end());

            if (details.received != chunk_count || !details.missing.empty() || !details.duplicates.empty() ||
                !details.out_of_range.empty() || !details.total_mismatch.empty() || !details.corrupt.empty())
            {
                throw ChunkReconstructionError(details);
            }

            std::sort(fragments.begin(), fragments.end(), [](const Fragment &a, const Fragment &b)
                      { return a.chunk_index < b.chunk_index; });

            size_t total_length = 0;
            for (const Fragment &fragment : fragments)
            {
                total_length += fragment.content.size();
            }

            std::string payload;
            payload.reserve(total_length);
            for (const Fragment &fragment : fragments)
            {
                payload += fragment.content;
            }
            return payload;
        }

    } // namespace Chunks
} // namespace ChunkVault
