// include/chunkvault/retry.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <iostream>
#include <thread>

#include "chunkvault/chunk_config.hpp"
#include "chunkvault/errors.hpp"

namespace ChunkVault
{
    namespace Concurrency
    {

        struct RetryPolicy
        {
            size_t max_attempts = 3;
            std::chrono::milliseconds base_backoff{100};

            static RetryPolicy fromConfig(const Config::ChunkConfig &config)
            {
                RetryPolicy policy;
                policy.max_attempts = config.retry_attempts;
                policy.base_backoff = std::chrono::milliseconds(config.retry_backoff_ms);
                return policy;
            }
        };

        // Runs op until it succeeds, it throws a non-transient StoreError, or
        // max_attempts is reached. The backoff doubles after every failed attempt.
        // attempts_out receives the number of attempts made, also when op finally throws.
        template <class Op>
        auto withRetries(const RetryPolicy &policy, Op &&op, size_t &attempts_out) -> decltype(op())
        {
            std::chrono::milliseconds backoff = policy.base_backoff;
            for (size_t attempt = 1;; ++attempt)
            {
                attempts_out = attempt;
                try
                {
                    return op();
                }
                catch (const StoreError &e)
                {
                    if (!e.transient() || attempt >= policy.max_attempts)
                    {
                        throw;
                    }
                    std::cerr << "Retrying after transient failure (attempt " << attempt << " of "
                              << policy.max_attempts << "): " << e.what() << std::endl;
                }
                if (backoff.count() > 0)
                {
                    std::this_thread::sleep_for(backoff);
                }
                backoff *= 2;
            }
        }

    } // namespace Concurrency
} // namespace ChunkVault
