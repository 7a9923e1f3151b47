// include/chunkvault/cancellation.hpp
#pragma once

#include <atomic>

namespace ChunkVault
{
    namespace Concurrency
    {

        // Set from any thread; checked by writers and readers before each fragment I/O.
        class CancellationToken
        {
        public:
            void cancel() { cancelled.store(true); }
            bool isCancelled() const { return cancelled.load(); }

        private:
            std::atomic<bool> cancelled{false};
        };

        inline bool isCancelled(const CancellationToken *token)
        {
            return token != nullptr && token->isCancelled();
        }

    } // namespace Concurrency
} // namespace ChunkVault
