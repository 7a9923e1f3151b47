// src/errors.cpp
#include "chunkvault/errors.hpp"

#include <sstream>

namespace ChunkVault
{
    namespace
    {
        std::string joinIndices(const std::vector<size_t> &indices)
        {
            std::ostringstream out;
            for (size_t i = 0; i < indices.size(); ++i)
            {
                if (i > 0)
                    out << ",";
                out << indices[i];
            }
            return out.str();
        }

        std::string describeStoreError(const std::string &message,
                                       const std::string &document_id,
                                       std::optional<size_t> chunk_index)
        {
            std::ostringstream out;
            out << "Store error for document " << document_id;
            if (chunk_index)
            {
                out << " chunk " << *chunk_index;
            }
            out << ": " << message;
            return out.str();
        }

        std::string describeWriteError(const ChunkWriteError::Details &d)
        {
            std::ostringstream out;
            out << "Chunked write failed for document " << d.document_id;
            if (d.cancelled)
            {
                out << " (cancelled)";
            }
            if (d.failed_index)
            {
                out << " at chunk " << *d.failed_index << " after " << d.attempts << " attempt(s)";
            }
            if (!d.cause.empty())
            {
                out << ": " << d.cause;
            }
            out << "; " << d.fragments_written << " fragment(s) written";
            if (d.rolled_back)
            {
                out << ", rolled back";
            }
            if (!d.rollback_failure.empty())
            {
                out << ", rollback incomplete: " << d.rollback_failure;
            }
            return out.str();
        }

        std::string describeReconstructionError(const ChunkReconstructionError::Details &d)
        {
            std::ostringstream out;
            out << "Cannot reconstruct document " << d.document_id << ": expected " << d.expected
                << " chunk(s), received " << d.received;
            if (!d.missing.empty())
                out << "; missing [" << joinIndices(d.missing) << "]";
            if (!d.duplicates.empty())
                out << "; duplicate [" << joinIndices(d.duplicates) << "]";
            if (!d.out_of_range.empty())
                out << "; out of range [" << joinIndices(d.out_of_range) << "]";
            if (!d.total_mismatch.empty())
                out << "; totalChunks mismatch [" << joinIndices(d.total_mismatch) << "]";
            if (!d.corrupt.empty())
                out << "; digest mismatch [" << joinIndices(d.corrupt) << "]";
            return out.str();
        }
    } // namespace

    StoreError::StoreError(const std::string &message,
                           std::string document_id,
                           std::optional<size_t> chunk_index,
                           bool transient)
        : std::runtime_error(describeStoreError(message, document_id, chunk_index)),
          document_id_(std::move(document_id)),
          chunk_index_(chunk_index),
          transient_(transient)
    {
    }

    ChunkWriteError::ChunkWriteError(Details details)
        : std::runtime_error(describeWriteError(details)), details_(std::move(details))
    {
    }

    ChunkReconstructionError::ChunkReconstructionError(Details details)
        : std::runtime_error(describeReconstructionError(details)), details_(std::move(details))
    {
    }

} // namespace ChunkVault
