// include/chunkvault/errors.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ChunkVault
{

    // Raised by the backing record store. Transient errors may succeed on retry.
    class StoreError : public std::runtime_error
    {
    public:
        StoreError(const std::string &message,
                   std::string document_id,
                   std::optional<size_t> chunk_index = std::nullopt,
                   bool transient = false);

        const std::string &documentId() const { return document_id_; }
        std::optional<size_t> chunkIndex() const { return chunk_index_; }
        bool transient() const { return transient_; }

    private:
        std::string document_id_;
        std::optional<size_t> chunk_index_;
        bool transient_;
    };

    // Payload reduction failed. Callers upload the unmodified payload instead.
    class PreprocessingError : public std::runtime_error
    {
    public:
        explicit PreprocessingError(const std::string &message)
            : std::runtime_error("Preprocessing failed: " + message) {}
    };

    class ChunkWriteError : public std::runtime_error
    {
    public:
        struct Details
        {
            std::string document_id;
            std::optional<size_t> failed_index;
            size_t attempts = 0;
            size_t fragments_written = 0;
            bool rolled_back = false;
            bool cancelled = false;
            std::string cause;
            std::string rollback_failure; // Empty when the rollback succeeded
        };

        explicit ChunkWriteError(Details details);

        const Details &details() const { return details_; }
        const std::string &documentId() const { return details_.document_id; }
        bool cancelled() const { return details_.cancelled; }
        bool rolledBack() const { return details_.rolled_back; }

    private:
        Details details_;
    };

    // The fragment set for a document cannot be turned back into its payload.
    class ChunkReconstructionError : public std::runtime_error
    {
    public:
        struct Details
        {
            std::string document_id;
            size_t expected = 0;
            size_t received = 0;
            std::vector<size_t> missing;
            std::vector<size_t> duplicates;
            std::vector<size_t> out_of_range;
            std::vector<size_t> total_mismatch;
            std::vector<size_t> corrupt;
        };

        explicit ChunkReconstructionError(Details details);

        const Details &details() const { return details_; }
        const std::string &documentId() const { return details_.document_id; }
        const std::vector<size_t> &missingIndices() const { return details_.missing; }
        const std::vector<size_t> &duplicateIndices() const { return details_.duplicates; }

    private:
        Details details_;
    };

    class OperationCancelled : public std::runtime_error
    {
    public:
        explicit OperationCancelled(const std::string &document_id)
            : std::runtime_error("Operation cancelled for document " + document_id) {}
    };

    class DocumentNotFoundError : public std::runtime_error
    {
    public:
        explicit DocumentNotFoundError(const std::string &document_id, const std::string &reason = "not found")
            : std::runtime_error("Document " + document_id + " " + reason), document_id_(document_id) {}

        const std::string &documentId() const { return document_id_; }

    private:
        std::string document_id_;
    };

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &message)
            : std::runtime_error("Invalid configuration: " + message) {}
    };

} // namespace ChunkVault
