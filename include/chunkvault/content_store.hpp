// include/chunkvault/content_store.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chunkvault/cancellation.hpp"
#include "chunkvault/chunk_config.hpp"
#include "chunkvault/chunk_reader.hpp"
#include "chunkvault/chunk_writer.hpp"
#include "chunkvault/document_registry.hpp"
#include "chunkvault/fragment.hpp"
#include "chunkvault/record_store.hpp"

namespace ChunkVault
{

    // Ties the registry, the preprocessor and the chunk writer/reader together
    // into whole-document upload, download and delete.
    class ContentStore
    {
    public:
        ContentStore(Config::ChunkConfig config,
                     std::shared_ptr<Storage::RecordStore> store,
                     std::shared_ptr<Registry::DocumentRegistry> registry);

        // Reserves a new document id, optionally shrinks the payload, base64
        // encodes it, writes the chunks and only then marks the record Ready.
        // On any failure after the reservation, fragments and the record are
        // removed and the error rethrown.
        // Throws std::invalid_argument if raw exceeds max_upload_size.
        Registry::DocumentRecord uploadDocument(const std::string &owner_id,
                                                const std::string &filename,
                                                const std::string &content_type,
                                                const std::vector<char> &raw,
                                                const Concurrency::CancellationToken *cancel = nullptr);

        // The stored base64 payload. Throws DocumentNotFoundError if the
        // document is unknown or not Ready.
        std::string readEncoded(const std::string &document_id,
                                const Concurrency::CancellationToken *cancel = nullptr);

        // The stored bytes (after any preprocessing).
        std::vector<char> downloadDocument(const std::string &document_id,
                                           const Concurrency::CancellationToken *cancel = nullptr);

        // A single fragment, for inspection.
        std::optional<Chunks::Fragment> retrieveChunk(const std::string &document_id, size_t chunk_index);

        std::optional<Registry::DocumentRecord> getDocument(const std::string &document_id);

        // Deletes every fragment, then the registry record. False if the id is unknown.
        bool deleteDocument(const std::string &document_id);

        const Config::ChunkConfig &getConfig() const { return config; }

    private:
        Config::ChunkConfig config;
        std::shared_ptr<Storage::RecordStore> store;
        std::shared_ptr<Registry::DocumentRegistry> registry;
        Chunks::ChunkWriter writer;
        Chunks::ChunkReader reader;

        std::vector<char> preprocess(const std::vector<char> &raw, const std::string &content_type) const;
        Registry::DocumentRecord requireReady(const std::string &document_id);
        // Best effort; failures are logged, never thrown
        void discardUpload(const std::string &document_id);
    };

} // namespace ChunkVault
