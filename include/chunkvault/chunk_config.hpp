// include/chunkvault/chunk_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path

#include <nlohmann/json.hpp>

namespace ChunkVault
{
    namespace Config
    {

        enum class ReadStrategy
        {
            PerIndex,   // One getByIndex per expected chunk index
            RangeQuery  // One queryAll, sorted client side
        };

        class ChunkConfig
        {
        public:
            // Default fragment content size (800KB, leaves room under a 1MiB record for metadata)
            static constexpr size_t DEFAULT_MAX_FRAGMENT_SIZE = 800000;
            static constexpr size_t DEFAULT_RECORD_SIZE_CEILING = 1048576;
            static constexpr size_t DEFAULT_METADATA_HEADROOM = 10000;
            static constexpr size_t MAX_READ_CONCURRENCY = 64;
            // Largest upload whose base64 form still fits a single OpenSSL encode call
            static constexpr size_t MAX_UPLOAD_SIZE = 1024 * 1024 * 1024;

            // Names of the directories for fragments and document records, below storage_root
            static const std::string CHUNKS_DIR_NAME;
            static const std::string METADATA_DIR_NAME;

            size_t max_fragment_size = DEFAULT_MAX_FRAGMENT_SIZE;
            size_t record_size_ceiling = DEFAULT_RECORD_SIZE_CEILING;
            size_t metadata_headroom = DEFAULT_METADATA_HEADROOM;
            size_t read_concurrency = 8;
            ReadStrategy read_strategy = ReadStrategy::PerIndex;
            size_t retry_attempts = 3;
            size_t retry_backoff_ms = 100;
            bool preprocess_images = true;
            double image_quality = 0.8;
            size_t max_upload_size = 10 * 1024 * 1024;
            std::filesystem::path storage_root = ".";
            unsigned short port = 8080;

            // Throws ConfigError if the values cannot work together.
            void validate() const;

            // Get the absolute path for the chunks directory, creating it if needed
            std::filesystem::path getChunksDirPath() const;

            // Get the absolute path for the metadata directory, creating it if needed
            std::filesystem::path getMetadataDirPath() const;

            // Overlay the keys present in j on top of the defaults, then validate.
            static ChunkConfig fromJson(const nlohmann::json &j);

            // Load a JSON config file. Throws ConfigError on I/O or parse failure.
            static ChunkConfig loadFromFile(const std::filesystem::path &path);

        private:
            std::filesystem::path ensureDirectoryExists(const std::string &dir_name) const;
        };

        std::string toString(ReadStrategy strategy);
        ReadStrategy readStrategyFromString(const std::string &name);

        void to_json(nlohmann::json &j, const ChunkConfig &c);

    } // namespace Config
} // namespace ChunkVault
