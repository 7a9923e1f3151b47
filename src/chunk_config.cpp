// src/chunk_config.cpp
#include "chunkvault/chunk_config.hpp"
#include "chunkvault/errors.hpp"

#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace ChunkVault
{
    namespace Config
    {

        const std::string ChunkConfig::CHUNKS_DIR_NAME = "chunks";
        const std::string ChunkConfig::METADATA_DIR_NAME = "metadata";

        std::string toString(ReadStrategy strategy)
        {
            return strategy == ReadStrategy::RangeQuery ? "range_query" : "per_index";
        }

        ReadStrategy readStrategyFromString(const std::string &name)
        {
            if (name == "per_index")
                return ReadStrategy::PerIndex;
            if (name == "range_query")
                return ReadStrategy::RangeQuery;
            throw ConfigError("unknown read_strategy '" + name + "'");
        }

        void ChunkConfig::validate() const
        {
            if (max_fragment_size == 0)
            {
                throw ConfigError("max_fragment_size must be positive");
            }
            if (max_fragment_size + metadata_headroom > record_size_ceiling)
            {
                throw ConfigError("max_fragment_size (" + std::to_string(max_fragment_size) +
                                  ") plus metadata_headroom (" + std::to_string(metadata_headroom) +
                                  ") exceeds record_size_ceiling (" + std::to_string(record_size_ceiling) + ")");
            }
            if (read_concurrency == 0 || read_concurrency > MAX_READ_CONCURRENCY)
            {
                throw ConfigError("read_concurrency must be between 1 and " + std::to_string(MAX_READ_CONCURRENCY));
            }
            if (retry_attempts == 0)
            {
                throw ConfigError("retry_attempts must be at least 1");
            }
            if (!(image_quality > 0.0 && image_quality <= 1.0))
            {
                throw ConfigError("image_quality must be in (0, 1]");
            }
            if (max_upload_size == 0 || max_upload_size > MAX_UPLOAD_SIZE)
            {
                throw ConfigError("max_upload_size must be between 1 and " + std::to_string(MAX_UPLOAD_SIZE));
            }
        }

        fs::path ChunkConfig::ensureDirectoryExists(const std::string &dir_name) const
        {
            fs::path dir_path = fs::absolute(storage_root / dir_name);

            try
            {
                if (fs::create_directories(dir_path))
                {
                    std::cout << "Created directory: " << dir_path << std::endl;
                }
                else if (!fs::is_directory(dir_path))
                {
                    throw std::runtime_error("Failed to create directory: " + dir_path.string());
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

        fs::path ChunkConfig::getChunksDirPath() const
        {
            return ensureDirectoryExists(CHUNKS_DIR_NAME);
        }

        fs::path ChunkConfig::getMetadataDirPath() const
        {
            return ensureDirectoryExists(METADATA_DIR_NAME);
        }

        ChunkConfig ChunkConfig::fromJson(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ConfigError("top-level JSON value must be an object");
            }

            ChunkConfig config;
            try
            {
                if (j.contains("max_fragment_size"))
                    j.at("max_fragment_size").get_to(config.max_fragment_size);
                if (j.contains("record_size_ceiling"))
                    j.at("record_size_ceiling").get_to(config.record_size_ceiling);
                if (j.contains("metadata_headroom"))
                    j.at("metadata_headroom").get_to(config.metadata_headroom);
                if (j.contains("read_concurrency"))
                    j.at("read_concurrency").get_to(config.read_concurrency);
                if (j.contains("read_strategy"))
                    config.read_strategy = readStrategyFromString(j.at("read_strategy").get<std::string>());
                if (j.contains("retry_attempts"))
                    j.at("retry_attempts").get_to(config.retry_attempts);
                if (j.contains("retry_backoff_ms"))
                    j.at("retry_backoff_ms").get_to(config.retry_backoff_ms);
                if (j.contains("preprocess_images"))
                    j.at("preprocess_images").get_to(config.preprocess_images);
                if (j.contains("image_quality"))
                    j.at("image_quality").get_to(config.image_quality);
                if (j.contains("max_upload_size"))
                    j.at("max_upload_size").get_to(config.max_upload_size);
                if (j.contains("storage_root"))
                    config.storage_root = j.at("storage_root").get<std::string>();
                if (j.contains("port"))
                    j.at("port").get_to(config.port);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigError(std::string("bad value type: ") + e.what());
            }

            config.validate();
            return config;
        }

        ChunkConfig ChunkConfig::loadFromFile(const fs::path &path)
        {
            std::ifstream ifs(path);
            if (!ifs.is_open())
            {
                throw ConfigError("cannot open config file " + path.string());
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw ConfigError("error parsing " + path.string() + ": " + e.what());
            }
            return fromJson(j);
        }

        void to_json(nlohmann::json &j, const ChunkConfig &c)
        {
            j = nlohmann::json{
                {"max_fragment_size", c.max_fragment_size},
                {"record_size_ceiling", c.record_size_ceiling},
                {"metadata_headroom", c.metadata_headroom},
                {"read_concurrency", c.read_concurrency},
                {"read_strategy", toString(c.read_strategy)},
                {"retry_attempts", c.retry_attempts},
                {"retry_backoff_ms", c.retry_backoff_ms},
                {"preprocess_images", c.preprocess_images},
                {"image_quality", c.image_quality},
                {"max_upload_size", c.max_upload_size},
                {"storage_root", c.storage_root.string()},
                {"port", c.port}};
        }

    } // namespace Config
} // namespace ChunkVault
