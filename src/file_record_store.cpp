// src/file_record_store.cpp
#include "chunkvault/file_record_store.hpp"
#include "chunkvault/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream> // For logging

namespace fs = std::filesystem;

namespace ChunkVault
{
    namespace Storage
    {
        namespace
        {
            // Document ids become directory names, so only allow a safe alphabet
            bool isSafeId(const std::string &id)
            {
                if (id.empty() || id.size() > 128)
                    return false;
                return std::all_of(id.begin(), id.end(), [](char c)
                                   { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                                            (c >= '0' && c <= '9') || c == '-' || c == '_'; });
            }

            void requireSafeId(const std::string &document_id, std::optional<size_t> chunk_index = std::nullopt)
            {
                if (!isSafeId(document_id))
                {
                    throw StoreError("document id is not a valid record key", document_id, chunk_index);
                }
            }
        } // namespace

        FileRecordStore::FileRecordStore(const Config::ChunkConfig &config)
            : chunks_dir(config.getChunksDirPath()), record_size_ceiling(config.record_size_ceiling)
        {
            std::cout << "FileRecordStore initialized at " << chunks_dir << std::endl;
        }

        fs::path FileRecordStore::documentDir(const std::string &document_id) const
        {
            return chunks_dir / document_id;
        }

        fs::path FileRecordStore::getFullPath(const std::string &document_id, size_t chunk_index) const
        {
            return documentDir(document_id) / (std::to_string(chunk_index) + ".json");
        }

        void FileRecordStore::put(const Chunks::Fragment &fragment)
        {
            requireSafeId(fragment.document_id, fragment.chunk_index);

            std::string serialized = fragment.toJson().dump();
            if (serialized.size() > record_size_ceiling)
            {
                throw StoreError("record of " + std::to_string(serialized.size()) + " bytes exceeds ceiling of " +
                                     std::to_string(record_size_ceiling),
                                 fragment.document_id, fragment.chunk_index);
            }

            fs::path chunk_path = getFullPath(fragment.document_id, fragment.chunk_index);
            fs::path temp_path = chunk_path;
            temp_path += ".tmp";

            std::lock_guard<std::mutex> lock(write_mtx);
            std::error_code ec;
            if (fs::exists(chunk_path, ec))
            {
                // Fragments are immutable once written
                throw StoreError("fragment already exists", fragment.document_id, fragment.chunk_index);
            }

            fs::create_directories(chunk_path.parent_path(), ec);
            if (ec)
            {
                throw StoreError("cannot create directory " + chunk_path.parent_path().string() + ": " + ec.message(),
                                 fragment.document_id, fragment.chunk_index, true);
            }

            std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw StoreError("failed to open file for writing: " + temp_path.string(),
                                 fragment.document_id, fragment.chunk_index, true);
            }
            ofs.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
            ofs.close();
            if (!ofs)
            {
                fs::remove(temp_path, ec);
                throw StoreError("failed to write all data to " + temp_path.string(),
                                 fragment.document_id, fragment.chunk_index, true);
            }

            fs::rename(temp_path, chunk_path, ec);
            if (ec)
            {
                std::error_code cleanup_ec;
                fs::remove(temp_path, cleanup_ec);
                throw StoreError("failed to move fragment into place: " + ec.message(),
                                 fragment.document_id, fragment.chunk_index, true);
            }
        }

        Chunks::Fragment FileRecordStore::loadFragment(const fs::path &path,
                                                       const std::string &document_id,
                                                       std::optional<size_t> chunk_index) const
        {
            std::ifstream ifs(path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw StoreError("failed to open fragment file for reading: " + path.string(),
                                 document_id, chunk_index, true);
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
                return Chunks::Fragment::fromJson(j);
            }
            catch (const nlohmann::json::exception &e)
            {
                // A malformed record will not fix itself, so this is not transient
                throw StoreError("error parsing fragment file " + path.string() + ": " + e.what(),
                                 document_id, chunk_index);
            }
        }

        std::optional<Chunks::Fragment> FileRecordStore::getByIndex(const std::string &document_id,
                                                                    size_t chunk_index)
        {
            requireSafeId(document_id, chunk_index);
            fs::path chunk_path = getFullPath(document_id, chunk_index);

            std::error_code ec;
            if (!fs::exists(chunk_path, ec))
            {
                if (ec)
                {
                    throw StoreError("cannot stat " + chunk_path.string() + ": " + ec.message(),
                                     document_id, chunk_index, true);
                }
                return std::nullopt;
            }
            return loadFragment(chunk_path, document_id, chunk_index);
        }

        std::vector<Chunks::Fragment> FileRecordStore::queryAll(const std::string &document_id)
        {
            requireSafeId(document_id);
            std::vector<Chunks::Fragment> fragments;
            fs::path dir = documentDir(document_id);

            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return fragments;
            }

            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
            {
                const fs::path &path = it->path();
                if (path.extension() != ".json")
                {
                    continue; // Skips leftover .tmp files from interrupted writes
                }
                fragments.push_back(loadFragment(path, document_id, std::nullopt));
            }
            if (ec)
            {
                throw StoreError("cannot list " + dir.string() + ": " + ec.message(), document_id, std::nullopt, true);
            }
            return fragments;
        }

        bool FileRecordStore::remove(const std::string &document_id, size_t chunk_index)
        {
            requireSafeId(document_id, chunk_index);
            std::error_code ec;
            bool removed = fs::remove(getFullPath(document_id, chunk_index), ec);
            if (ec)
            {
                throw StoreError("failed to delete fragment: " + ec.message(), document_id, chunk_index, true);
            }

            // Drop the document directory once its last fragment is gone
            fs::path dir = documentDir(document_id);
            if (fs::is_directory(dir, ec) && fs::is_empty(dir, ec))
            {
                fs::remove(dir, ec);
            }
            return removed;
        }

        size_t FileRecordStore::removeAll(const std::string &document_id)
        {
            requireSafeId(document_id);
            fs::path dir = documentDir(document_id);

            std::error_code ec;
            if (!fs::is_directory(dir, ec))
            {
                return 0;
            }

            size_t count = 0;
            for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
            {
                if (it->path().extension() == ".json")
                {
                    count++;
                }
            }
            fs::remove_all(dir, ec);
            if (ec)
            {
                throw StoreError("failed to delete fragments in " + dir.string() + ": " + ec.message(),
                                 document_id, std::nullopt, true);
            }
            std::cout << "Deleted " << count << " fragment(s) for document " << document_id << std::endl;
            return count;
        }

    } // namespace Storage
} // namespace ChunkVault
