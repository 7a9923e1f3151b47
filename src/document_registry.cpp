// src/document_registry.cpp
#include "chunkvault/document_registry.hpp"
#include "chunkvault/content_codec.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/fragment.hpp"

#include <algorithm>
#include <fstream>
#include <iostream> // For logging
#include <stdexcept>

namespace fs = std::filesystem;

namespace ChunkVault {
namespace Registry {

namespace {

const size_t DOCUMENT_ID_BYTES = 16;

std::string statusToString(DocumentStatus status) {
    return status == DocumentStatus::Ready ? "ready" : "pending";
}

DocumentStatus statusFromString(const std::string& name) {
    if (name == "ready") return DocumentStatus::Ready;
    if (name == "pending") return DocumentStatus::Pending;
    throw std::runtime_error("unknown document status '" + name + "'");
}

// Ids come from the outside on reads; keep them from escaping the metadata directory
bool isWellFormedId(const std::string& id) {
    return !id.empty() && id.size() <= 128 &&
           std::all_of(id.begin(), id.end(), [](char c) {
               return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '-' || c == '_';
           });
}

} // namespace

void to_json(nlohmann::json& j, const DocumentRecord& r) {
    j = nlohmann::json{
        {"documentId", r.document_id},
        {"ownerId", r.owner_id},
        {"filename", r.filename},
        {"contentType", r.content_type},
        {"originalSize", r.original_size_bytes},
        {"storedSize", r.stored_size_bytes},
        {"chunkCount", r.chunk_count},
        {"status", statusToString(r.status)},
        {"createdAt", r.created_at}
    };
}

void from_json(const nlohmann::json& j, DocumentRecord& r) {
    j.at("documentId").get_to(r.document_id);
    j.at("ownerId").get_to(r.owner_id);
    j.at("filename").get_to(r.filename);
    j.at("contentType").get_to(r.content_type);
    j.at("originalSize").get_to(r.original_size_bytes);
    j.at("storedSize").get_to(r.stored_size_bytes);
    j.at("chunkCount").get_to(r.chunk_count);
    r.status = statusFromString(j.at("status").get<std::string>());
    j.at("createdAt").get_to(r.created_at);
}

nlohmann::json DocumentRecord::toJson() const {
    return *this;
}

DocumentRecord DocumentRecord::fromJson(const nlohmann::json& j) {
    DocumentRecord record;
    j.get_to(record);
    return record;
}

FileDocumentRegistry::FileDocumentRegistry(const Config::ChunkConfig& config)
    : metadata_dir(config.getMetadataDirPath()) {
    std::cout << "FileDocumentRegistry initialized at " << metadata_dir << std::endl;
}

fs::path FileDocumentRegistry::getFullPath(const std::string& document_id) const {
    return metadata_dir / (document_id + ".json");
}

void FileDocumentRegistry::save(const DocumentRecord& record) const {
    fs::path record_path = getFullPath(record.document_id);
    fs::path temp_path = record_path;
    temp_path += ".tmp";

    std::ofstream ofs(temp_path, std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing document record: " + temp_path.string());
    }
    ofs << record.toJson().dump(4); // Pretty print with 4 spaces
    ofs.close();
    if (!ofs) {
        throw std::runtime_error("Failed to write all data to document record: " + temp_path.string());
    }
    // Replace in one step so a reader never sees a half-written record
    fs::rename(temp_path, record_path);
}

std::optional<DocumentRecord> FileDocumentRegistry::load(const std::string& document_id) const {
    if (!isWellFormedId(document_id)) {
        return std::nullopt;
    }
    fs::path record_path = getFullPath(document_id);
    if (!fs::exists(record_path)) {
        return std::nullopt;
    }

    std::ifstream ifs(record_path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open document record for reading: " + record_path.string());
    }

    nlohmann::json j;
    try {
        ifs >> j;
        return DocumentRecord::fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Error parsing document record " + record_path.string() + ": " + e.what());
    }
}

DocumentRecord FileDocumentRegistry::reserve(const std::string& owner_id,
                                             const std::string& filename,
                                             const std::string& content_type,
                                             uint64_t original_size_bytes) {
    DocumentRecord record;
    record.owner_id = owner_id;
    record.filename = filename;
    record.content_type = content_type;
    record.original_size_bytes = original_size_bytes;
    record.created_at = Chunks::currentTimestamp();

    std::lock_guard<std::mutex> lock(mtx);
    // 128 random bits; the loop only guards against the astronomically unlikely collision
    do {
        record.document_id = Codec::ContentCodec::randomHex(DOCUMENT_ID_BYTES);
    } while (fs::exists(getFullPath(record.document_id)));

    save(record);
    return record;
}

std::optional<DocumentRecord> FileDocumentRegistry::get(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mtx);
    return load(document_id);
}

DocumentRecord FileDocumentRegistry::markReady(const std::string& document_id,
                                               size_t chunk_count,
                                               uint64_t stored_size_bytes) {
    std::lock_guard<std::mutex> lock(mtx);
    std::optional<DocumentRecord> record = load(document_id);
    if (!record) {
        throw DocumentNotFoundError(document_id);
    }
    record->chunk_count = chunk_count;
    record->stored_size_bytes = stored_size_bytes;
    record->status = DocumentStatus::Ready;
    save(*record);
    return *record;
}

bool FileDocumentRegistry::remove(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!isWellFormedId(document_id)) {
        return false;
    }
    bool removed = fs::remove(getFullPath(document_id));
    if (removed) {
        std::cout << "Deleted document record: " << document_id << std::endl;
    }
    return removed;
}

} // namespace Registry
} // namespace ChunkVault
