// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory>

// Crow includes
#include <crow.h>
#include <crow/multipart.h> // For multipart/form-data parsing

#include <nlohmann/json.hpp>

// Our project includes
#include "chunkvault/chunk_config.hpp"
#include "chunkvault/content_store.hpp"
#include "chunkvault/document_registry.hpp"
#include "chunkvault/errors.hpp"
#include "chunkvault/file_record_store.hpp"

namespace fs = std::filesystem;
using ChunkVault::ContentStore;

namespace {

// Guess a Content-Type from the filename when the client did not send one
std::string getContentType(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    if (ext == ".txt") return "text/plain";
    if (ext == ".json") return "application/json";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".doc") return "application/msword";
    if (ext == ".docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    return "application/octet-stream";
}

crow::response jsonResponse(int code, const nlohmann::json& body) {
    crow::response res(code);
    res.set_header("Content-Type", "application/json");
    res.body = body.dump();
    return res;
}

crow::response errorResponse(int code, const std::string& message) {
    return jsonResponse(code, nlohmann::json{{"error", message}});
}

crow::response reconstructionErrorResponse(const ChunkVault::ChunkReconstructionError& e) {
    const auto& d = e.details();
    return jsonResponse(500, nlohmann::json{
        {"error", e.what()},
        {"documentId", d.document_id},
        {"expected", d.expected},
        {"received", d.received},
        {"missing", d.missing},
        {"duplicates", d.duplicates},
        {"outOfRange", d.out_of_range},
        {"totalMismatch", d.total_mismatch},
        {"corrupt", d.corrupt}
    });
}

std::string partValue(const crow::multipart::message& msg, const std::string& name) {
    auto it = msg.part_map.find(name);
    return it == msg.part_map.end() ? std::string() : it->second.body;
}

} // namespace

int main(int argc, char* argv[]) {
    ChunkVault::Config::ChunkConfig config;
    try {
        if (argc > 1) {
            config = ChunkVault::Config::ChunkConfig::loadFromFile(argv[1]);
        } else {
            config.validate();
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::shared_ptr<ContentStore> content_store;
    try {
        auto store = std::make_shared<ChunkVault::Storage::FileRecordStore>(config);
        auto registry = std::make_shared<ChunkVault::Registry::FileDocumentRegistry>(config);
        content_store = std::make_shared<ContentStore>(config, store, registry);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize storage: " << e.what() << std::endl;
        return 1;
    }

    crow::SimpleApp app;

    // --- POST /documents: upload a new document ---
    // multipart/form-data fields:
    // - file: the document content (required)
    // - owner_id, filename, content_type: optional overrides
    CROW_ROUTE(app, "/documents").methods("POST"_method)
    ([content_store](const crow::request& req) {
        if (req.get_header_value("Content-Type").rfind("multipart/form-data", 0) != 0) {
            return errorResponse(400, "Expected multipart/form-data.");
        }

        crow::multipart::message multipart_data(req);
        auto file_it = multipart_data.part_map.find("file");
        if (file_it == multipart_data.part_map.end()) {
            return errorResponse(400, "'file' part missing in multipart/form-data.");
        }
        const crow::multipart::part& file_part = file_it->second;

        if (file_part.body.size() > content_store->getConfig().max_upload_size) {
            return errorResponse(413, "File exceeds the upload limit.");
        }

        std::string filename = partValue(multipart_data, "filename");
        if (filename.empty()) {
            auto disposition = file_part.get_header_object("Content-Disposition");
            auto name_it = disposition.params.find("filename");
            if (name_it != disposition.params.end()) {
                filename = name_it->second;
            }
        }
        if (filename.empty()) {
            filename = "upload";
        }

        std::string content_type = partValue(multipart_data, "content_type");
        if (content_type.empty()) {
            content_type = file_part.get_header_object("Content-Type").value;
        }
        if (content_type.empty()) {
            content_type = getContentType(filename);
        }

        std::string owner_id = partValue(multipart_data, "owner_id");
        if (owner_id.empty()) {
            owner_id = "anonymous";
        }

        try {
            std::vector<char> raw(file_part.body.begin(), file_part.body.end());
            auto record = content_store->uploadDocument(owner_id, filename, content_type, raw);
            return jsonResponse(201, record.toJson());
        } catch (const ChunkVault::ChunkWriteError& e) {
            std::cerr << "Error during upload: " << e.what() << std::endl;
            return errorResponse(503, e.what());
        } catch (const std::exception& e) {
            std::cerr << "Error during upload: " << e.what() << std::endl;
            return errorResponse(500, e.what());
        }
    });

    // --- GET /documents/<id>: reassembled document bytes ---
    CROW_ROUTE(app, "/documents/<string>")
    ([content_store](std::string document_id) {
        try {
            auto record = content_store->getDocument(document_id);
            std::vector<char> data = content_store->downloadDocument(document_id);

            crow::response res(200);
            res.set_header("Content-Type", record ? record->content_type : "application/octet-stream");
            if (record) {
                res.set_header("Content-Disposition", "attachment; filename=\"" + record->filename + "\"");
            }
            res.body.assign(data.begin(), data.end());
            return res;
        } catch (const ChunkVault::DocumentNotFoundError& e) {
            return errorResponse(404, e.what());
        } catch (const ChunkVault::ChunkReconstructionError& e) {
            std::cerr << e.what() << std::endl;
            return reconstructionErrorResponse(e);
        } catch (const ChunkVault::StoreError& e) {
            std::cerr << "Error retrieving document: " << e.what() << std::endl;
            return errorResponse(e.transient() ? 503 : 500, e.what());
        } catch (const std::exception& e) {
            std::cerr << "Error retrieving document: " << e.what() << std::endl;
            return errorResponse(500, e.what());
        }
    });

    // --- GET /documents/<id>/metadata: the registry record ---
    CROW_ROUTE(app, "/documents/<string>/metadata")
    ([content_store](std::string document_id) {
        try {
            auto record = content_store->getDocument(document_id);
            if (!record) {
                return errorResponse(404, "Document not found.");
            }
            return jsonResponse(200, record->toJson());
        } catch (const std::exception& e) {
            std::cerr << "Error reading document record: " << e.what() << std::endl;
            return errorResponse(500, e.what());
        }
    });

    // --- GET /documents/<id>/chunks/<index>: one stored fragment ---
    CROW_ROUTE(app, "/documents/<string>/chunks/<uint>")
    ([content_store](std::string document_id, uint64_t chunk_index) {
        try {
            auto fragment = content_store->retrieveChunk(document_id, static_cast<size_t>(chunk_index));
            if (!fragment) {
                return errorResponse(404, "Chunk not found.");
            }
            return jsonResponse(200, fragment->toJson());
        } catch (const ChunkVault::DocumentNotFoundError& e) {
            return errorResponse(404, e.what());
        } catch (const std::exception& e) {
            std::cerr << "Error retrieving chunk: " << e.what() << std::endl;
            return errorResponse(500, e.what());
        }
    });

    // --- DELETE /documents/<id>: remove fragments and record ---
    CROW_ROUTE(app, "/documents/<string>").methods("DELETE"_method)
    ([content_store](std::string document_id) {
        try {
            if (content_store->deleteDocument(document_id)) {
                return crow::response(204);
            }
            return errorResponse(404, "Document not found.");
        } catch (const std::exception& e) {
            std::cerr << "Error deleting document: " << e.what() << std::endl;
            return errorResponse(500, e.what());
        }
    });

    std::cout << "Starting ChunkVault service on http://localhost:" << config.port << std::endl;
    app.port(config.port).multithreaded().run();

    return 0;
}
