#include "server/ClusterHandler.hpp"
#include "core/Errors.hpp"
#include "core/Settings.hpp"
#include "io/TextExtractor.hpp"
#include <iostream>

namespace intentcluster {

ClusterHandler::ClusterHandler(const IntentPipeline& pipeline, const ClusteringParams& defaults)
    : pipeline_(pipeline), defaults_(defaults) {}

bool ClusterHandler::parseRequest(const nlohmann::json& body,
                                  std::vector<std::string>& utterances,
                                  ClusteringParams& params,
                                  std::string& error) const {
    if (!body.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!body.contains("utterances") || !body["utterances"].is_array()) {
        error = "Missing required field: utterances (array of strings)";
        return false;
    }

    for (const auto& item : body["utterances"]) {
        if (!item.is_string()) {
            error = "Utterances must be strings";
            return false;
        }
        utterances.push_back(item.get<std::string>());
    }

    if (body.contains("eps")) {
        if (!body["eps"].is_number()) {
            error = "eps must be a number";
            return false;
        }
        params.eps = body["eps"].get<double>();
    }

    if (body.contains("min_pts")) {
        if (!body["min_pts"].is_number_integer()) {
            error = "min_pts must be an integer";
            return false;
        }
        if (!jsonToInt(body["min_pts"], params.minPts)) {
            error = "Invalid parameter: min_pts out of range: " + body["min_pts"].dump();
            return false;
        }
    }

    if (body.contains("cluster_space")) {
        if (!body["cluster_space"].is_string()) {
            error = "cluster_space must be a string";
            return false;
        }
        try {
            params.space = clusterSpaceFromString(body["cluster_space"].get<std::string>());
        } catch (const std::invalid_argument& e) {
            error = e.what();
            return false;
        }
    }

    return true;
}

bool ClusterHandler::parseFields(const http::Request& req, ClusteringParams& params, std::string& error) const {
    auto field = [&req](const std::string& name) -> std::string {
        if (const http::MultipartPart* part = req.findPart(name)) {
            std::string value = part->data;
            http::MultipartParser::trim(value);
            return value;
        }
        return req.getQuery(name);
    };

    std::string eps = field("eps");
    std::string minPts = field("min_pts");
    std::string space = field("cluster_space");

    try {
        size_t used = 0;
        if (!eps.empty()) {
            params.eps = std::stod(eps, &used);
            if (used != eps.size()) throw std::invalid_argument("eps");
        }
        if (!minPts.empty()) {
            params.minPts = std::stoi(minPts, &used);
            if (used != minPts.size()) throw std::invalid_argument("min_pts");
        }
    } catch (const std::exception&) {
        error = "eps must be a number and min_pts an integer";
        return false;
    }

    if (!space.empty()) {
        try {
            params.space = clusterSpaceFromString(space);
        } catch (const std::invalid_argument& e) {
            error = e.what();
            return false;
        }
    }

    return true;
}

http::Response ClusterHandler::cluster(const std::vector<std::string>& utterances,
                                       const ClusteringParams& params) const {
    try {
        ClusteringResult result = pipeline_.run(utterances, params);
        std::cout << "Clustered " << result.utterancesProcessed << " utterances into "
                  << result.clustersFound << " clusters (" << result.noiseCount << " noise)" << std::endl;

        nlohmann::json response = result.to_json();
        response["status"] = "success";
        return http::Response::ok(response);
    } catch (const InvalidParameter& e) {
        return http::Response::badRequest(std::string("Invalid parameter: ") + e.what());
    } catch (const std::exception& e) {
        std::cerr << "Clustering failed: " << e.what() << std::endl;
        return http::Response::error(std::string("Clustering failed: ") + e.what());
    }
}

http::Response ClusterHandler::handleJson(const http::Request& req) const {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.rawBody);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error: " << e.what() << std::endl;
        return http::Response::badRequest(std::string("Invalid JSON: ") + e.what());
    }

    std::vector<std::string> utterances;
    ClusteringParams params = defaults_;
    std::string error;
    if (!parseRequest(body, utterances, params, error)) {
        return http::Response::badRequest(error);
    }

    return cluster(utterances, params);
}

http::Response ClusterHandler::handleUpload(const http::Request& req) const {
    const http::MultipartPart* file = req.findPart("file");
    if (file == nullptr) {
        for (const auto& part : req.parts) {
            if (part.isFile()) {
                file = &part;
                break;
            }
        }
    }
    if (file == nullptr) {
        return http::Response::badRequest("No file part in upload");
    }

    ClusteringParams params = defaults_;
    std::string error;
    if (!parseFields(req, params, error)) {
        return http::Response::badRequest(error);
    }

    auto utterances = TextExtractor::extractFromUpload(file->filename, file->data);
    if (!utterances) {
        return http::Response::badRequest("Unsupported or malformed file: " + file->filename);
    }

    std::cout << "Upload " << (file->filename.empty() ? file->name : file->filename) << ": "
              << utterances->size() << " utterances" << std::endl;
    return cluster(*utterances, params);
}

http::Response ClusterHandler::handleHealth(const http::Request&) const {
    return http::Response::ok({
        {"status", "ok"},
        {"eps", defaults_.eps},
        {"min_pts", defaults_.minPts},
        {"cluster_space", to_string(defaults_.space)}
    });
}

} // namespace intentcluster
