#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/IntentPipeline.hpp"
#include "http/Request.hpp"

namespace intentcluster {

class ClusterHandler {
public:
    // The pipeline must outlive the handler
    ClusterHandler(const IntentPipeline& pipeline, const ClusteringParams& defaults);

    // POST /api/cluster with {"utterances": [...], "eps": x, "min_pts": n}
    http::Response handleJson(const http::Request& req) const;

    // POST /api/cluster/upload, multipart with a "file" part and optional
    // "eps", "min_pts" and "cluster_space" fields
    http::Response handleUpload(const http::Request& req) const;

    // GET /api/health
    http::Response handleHealth(const http::Request& req) const;

private:
    const IntentPipeline& pipeline_;
    ClusteringParams defaults_;

    // Validate the request JSON and fill in parameters
    bool parseRequest(const nlohmann::json& body,
                      std::vector<std::string>& utterances,
                      ClusteringParams& params,
                      std::string& error) const;

    // Read parameter overrides from form fields or the query string
    bool parseFields(const http::Request& req, ClusteringParams& params, std::string& error) const;

    http::Response cluster(const std::vector<std::string>& utterances, const ClusteringParams& params) const;
};

} // namespace intentcluster
