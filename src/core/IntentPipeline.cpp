#include "core/IntentPipeline.hpp"
#include "embedding/Clustering.hpp"
#include "embedding/Similarity.hpp"
#include "embedding/Vectorizer.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace intentcluster {

const char* to_string(ClusterSpace space) {
    switch (space) {
        case ClusterSpace::SimilarityRows: return "rows";
        case ClusterSpace::FeatureVectors: return "features";
        default: return "unknown";
    }
}

ClusterSpace clusterSpaceFromString(const std::string& name) {
    if (name == "rows") return ClusterSpace::SimilarityRows;
    else if (name == "features") return ClusterSpace::FeatureVectors;
    else throw std::invalid_argument("Invalid cluster space: " + name + " (expected rows or features)");
}

nlohmann::json ClusteringResult::to_json() const {
    nlohmann::json clusters = nlohmann::json::array();
    for (const auto& [label, members] : groups) {
        clusters.push_back({
            {"label", label},
            {"size", members.size()},
            {"utterances", members}
        });
    }

    return {
        {"labels", labels},
        {"clusters", clusters},
        {"stats", {
            {"utterances", utterancesProcessed},
            {"vocabulary", vocabularySize},
            {"clusters", clustersFound},
            {"noise", noiseCount},
            {"empty", emptyVectors}
        }}
    };
}

std::string ClusteringResult::to_str() const {
    std::ostringstream out;
    out << "Utterances: " << utterancesProcessed
        << ", vocabulary: " << vocabularySize
        << ", clusters: " << clustersFound
        << ", noise: " << noiseCount << "\n";

    for (const auto& [label, members] : groups) {
        out << "\n";
        if (label == kNoiseLabel) {
            out << "Noise (" << members.size() << ")\n";
        } else {
            out << "Cluster " << label << " (" << members.size() << ")\n";
        }
        for (const auto& utterance : members) {
            out << "  - " << utterance << "\n";
        }
    }
    return out.str();
}

IntentPipeline::IntentPipeline(const nlp::ITextNormalizer& normalizer, bool verbose)
    : normalizer_(normalizer), verbose_(verbose) {}

ClusteringResult IntentPipeline::run(const std::vector<std::string>& utterances,
                                     const ClusteringParams& params) const {
    Clustering::validateParameters(params.eps, params.minPts);

    ClusteringResult result;
    result.utterancesProcessed = utterances.size();
    if (utterances.empty()) {
        return result;
    }

    auto sequences = normalizer_.normalizeAll(utterances);
    for (const auto& sequence : sequences) {
        if (sequence.empty()) result.emptyVectors++;
    }

    auto batch = TfidfVectorizer::fitTransform(sequences);
    result.vocabularySize = batch.vocabulary.size();
    if (verbose_) {
        std::cout << "Normalized " << sequences.size() << " utterances, vocabulary size "
                  << batch.vocabulary.size() << ", " << result.emptyVectors << " without content tokens"
                  << std::endl;
    }

    std::vector<std::vector<double>> points;
    if (params.space == ClusterSpace::SimilarityRows) {
        points = SimilarityEngine::compute(batch.vectors);
    } else {
        points.reserve(batch.vectors.size());
        for (const auto& vector : batch.vectors) {
            points.push_back(TfidfVectorizer::toDense(vector, batch.vocabulary.size()));
        }
    }

    auto dbscan = Clustering::dbscan(points, params.eps, params.minPts);
    result.labels = std::move(dbscan.labels);
    result.core = std::move(dbscan.core);
    result.clustersFound = dbscan.clusterCount;
    result.noiseCount = static_cast<size_t>(std::count(result.labels.begin(), result.labels.end(), kNoiseLabel));
    result.groups = ResultAggregator::aggregate(utterances, result.labels);

    if (verbose_) {
        std::cout << "DBSCAN over " << to_string(params.space) << " (eps=" << params.eps
                  << ", minPts=" << params.minPts << "): " << result.clustersFound << " clusters, "
                  << result.noiseCount << " noise" << std::endl;
    }

    return result;
}

} // namespace intentcluster
