#include <iostream>
#include <string>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include "config.hpp"
#include "embedding/Clustering.hpp"
#include "core/IntentPipeline.hpp"
#include "core/Settings.hpp"
#include "io/TextExtractor.hpp"
#include "nlp/LanguageModel.hpp"
#include "nlp/TextNormalizer.hpp"
#include "server/ClusterHandler.hpp"
#include "server/endpoint.hpp"
#include "server/wserver.hpp"

namespace po = boost::program_options;
using namespace intentcluster;

void signal_handler(int signum) {
    if (signum == SIGINT) {
        std::cout << "\nSIGINT received, shutting down" << std::endl;
        std::exit(0);
    }
}

int serve(const IntentPipeline& pipeline, const Settings& settings)
{
    std::signal(SIGINT, signal_handler);

    auto server = std::make_shared<wServer>();
    ClusterHandler clusterHandler(pipeline, settings.params);

    server->add_endpoint(endpoint(
        [&clusterHandler](const http::Request& req) { return clusterHandler.handleJson(req); },
        http::HttpRequest::POST,
        "/api/cluster",
        "application/json"
    ));
    server->add_endpoint(endpoint(
        [&clusterHandler](const http::Request& req) { return clusterHandler.handleUpload(req); },
        http::HttpRequest::POST,
        "/api/cluster/upload",
        "multipart/form-data"
    ));
    server->add_endpoint(endpoint(
        [&clusterHandler](const http::Request& req) { return clusterHandler.handleHealth(req); },
        http::HttpRequest::GET,
        "/api/health"
    ));

    server->run(settings.port);
    return 0;
}

int cluster_file(const IntentPipeline& pipeline, const Settings& settings,
                 const std::string& input, bool asJson)
{
    auto utterances = TextExtractor::extractFromFile(input);
    if (!utterances) {
        std::cerr << "Error: could not read utterances from " << input << std::endl;
        return 1;
    }

    if (settings.verbose) {
        std::cout << "Read " << utterances->size() << " utterances from " << input << std::endl;
    }

    ClusteringResult result = pipeline.run(*utterances, settings.params);
    if (asJson) {
        std::cout << result.to_json().dump(2) << std::endl;
    } else {
        std::cout << result.to_str();
    }
    return 0;
}

int main(int argc, char** argv)
{
    po::options_description desc("intentcluster: group similar intent utterances with TF-IDF and DBSCAN\n\nOptions");
    desc.add_options()
        ("help,h", "show this message")
        ("input,i", po::value<std::string>(), "utterance file (.txt one per line, or .json)")
        ("serve", "run the HTTP service instead of clustering a file")
        ("port,p", po::value<int>(), "HTTP port")
        ("eps,e", po::value<double>(), "DBSCAN neighbourhood radius (cosine distance)")
        ("min-pts,m", po::value<int>(), "DBSCAN minimum neighbourhood size, counting the point")
        ("cluster-space", po::value<std::string>(), "points to cluster: rows (similarity rows) or features")
        ("json", "print the result as JSON")
        ("config,c", po::value<std::string>()->default_value(CONFIG_FILE_PATH), "JSON config file")
        ("language,l", po::value<std::string>(), "JSON language resource (stop words, lemmas)")
        ("verbose,v", "print pipeline progress");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 0;
    }

    Settings settings = Settings::loadFromJson(vm["config"].as<std::string>());
    try {
        if (vm.count("eps")) settings.params.eps = vm["eps"].as<double>();
        if (vm.count("min-pts")) settings.params.minPts = vm["min-pts"].as<int>();
        if (vm.count("cluster-space")) {
            settings.params.space = clusterSpaceFromString(vm["cluster-space"].as<std::string>());
        }
        if (vm.count("port")) {
            int port = vm["port"].as<int>();
            if (port <= 0 || port > 65535) {
                throw std::invalid_argument("port out of range: " + std::to_string(port));
            }
            settings.port = static_cast<uint16_t>(port);
        }
        if (vm.count("language")) settings.languageFile = vm["language"].as<std::string>();
        if (vm.count("verbose")) settings.verbose = true;

        // Reject bad parameters before loading anything
        Clustering::validateParameters(settings.params.eps, settings.params.minPts);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<nlp::LanguageModel> language;
    try {
        language = std::make_unique<nlp::LanguageModel>(
            settings.languageFile.empty() ? nlp::LanguageModel::english()
                                          : nlp::LanguageModel::fromJsonFile(settings.languageFile));
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    nlp::EnglishNormalizer normalizer(*language);
    IntentPipeline pipeline(normalizer, settings.verbose);

    if (settings.verbose) {
        std::cout << "Settings: " << settings.to_json().dump() << std::endl;
    }

    if (vm.count("serve")) {
        return serve(pipeline, settings);
    }

    if (!vm.count("input")) {
        std::cerr << "Error: either --input or --serve is required\n\n" << desc << std::endl;
        return 1;
    }

    try {
        return cluster_file(pipeline, settings, vm["input"].as<std::string>(), vm.count("json") > 0);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
