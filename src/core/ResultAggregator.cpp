#include "core/ResultAggregator.hpp"
#include <stdexcept>

namespace intentcluster {

ClusterGroups ResultAggregator::aggregate(const std::vector<std::string>& utterances,
                                          const std::vector<int>& labels) {
    if (utterances.size() != labels.size()) {
        throw std::invalid_argument("Got " + std::to_string(labels.size()) + " labels for " +
                                    std::to_string(utterances.size()) + " utterances");
    }

    ClusterGroups groups;
    for (size_t i = 0; i < utterances.size(); ++i) {
        groups[labels[i]].push_back(utterances[i]);
    }
    return groups;
}

} // namespace intentcluster
