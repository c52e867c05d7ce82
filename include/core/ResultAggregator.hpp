#pragma once

#include <map>
#include <string>
#include <vector>

namespace intentcluster {

// Cluster label -> member utterances. Ascending label order puts noise (-1) first.
using ClusterGroups = std::map<int, std::vector<std::string>>;

class ResultAggregator {
public:
    // Group utterances by label, keeping input order inside each group.
    // Throws std::invalid_argument if the two sequences differ in length.
    static ClusterGroups aggregate(const std::vector<std::string>& utterances,
                                   const std::vector<int>& labels);
};

} // namespace intentcluster
