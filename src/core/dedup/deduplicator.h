#pragma once

#include "core/dedup/similarity_graph.h"
#include "core/shared/article.h"

#include <QString>

#include <vector>

namespace nr {

// A set of articles judged duplicates of one another. memberIds lists every
// absorbed article (URL, title and lexical duplicates) in arrival order.
struct DedupCluster {
    QString clusterId;
    QString representativeId;
    std::vector<QString> memberIds;

    int size() const { return static_cast<int>(memberIds.size()); }
};

struct DedupRepresentative {
    NormalizedArticle article;
    int arrivalIndex = 0;
    QString clusterId;
    int clusterSize = 1;
    int graphNode = -1;     // node index in DedupResult::graph
};

struct DedupStats {
    int inputCount = 0;
    int afterUrl = 0;
    int afterTitle = 0;
    int clusterCount = 0;
};

struct DedupResult {
    // One entry per cluster, ordered by the cluster's earliest arrival.
    std::vector<DedupRepresentative> representatives;
    std::vector<DedupCluster> clusters;     // parallel to representatives
    DedupStats stats;

    // Title graph over the Stage B survivors, retained for reuse downstream.
    SimilarityGraph graph;
};

struct DedupConfig {
    double similarityThreshold = 0.6;
    // Lowest similarity kept in the graph. Values above similarityThreshold
    // are clamped down to it.
    double graphFloor = 0.6;
    int workerThreads = 0;
};

// Deduplicator -- collapses exact and near-duplicate articles.
//
//   Stage A: normalized URL identity, first seen wins
//   Stage B: normalized title hash identity, first seen wins
//   Stage C: connected components of the title-Jaccard graph; the member
//            with the longest body represents the cluster (earliest arrival
//            breaks ties)
class Deduplicator {
public:
    explicit Deduplicator(DedupConfig config = {});

    DedupResult deduplicate(const std::vector<NormalizedArticle>& articles) const;

    // Deterministic cluster id derived from the representative id.
    static QString clusterIdFor(const QString& representativeId);

    const DedupConfig& config() const { return m_config; }

private:
    DedupConfig m_config;
};

} // namespace nr
