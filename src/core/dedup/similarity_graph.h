#pragma once

#include <QSet>
#include <QString>

#include <cstddef>
#include <vector>

namespace nr {

struct SimilarityEdge {
    int lhs = 0;            // lhs < rhs
    int rhs = 0;
    double similarity = 0.0;
};

// SimilarityGraph -- title-Jaccard graph over one batch.
//
// Nodes are indices into the token-set vector passed to build(). Only edges
// with similarity >= floor are retained, so a graph built once at the lowest
// threshold of interest can answer queries at any higher threshold. Both the
// clustering stage and the corroboration bonus read from the same graph.
//
// build() may evaluate pairs on several worker threads. Edges are sorted by
// (lhs, rhs) afterwards, so the graph is identical for any worker count.
class SimilarityGraph {
public:
    SimilarityGraph() = default;

    static SimilarityGraph build(const std::vector<QSet<QString>>& tokenSets,
                                 double floor,
                                 int workerThreads = 0);

    int nodeCount() const { return m_nodeCount; }
    double floor() const { return m_floor; }
    const std::vector<SimilarityEdge>& edges() const { return m_edges; }

    // Neighbours of node with edge similarity >= threshold, ascending.
    std::vector<int> neighbors(int node, double threshold) const;

    // Connected components over edges with similarity >= threshold. Each
    // component is sorted ascending and components are ordered by their
    // smallest member. Isolated nodes form singleton components.
    std::vector<std::vector<int>> connectedComponents(double threshold) const;

    // Number of worker threads build() uses for n nodes.
    static int effectiveWorkerCount(int requested, int nodeCount);

private:
    int m_nodeCount = 0;
    double m_floor = 0.0;
    std::vector<SimilarityEdge> m_edges;
    std::vector<std::vector<size_t>> m_adjacency;  // edge indices per node
};

} // namespace nr
