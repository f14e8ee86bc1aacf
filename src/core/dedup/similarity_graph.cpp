#include "core/dedup/similarity_graph.h"
#include "core/dedup/text_similarity.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <numeric>
#include <thread>

namespace nr {

namespace {

// Below this many nodes the pair count is too small to pay for threads.
constexpr int kParallelNodeThreshold = 64;

void evaluateRows(const std::vector<QSet<QString>>& tokenSets, double floor,
                  int firstRow, int stride, std::vector<SimilarityEdge>& out)
{
    const int n = static_cast<int>(tokenSets.size());
    for (int i = firstRow; i < n; i += stride) {
        for (int j = i + 1; j < n; ++j) {
            const double similarity = jaccardSimilarity(tokenSets[static_cast<size_t>(i)],
                                                        tokenSets[static_cast<size_t>(j)]);
            if (similarity >= floor && similarity > 0.0) {
                out.push_back({i, j, similarity});
            }
        }
    }
}

int findRoot(std::vector<int>& parent, int node)
{
    while (parent[static_cast<size_t>(node)] != node) {
        parent[static_cast<size_t>(node)] =
            parent[static_cast<size_t>(parent[static_cast<size_t>(node)])];
        node = parent[static_cast<size_t>(node)];
    }
    return node;
}

} // namespace

int SimilarityGraph::effectiveWorkerCount(int requested, int nodeCount)
{
    if (nodeCount < kParallelNodeThreshold) {
        return 1;
    }
    int workers = requested;
    if (workers <= 0) {
        const unsigned hw = std::thread::hardware_concurrency();
        workers = hw == 0 ? 2 : static_cast<int>(hw);
    }
    return std::clamp(workers, 1, nodeCount);
}

SimilarityGraph SimilarityGraph::build(const std::vector<QSet<QString>>& tokenSets,
                                       double floor,
                                       int workerThreads)
{
    SimilarityGraph graph;
    graph.m_nodeCount = static_cast<int>(tokenSets.size());
    graph.m_floor = floor;
    graph.m_adjacency.resize(tokenSets.size());

    const int workers = effectiveWorkerCount(workerThreads, graph.m_nodeCount);
    if (workers <= 1) {
        evaluateRows(tokenSets, floor, 0, 1, graph.m_edges);
    } else {
        // Rows are dealt round-robin so early (long) rows spread across workers.
        std::vector<std::vector<SimilarityEdge>> partial(static_cast<size_t>(workers));
        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            threads.emplace_back([&tokenSets, floor, w, workers, &partial] {
                evaluateRows(tokenSets, floor, w, workers, partial[static_cast<size_t>(w)]);
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        for (auto& edges : partial) {
            graph.m_edges.insert(graph.m_edges.end(), edges.begin(), edges.end());
        }
    }

    std::sort(graph.m_edges.begin(), graph.m_edges.end(),
              [](const SimilarityEdge& a, const SimilarityEdge& b) {
                  if (a.lhs != b.lhs) {
                      return a.lhs < b.lhs;
                  }
                  return a.rhs < b.rhs;
              });

    for (size_t e = 0; e < graph.m_edges.size(); ++e) {
        graph.m_adjacency[static_cast<size_t>(graph.m_edges[e].lhs)].push_back(e);
        graph.m_adjacency[static_cast<size_t>(graph.m_edges[e].rhs)].push_back(e);
    }

    LOG_DEBUG(nrDedup, "similarity graph: nodes=%d edges=%zu floor=%.2f workers=%d",
              graph.m_nodeCount, graph.m_edges.size(), floor, workers);
    return graph;
}

std::vector<int> SimilarityGraph::neighbors(int node, double threshold) const
{
    std::vector<int> result;
    if (node < 0 || node >= m_nodeCount) {
        return result;
    }
    for (size_t edgeIndex : m_adjacency[static_cast<size_t>(node)]) {
        const SimilarityEdge& edge = m_edges[edgeIndex];
        if (edge.similarity < threshold) {
            continue;
        }
        result.push_back(edge.lhs == node ? edge.rhs : edge.lhs);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::vector<int>> SimilarityGraph::connectedComponents(double threshold) const
{
    std::vector<int> parent(static_cast<size_t>(m_nodeCount));
    std::iota(parent.begin(), parent.end(), 0);

    for (const SimilarityEdge& edge : m_edges) {
        if (edge.similarity < threshold) {
            continue;
        }
        const int a = findRoot(parent, edge.lhs);
        const int b = findRoot(parent, edge.rhs);
        if (a != b) {
            // Smaller index becomes root so roots are stable.
            parent[static_cast<size_t>(std::max(a, b))] = std::min(a, b);
        }
    }

    std::vector<std::vector<int>> components;
    std::vector<int> componentOfRoot(static_cast<size_t>(m_nodeCount), -1);
    for (int node = 0; node < m_nodeCount; ++node) {
        const int root = findRoot(parent, node);
        int& slot = componentOfRoot[static_cast<size_t>(root)];
        if (slot < 0) {
            slot = static_cast<int>(components.size());
            components.emplace_back();
        }
        components[static_cast<size_t>(slot)].push_back(node);
    }
    return components;
}

} // namespace nr
