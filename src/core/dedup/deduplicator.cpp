#include "core/dedup/deduplicator.h"
#include "core/dedup/text_similarity.h"
#include "core/dedup/url_normalizer.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QHash>

#include <algorithm>

namespace nr {

namespace {

// Survivor of Stage A/B with the inputs it absorbed.
struct Survivor {
    int arrivalIndex = 0;
    std::vector<int> absorbed;  // arrival indices, including itself
};

} // namespace

Deduplicator::Deduplicator(DedupConfig config)
    : m_config(config)
{
}

QString Deduplicator::clusterIdFor(const QString& representativeId)
{
    const QByteArray hash = QCryptographicHash::hash(
        representativeId.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex().left(16));
}

DedupResult Deduplicator::deduplicate(const std::vector<NormalizedArticle>& articles) const
{
    DedupResult result;
    result.stats.inputCount = static_cast<int>(articles.size());
    if (articles.empty()) {
        return result;
    }

    // ── Stage A: URL identity ───────────────────────────────────
    std::vector<Survivor> afterUrl;
    afterUrl.reserve(articles.size());
    QHash<QString, size_t> survivorByUrl;
    for (size_t i = 0; i < articles.size(); ++i) {
        const QString normalizedUrl = UrlNormalizer::normalize(articles[i].url);
        if (!normalizedUrl.isEmpty()) {
            const auto it = survivorByUrl.constFind(normalizedUrl);
            if (it != survivorByUrl.constEnd()) {
                afterUrl[it.value()].absorbed.push_back(static_cast<int>(i));
                LOG_DEBUG(nrDedup, "url duplicate: '%s' absorbed by '%s'",
                          qUtf8Printable(articles[i].id),
                          qUtf8Printable(articles[static_cast<size_t>(
                              afterUrl[it.value()].arrivalIndex)].id));
                continue;
            }
            survivorByUrl.insert(normalizedUrl, afterUrl.size());
        }
        // Articles without a usable URL cannot collide in this stage.
        Survivor survivor;
        survivor.arrivalIndex = static_cast<int>(i);
        survivor.absorbed.push_back(static_cast<int>(i));
        afterUrl.push_back(std::move(survivor));
    }
    result.stats.afterUrl = static_cast<int>(afterUrl.size());

    // ── Stage B: title identity ─────────────────────────────────
    std::vector<Survivor> afterTitle;
    afterTitle.reserve(afterUrl.size());
    QHash<QString, size_t> survivorByTitle;
    for (Survivor& candidate : afterUrl) {
        const NormalizedArticle& article = articles[static_cast<size_t>(candidate.arrivalIndex)];
        if (!normalizeTitle(article.title).isEmpty()) {
            const QString hash = titleHash(article.title);
            const auto it = survivorByTitle.constFind(hash);
            if (it != survivorByTitle.constEnd()) {
                Survivor& keeper = afterTitle[it.value()];
                keeper.absorbed.insert(keeper.absorbed.end(),
                                       candidate.absorbed.begin(), candidate.absorbed.end());
                continue;
            }
            survivorByTitle.insert(hash, afterTitle.size());
        }
        afterTitle.push_back(std::move(candidate));
    }
    result.stats.afterTitle = static_cast<int>(afterTitle.size());

    // ── Stage C: lexical clustering ─────────────────────────────
    std::vector<QSet<QString>> tokenSets;
    tokenSets.reserve(afterTitle.size());
    for (const Survivor& survivor : afterTitle) {
        tokenSets.push_back(titleTokens(articles[static_cast<size_t>(survivor.arrivalIndex)].title));
    }

    const double floor = std::min(m_config.graphFloor, m_config.similarityThreshold);
    result.graph = SimilarityGraph::build(tokenSets, floor, m_config.workerThreads);

    const std::vector<std::vector<int>> components =
        result.graph.connectedComponents(m_config.similarityThreshold);

    result.representatives.reserve(components.size());
    result.clusters.reserve(components.size());
    for (const std::vector<int>& component : components) {
        // Components are ascending in node index, which is ascending in
        // arrival order, so the first strictly-longer body wins ties.
        int bestNode = component.front();
        for (int node : component) {
            const auto& best = articles[static_cast<size_t>(afterTitle[static_cast<size_t>(bestNode)].arrivalIndex)];
            const auto& candidate = articles[static_cast<size_t>(afterTitle[static_cast<size_t>(node)].arrivalIndex)];
            if (candidate.body.size() > best.body.size()) {
                bestNode = node;
            }
        }

        std::vector<int> members;
        for (int node : component) {
            const Survivor& survivor = afterTitle[static_cast<size_t>(node)];
            members.insert(members.end(), survivor.absorbed.begin(), survivor.absorbed.end());
        }
        std::sort(members.begin(), members.end());

        const Survivor& bestSurvivor = afterTitle[static_cast<size_t>(bestNode)];
        const NormalizedArticle& representative =
            articles[static_cast<size_t>(bestSurvivor.arrivalIndex)];

        DedupCluster cluster;
        cluster.representativeId = representative.id;
        cluster.clusterId = clusterIdFor(representative.id);
        cluster.memberIds.reserve(members.size());
        for (int index : members) {
            cluster.memberIds.push_back(articles[static_cast<size_t>(index)].id);
        }

        DedupRepresentative entry;
        entry.article = representative;
        entry.arrivalIndex = bestSurvivor.arrivalIndex;
        entry.clusterId = cluster.clusterId;
        entry.clusterSize = cluster.size();
        entry.graphNode = bestNode;

        if (cluster.size() > 1) {
            LOG_DEBUG(nrDedup, "cluster %s: %d articles, representative '%s'",
                      qUtf8Printable(cluster.clusterId), cluster.size(),
                      qUtf8Printable(representative.title.left(50)));
        }

        result.representatives.push_back(std::move(entry));
        result.clusters.push_back(std::move(cluster));
    }
    result.stats.clusterCount = static_cast<int>(result.clusters.size());

    LOG_INFO(nrDedup, "dedup: %d -> url(%d) -> title(%d) -> clusters(%d)",
             result.stats.inputCount, result.stats.afterUrl,
             result.stats.afterTitle, result.stats.clusterCount);
    return result;
}

} // namespace nr
