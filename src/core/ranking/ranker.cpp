#include "core/ranking/ranker.h"
#include "core/ranking/ranking_preset.h"
#include "core/shared/logging.h"

#include <QHash>

#include <algorithm>

namespace nr {

namespace {

bool inUnitRange(double value)
{
    return value >= 0.0 && value <= 1.0;
}

// Counts by source id, or by display name when the whole list shares one
// source id (aggregator feeds).
bool useSourceNameForDiversity(const std::vector<RankedArticle>& articles)
{
    if (articles.size() < 2) {
        return false;
    }
    const QString& first = articles.front().article.sourceId;
    return std::all_of(articles.begin(), articles.end(), [&first](const RankedArticle& a) {
        return a.article.sourceId == first;
    });
}

} // namespace

Ranker::Ranker(RankerConfig config, std::vector<RankingPreset> customPresets)
    : m_config(config)
    , m_customPresets(std::move(customPresets))
{
}

std::optional<QString> Ranker::validateConfig(const RankerConfig& config)
{
    if (config.diversityCap < 0) {
        return QStringLiteral("diversity cap must not be negative (got %1)").arg(config.diversityCap);
    }
    if (config.limit < 0) {
        return QStringLiteral("limit must not be negative (got %1)").arg(config.limit);
    }
    if (config.offset < 0) {
        return QStringLiteral("offset must not be negative (got %1)").arg(config.offset);
    }
    if (!inUnitRange(config.integrityExcludeBelow)
        || !inUnitRange(config.spamExcludeAbove)
        || !inUnitRange(config.credibilityFlagBelow)) {
        return QStringLiteral("policy thresholds must lie in [0,1]");
    }
    return std::nullopt;
}

double Ranker::computeFinalScore(const ScoreVector& scores, const RankingPreset& preset)
{
    const double combined = scores.popularityScore() * preset.popularity
                          + scores.relevanceScore() * preset.relevance
                          + scores.qualityScore() * preset.quality
                          + scores.credibilityScore() * preset.credibility;
    return std::clamp(100.0 * combined, 0.0, 100.0);
}

bool Ranker::passesPolicy(const ScoreVector& scores) const
{
    return scores.integrityScore() >= m_config.integrityExcludeBelow
        && scores.spamScore() <= m_config.spamExcludeAbove;
}

RankingOutcome Ranker::rank(const std::vector<ScoredArticle>& articles,
                            const QString& presetName) const
{
    RankingOutcome outcome;
    outcome.scoredCount = static_cast<int>(articles.size());

    if (auto error = validateConfig(m_config)) {
        LOG_ERROR(nrRanking, "invalid ranker configuration: %s", qUtf8Printable(*error));
        outcome.status = RankingOutcome::Status::InvalidConfiguration;
        outcome.errorMessage = error;
        return outcome;
    }

    const std::optional<RankingPreset> preset = findPreset(presetName, m_customPresets);
    if (!preset.has_value()) {
        LOG_ERROR(nrRanking, "unknown ranking preset '%s'", qUtf8Printable(presetName));
        outcome.status = RankingOutcome::Status::UnknownPreset;
        outcome.errorMessage = QStringLiteral("unknown ranking preset: %1").arg(presetName);
        return outcome;
    }

    // 1. Score + policy filter
    std::vector<RankedArticle> eligible;
    eligible.reserve(articles.size());
    for (const ScoredArticle& scored : articles) {
        if (!passesPolicy(scored.scores)) {
            LOG_DEBUG(nrRanking, "policy exclude: id=%s integrity=%.3f spam=%.3f",
                      qUtf8Printable(scored.article.id),
                      scored.scores.integrityScore(), scored.scores.spamScore());
            ++outcome.excludedCount;
            continue;
        }

        RankedArticle ranked;
        ranked.article = scored.article;
        ranked.scores = scored.scores;
        ranked.arrivalIndex = scored.arrivalIndex;
        ranked.clusterId = scored.clusterId;
        ranked.clusterSize = scored.clusterSize;
        ranked.finalScore = computeFinalScore(scored.scores, *preset);
        if (scored.scores.credibilityScore() < m_config.credibilityFlagBelow) {
            ranked.policyFlags.push_back(QString::fromLatin1(kSuspiciousCredibilityFlag));
        }
        eligible.push_back(std::move(ranked));
    }

    // 2. Sort: finalScore DESC, credibility DESC, arrival ASC
    std::stable_sort(eligible.begin(), eligible.end(),
                     [](const RankedArticle& a, const RankedArticle& b) {
                         if (a.finalScore != b.finalScore) {
                             return a.finalScore > b.finalScore;
                         }
                         const double ca = a.scores.credibilityScore();
                         const double cb = b.scores.credibilityScore();
                         if (ca != cb) {
                             return ca > cb;
                         }
                         return a.arrivalIndex < b.arrivalIndex;
                     });

    // 3. Single-pass diversity cap
    const bool byName = useSourceNameForDiversity(eligible);
    QHash<QString, int> perSource;
    std::vector<RankedArticle> diverse;
    diverse.reserve(eligible.size());
    for (RankedArticle& ranked : eligible) {
        const QString key = byName ? ranked.article.sourceName : ranked.article.sourceId;
        int& count = perSource[key];
        if (count >= m_config.diversityCap) {
            LOG_DEBUG(nrRanking, "diversity skip: id=%s source=%s",
                      qUtf8Printable(ranked.article.id), qUtf8Printable(key));
            ++outcome.diversitySkipped;
            continue;
        }
        ++count;
        diverse.push_back(std::move(ranked));
    }

    // 4. Offset + limit
    const size_t begin = std::min(diverse.size(), static_cast<size_t>(m_config.offset));
    const size_t end = std::min(diverse.size(), begin + static_cast<size_t>(m_config.limit));
    outcome.articles.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        RankedArticle& ranked = diverse[i];
        ranked.rankPosition = static_cast<int>(i) + 1;
        outcome.articles.push_back(std::move(ranked));
    }

    LOG_INFO(nrRanking, "rank[%s]: scored=%d excluded=%d diversitySkipped=%d -> %zu",
             qUtf8Printable(preset->name), outcome.scoredCount, outcome.excludedCount,
             outcome.diversitySkipped, outcome.articles.size());
    return outcome;
}

} // namespace nr
