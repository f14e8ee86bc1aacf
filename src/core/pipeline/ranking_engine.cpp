#include "core/pipeline/ranking_engine.h"
#include "core/integrity/integrity_assessor.h"
#include "core/ranking/ranking_preset.h"
#include "core/scoring/credibility_scorer.h"
#include "core/scoring/popularity_scorer.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QScopeGuard>

#include <algorithm>
#include <cmath>
#include <thread>

namespace nr {

namespace {

EngineResult::Status toEngineStatus(RankingOutcome::Status status)
{
    switch (status) {
    case RankingOutcome::Status::Ok:
        return EngineResult::Status::Ok;
    case RankingOutcome::Status::UnknownPreset:
        return EngineResult::Status::UnknownPreset;
    case RankingOutcome::Status::InvalidConfiguration:
        return EngineResult::Status::InvalidConfiguration;
    }
    return EngineResult::Status::InvalidConfiguration;
}

} // namespace

RankingEngine::RankingEngine(const SourceTrustLookup& trustLookup, EngineSettings settings)
    : m_trustLookup(trustLookup)
    , m_settings(std::move(settings))
{
}

QDateTime RankingEngine::referenceTime() const
{
    if (m_settings.referenceTime.has_value() && m_settings.referenceTime->isValid()) {
        return *m_settings.referenceTime;
    }
    return QDateTime::currentDateTimeUtc();
}

EngineResult RankingEngine::run(const RankingRequest& request) const
{
    EngineResult result;
    result.presetName = request.presetName.value_or(m_settings.presetName);

    // Configuration errors are reported before any processing.
    if (auto error = SettingsManager::validateSettings(m_settings)) {
        LOG_ERROR(nrCore, "invalid settings: %s", qUtf8Printable(*error));
        result.status = EngineResult::Status::InvalidConfiguration;
        result.errorMessage = error;
        return result;
    }
    if (!findPreset(result.presetName, m_settings.customPresets).has_value()) {
        LOG_ERROR(nrCore, "unknown ranking preset '%s'", qUtf8Printable(result.presetName));
        result.status = EngineResult::Status::UnknownPreset;
        result.errorMessage = QStringLiteral("unknown ranking preset: %1").arg(result.presetName);
        return result;
    }

    if (request.articles.empty()) {
        LOG_INFO(nrCore, "empty batch");
        return result;
    }

    // 1. Dedup
    DedupConfig dedupConfig;
    dedupConfig.similarityThreshold = m_settings.similarityThreshold;
    dedupConfig.graphFloor = std::min(m_settings.similarityThreshold,
                                      m_settings.corroborationThreshold);
    dedupConfig.workerThreads = m_settings.workerThreads;
    const DedupResult dedup = Deduplicator(dedupConfig).deduplicate(request.articles);

    std::vector<NormalizedArticle> representatives;
    std::vector<int> graphNodes;
    representatives.reserve(dedup.representatives.size());
    graphNodes.reserve(dedup.representatives.size());
    for (const DedupRepresentative& rep : dedup.representatives) {
        representatives.push_back(rep.article);
        graphNodes.push_back(rep.graphNode);
    }

    // 2-4. Scoring stages, concurrently
    const QDateTime now = referenceTime();

    CredibilityConfig credibilityConfig;
    credibilityConfig.corroborationThreshold = m_settings.corroborationThreshold;
    credibilityConfig.corroborationMinTitleTokens = m_settings.corroborationMinTitleTokens;
    const CredibilityScorer credibilityScorer(m_trustLookup, credibilityConfig);

    PopularityConfig popularityConfig;
    popularityConfig.viewWeight = m_settings.viewWeight;
    popularityConfig.shareWeight = m_settings.shareWeight;
    popularityConfig.commentWeight = m_settings.commentWeight;
    popularityConfig.freshnessHalfLifeHours = m_settings.freshnessHalfLifeHours;
    popularityConfig.velocityNormalization = m_settings.velocityNormalization;
    popularityConfig.velocityMinHours = m_settings.velocityMinHours;
    const PopularityScorer popularityScorer(popularityConfig);

    const IntegrityAssessor integrityAssessor;

    std::vector<IntegrityAssessment> integrity;
    std::vector<CredibilityAssessment> credibility;
    std::vector<PopularityAssessment> popularity;

    {
        std::thread integrityThread;
        std::thread credibilityThread;
        // Workers are joined on every exit from this block, including unwinding.
        const auto joinWorkers = qScopeGuard([&] {
            if (integrityThread.joinable()) {
                integrityThread.join();
            }
            if (credibilityThread.joinable()) {
                credibilityThread.join();
            }
        });

        integrityThread = std::thread([&] {
            integrity.reserve(representatives.size());
            for (const NormalizedArticle& article : representatives) {
                integrity.push_back(integrityAssessor.assess(article));
            }
        });
        credibilityThread = std::thread([&] {
            credibility = credibilityScorer.scoreBatch(representatives, dedup.graph, graphNodes);
        });
        popularity = popularityScorer.scoreBatch(representatives, now);
    }

    // Join
    std::vector<ScoredArticle> scored;
    scored.reserve(representatives.size());
    for (size_t i = 0; i < representatives.size(); ++i) {
        const DedupRepresentative& rep = dedup.representatives[i];
        ScoredArticle article;
        article.article = rep.article;
        article.arrivalIndex = rep.arrivalIndex;
        article.clusterId = rep.clusterId;
        article.clusterSize = rep.clusterSize;
        article.scores.integrity = std::move(integrity[i]);
        article.scores.credibility = std::move(credibility[i]);
        article.scores.popularity = popularity[i];
        const auto relevance = request.relevanceById.constFind(rep.article.id);
        if (relevance != request.relevanceById.constEnd()) {
            if (std::isfinite(relevance.value())) {
                article.scores.relevance = std::clamp(relevance.value(), 0.0, 1.0);
            } else {
                LOG_WARN(nrCore, "ignoring non-finite relevance for '%s'",
                         qUtf8Printable(rep.article.id));
            }
        }
        scored.push_back(std::move(article));
    }

    // 5. Rank
    RankerConfig rankerConfig;
    rankerConfig.diversityCap = m_settings.diversityCap;
    rankerConfig.limit = m_settings.limit;
    rankerConfig.offset = m_settings.offset;
    rankerConfig.integrityExcludeBelow = m_settings.integrityExcludeBelow;
    rankerConfig.spamExcludeAbove = m_settings.spamExcludeAbove;
    rankerConfig.credibilityFlagBelow = m_settings.credibilityFlagBelow;
    const Ranker ranker(rankerConfig, m_settings.customPresets);
    RankingOutcome outcome = ranker.rank(scored, result.presetName);

    result.status = toEngineStatus(outcome.status);
    result.errorMessage = outcome.errorMessage;
    result.ranked = std::move(outcome.articles);
    result.clusters = dedup.clusters;
    result.dedupStats = dedup.stats;
    result.excludedCount = outcome.excludedCount;
    result.diversitySkipped = outcome.diversitySkipped;

    LOG_INFO(nrCore, "run[%s]: %d articles -> %d representatives -> %zu ranked",
             qUtf8Printable(result.presetName), dedup.stats.inputCount,
             static_cast<int>(representatives.size()), result.ranked.size());
    return result;
}

} // namespace nr
