#include "core/scoring/popularity_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace nr {

namespace {

double ratio(int64_t value, int64_t maximum)
{
    if (maximum <= 0) {
        return 0.0;
    }
    return static_cast<double>(value) / static_cast<double>(maximum);
}

} // namespace

PopularityScorer::PopularityScorer(PopularityConfig config)
    : m_config(config)
{
}

BatchMaxima PopularityScorer::maxima(const std::vector<NormalizedArticle>& batch)
{
    BatchMaxima result;
    for (const NormalizedArticle& article : batch) {
        result.views = std::max(result.views, article.viewCount.value_or(0));
        result.shares = std::max(result.shares, article.shareCount.value_or(0));
        result.comments = std::max(result.comments, article.commentCount.value_or(0));
    }
    return result;
}

std::vector<PopularityAssessment> PopularityScorer::scoreBatch(
    const std::vector<NormalizedArticle>& batch, const QDateTime& now) const
{
    const BatchMaxima batchMaxima = maxima(batch);
    LOG_DEBUG(nrScoring, "popularity maxima: views=%lld shares=%lld comments=%lld",
              static_cast<long long>(batchMaxima.views),
              static_cast<long long>(batchMaxima.shares),
              static_cast<long long>(batchMaxima.comments));

    std::vector<PopularityAssessment> assessments;
    assessments.reserve(batch.size());
    for (const NormalizedArticle& article : batch) {
        assessments.push_back(score(article, batchMaxima, now));
    }
    return assessments;
}

PopularityAssessment PopularityScorer::score(const NormalizedArticle& article,
                                             const BatchMaxima& batchMaxima,
                                             const QDateTime& now) const
{
    PopularityAssessment assessment;
    if (article.hasEngagement()) {
        assessment.popularity = engagementScore(article, batchMaxima);
        assessment.fromEngagement = true;
    } else {
        assessment.popularity = freshnessScore(article.publishedAt, now);
    }
    assessment.popularity = std::clamp(assessment.popularity, 0.0, 1.0);
    assessment.trendingVelocity = trendingVelocity(article, now);
    return assessment;
}

double PopularityScorer::engagementScore(const NormalizedArticle& article,
                                         const BatchMaxima& batchMaxima) const
{
    return m_config.viewWeight * ratio(article.viewCount.value_or(0), batchMaxima.views)
         + m_config.shareWeight * ratio(article.shareCount.value_or(0), batchMaxima.shares)
         + m_config.commentWeight * ratio(article.commentCount.value_or(0), batchMaxima.comments);
}

double PopularityScorer::freshnessScore(const std::optional<QDateTime>& publishedAt,
                                        const QDateTime& now) const
{
    if (!publishedAt.has_value() || !publishedAt->isValid()) {
        return m_config.unknownFreshness;
    }
    const double hours = hoursSince(*publishedAt, now);
    return std::pow(0.5, hours / m_config.freshnessHalfLifeHours);
}

double PopularityScorer::trendingVelocity(const NormalizedArticle& article,
                                          const QDateTime& now) const
{
    if (!article.publishedAt.has_value() || !article.publishedAt->isValid()) {
        return 0.0;
    }
    const double units = static_cast<double>(article.viewCount.value_or(0))
                       + 3.0 * static_cast<double>(article.shareCount.value_or(0))
                       + 2.0 * static_cast<double>(article.commentCount.value_or(0));
    const double hours = std::max(hoursSince(*article.publishedAt, now), m_config.velocityMinHours);
    return std::clamp(units / hours / m_config.velocityNormalization, 0.0, 1.0);
}

double PopularityScorer::hoursSince(const QDateTime& publishedAt, const QDateTime& now)
{
    const qint64 seconds = publishedAt.secsTo(now);
    if (seconds <= 0) {
        return 0.0;
    }
    return static_cast<double>(seconds) / 3600.0;
}

} // namespace nr
