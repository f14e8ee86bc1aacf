#pragma once

#include "core/shared/article.h"
#include "core/shared/scoring_types.h"

#include <QDateTime>

#include <cstdint>
#include <optional>
#include <vector>

namespace nr {

struct PopularityConfig {
    double viewWeight = 0.40;
    double shareWeight = 0.35;
    double commentWeight = 0.25;
    double freshnessHalfLifeHours = 24.0;
    double unknownFreshness = 0.3;          // no engagement, no publish time
    double velocityNormalization = 10000.0;
    double velocityMinHours = 1.0;
};

// Batch maxima used to normalize engagement counters.
struct BatchMaxima {
    int64_t views = 0;
    int64_t shares = 0;
    int64_t comments = 0;
};

class PopularityScorer {
public:
    explicit PopularityScorer(PopularityConfig config = {});

    static BatchMaxima maxima(const std::vector<NormalizedArticle>& batch);

    std::vector<PopularityAssessment> scoreBatch(const std::vector<NormalizedArticle>& batch,
                                                 const QDateTime& now) const;

    PopularityAssessment score(const NormalizedArticle& article,
                               const BatchMaxima& batchMaxima,
                               const QDateTime& now) const;

    double engagementScore(const NormalizedArticle& article, const BatchMaxima& batchMaxima) const;
    double freshnessScore(const std::optional<QDateTime>& publishedAt, const QDateTime& now) const;
    double trendingVelocity(const NormalizedArticle& article, const QDateTime& now) const;

    // Hours between publishedAt and now; future timestamps count as 0.
    static double hoursSince(const QDateTime& publishedAt, const QDateTime& now);

private:
    PopularityConfig m_config;
};

} // namespace nr
