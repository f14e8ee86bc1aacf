#pragma once

#include "core/shared/article.h"

#include <QString>

#include <algorithm>
#include <cmath>
#include <optional>
#include <vector>

namespace nr {

// Named weight vector combining the per-dimension scores into final_score.
// Components are expected to sum to 1.0; validatePreset() enforces it.
struct RankingPreset {
    QString name;
    double popularity = 0.25;
    double relevance = 0.25;
    double quality = 0.25;
    double credibility = 0.25;

    double sum() const { return popularity + relevance + quality + credibility; }
};

// Integrity stage output (per article, no cross-article data).
struct IntegrityAssessment {
    double score = 0.0;                 // [0,1], 1.0 = fully consistent
    double titleBodyConsistency = 0.0;  // [0,1]
    double contamination = 0.0;         // [0,1], higher = more stitched content
    double spamScore = 0.0;             // [0,1], summed detector penalties (capped)
    std::vector<QString> flags;
};

// Credibility & quality stage output.
struct CredibilityAssessment {
    double credibility = 0.0;           // source trust + corroboration bonus, [0,1]
    double quality = 0.0;               // evidence - sensationalism, [0,1]
    double sourceTrust = 0.0;
    double corroborationBonus = 0.0;
    int corroborationCount = 0;
    double evidenceScore = 0.0;
    double sensationalismPenalty = 0.0;
    std::vector<QString> flags;
};

// Popularity stage output.
struct PopularityAssessment {
    double popularity = 0.0;            // [0,1]
    double trendingVelocity = 0.0;      // [0,1]
    bool fromEngagement = false;        // false = freshness fallback
};

// Joined per-article record. Built once after all three scoring stages have
// finished; each stage owns its own sub-record.
struct ScoreVector {
    IntegrityAssessment integrity;
    CredibilityAssessment credibility;
    PopularityAssessment popularity;

    // Query relevance supplied by the caller. Absent or non-finite = use quality.
    std::optional<double> relevance;

    double integrityScore() const { return integrity.score; }
    double credibilityScore() const { return credibility.credibility; }
    double qualityScore() const { return credibility.quality; }
    double popularityScore() const { return popularity.popularity; }
    double spamScore() const { return integrity.spamScore; }
    double relevanceScore() const
    {
        if (relevance.has_value() && std::isfinite(*relevance)) {
            return std::clamp(*relevance, 0.0, 1.0);
        }
        return credibility.quality;
    }

    // Integrity flags followed by credibility flags, in detection order.
    std::vector<QString> diagnosticFlags() const;
};

// A deduplicated representative with its complete score vector, ready for
// the ranker.
struct ScoredArticle {
    NormalizedArticle article;
    ScoreVector scores;
    int arrivalIndex = 0;   // position in the original input sequence
    QString clusterId;
    int clusterSize = 1;
};

// Terminal entity returned to the caller.
struct RankedArticle {
    NormalizedArticle article;
    ScoreVector scores;
    int arrivalIndex = 0;
    QString clusterId;
    int clusterSize = 1;
    double finalScore = 0.0;    // [0,100]
    int rankPosition = 0;       // 1-based
    std::vector<QString> policyFlags;
};

} // namespace nr
