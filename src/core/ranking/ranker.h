#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

#include <optional>
#include <vector>

namespace nr {

struct RankerConfig {
    int diversityCap = 3;
    int limit = 20;
    int offset = 0;
    double integrityExcludeBelow = 0.5;
    double spamExcludeAbove = 0.7;
    double credibilityFlagBelow = 0.6;
};

struct RankingOutcome {
    enum class Status {
        Ok,
        UnknownPreset,
        InvalidConfiguration,
    };

    Status status = Status::Ok;
    std::vector<RankedArticle> articles;
    std::optional<QString> errorMessage;

    int scoredCount = 0;        // input to the ranker
    int excludedCount = 0;      // removed by the policy filter
    int diversitySkipped = 0;   // dropped by the per-source cap

    bool ok() const { return status == Status::Ok; }
};

// Ranker -- combines score vectors into final_score, applies the policy
// filter, sorts deterministically and enforces the per-source diversity cap.
class Ranker {
public:
    static constexpr const char* kSuspiciousCredibilityFlag = "suspicious_credibility";

    explicit Ranker(RankerConfig config = {},
                    std::vector<RankingPreset> customPresets = {});

    RankingOutcome rank(const std::vector<ScoredArticle>& articles,
                        const QString& presetName) const;

    // 100 * weighted sum, clamped to [0,100].
    static double computeFinalScore(const ScoreVector& scores, const RankingPreset& preset);

    // Returns an error message for a negative cap, limit or offset, or a
    // threshold outside [0,1].
    static std::optional<QString> validateConfig(const RankerConfig& config);

    const RankerConfig& config() const { return m_config; }

private:
    bool passesPolicy(const ScoreVector& scores) const;

    RankerConfig m_config;
    std::vector<RankingPreset> m_customPresets;
};

} // namespace nr
