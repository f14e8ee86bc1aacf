#pragma once

#include "core/dedup/similarity_graph.h"
#include "core/scoring/source_trust.h"
#include "core/shared/article.h"
#include "core/shared/scoring_types.h"

#include <QRegularExpression>
#include <QString>

#include <vector>

namespace nr {

struct CredibilityConfig {
    double corroborationThreshold = 0.5;
    int corroborationMinTitleTokens = 3;
};

// Evidence pattern with its fixed contribution to the evidence score.
struct EvidenceRule {
    QString name;
    QRegularExpression pattern;
    double weight = 0.0;
};

// CredibilityScorer -- credibility (source trust + corroboration) and
// quality (evidence - sensationalism) over a deduplicated batch.
class CredibilityScorer {
public:
    static constexpr double kSmallCorroborationBonus = 0.05;   // 1-2 corroborating articles
    static constexpr double kLargeCorroborationBonus = 0.15;   // 3 or more
    static constexpr int kLargeCorroborationCount = 3;
    static constexpr double kLengthBonusCap = 0.2;
    static constexpr double kLengthBonusChars = 5000.0;
    static constexpr double kSensationalWordPenalty = 0.15;
    static constexpr double kSensationalWordCap = 0.5;
    static constexpr double kEmphasisPenalty = 0.1;
    static constexpr double kEmphasisCap = 0.2;

    explicit CredibilityScorer(const SourceTrustLookup& trustLookup,
                               CredibilityConfig config = {});

    // Scores every article of the batch. graphNodes[i] is the node of
    // batch[i] in graph; the graph floor must not exceed the corroboration
    // threshold, otherwise a private graph is built.
    std::vector<CredibilityAssessment> scoreBatch(const std::vector<NormalizedArticle>& batch,
                                                  const SimilarityGraph& graph,
                                                  const std::vector<int>& graphNodes) const;

    // Builds its own title graph over the batch.
    std::vector<CredibilityAssessment> scoreBatch(const std::vector<NormalizedArticle>& batch) const;

    double sourceTrustScore(const QString& sourceId, std::vector<QString>& flags) const;
    static double corroborationBonus(int corroboratingArticles);
    double evidenceScore(const QString& body) const;
    double sensationalismPenalty(const QString& title) const;

    const std::vector<EvidenceRule>& evidenceRules() const { return m_evidenceRules; }

private:
    const SourceTrustLookup& m_trustLookup;
    CredibilityConfig m_config;
    std::vector<EvidenceRule> m_evidenceRules;
};

} // namespace nr
