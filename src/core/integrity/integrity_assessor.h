#pragma once

#include "core/shared/article.h"
#include "core/shared/scoring_types.h"

#include <QString>
#include <QStringList>

#include <functional>
#include <vector>

namespace nr {

// Text views shared by every spam detector for one article.
struct ArticleText {
    QString title;
    QString body;
    QString combinedLower;      // body + " " + title, lower-cased
};

// One row of the spam/ad detector table. Each triggered detector adds its
// penalty independently; the sum is capped at 1.0.
struct SpamDetector {
    QString flag;
    double penalty = 0.0;
    std::function<bool(const ArticleText&)> triggered;
};

// IntegrityAssessor -- per-article consistency and spam assessment.
//
//   integrity = 0.40 * consistency + 0.30 * (1 - contamination) + 0.30 * (1 - spam)
//
// Articles with an empty title or body get the worst case for every
// sub-score (integrity 0.0) and an empty_title / empty_body flag.
class IntegrityAssessor {
public:
    static constexpr double kConsistencyWeight = 0.40;
    static constexpr double kContaminationWeight = 0.30;
    static constexpr double kSpamWeight = 0.30;

    IntegrityAssessor();

    IntegrityAssessment assess(const NormalizedArticle& article) const;

    // Sub-checks, exposed for tests.
    double titleBodyConsistency(const QString& title, const QString& body) const;
    double contamination(const QString& body, std::vector<QString>& flags) const;
    double spamScore(const QString& title, const QString& body, std::vector<QString>& flags) const;

    const std::vector<SpamDetector>& detectors() const { return m_detectors; }

    // Salient title terms: capitalised Latin words, Hangul runs of two or
    // more syllables and quoted phrases. Deduplicated, first-seen order.
    static QStringList salientTerms(const QString& title);

    static bool hasRepetitiveSentences(const QString& body);
    static double vocabularyDensity(const QString& lowerText);

private:
    std::vector<SpamDetector> m_detectors;
};

} // namespace nr
