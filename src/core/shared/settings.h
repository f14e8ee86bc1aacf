#pragma once

#include "core/shared/scoring_types.h"

#include <QDateTime>
#include <QString>

#include <optional>
#include <vector>

namespace nr {

struct EngineSettings {
    // Deduplication
    double similarityThreshold = 0.6;           // Stage C clustering, inclusive

    // Credibility
    double corroborationThreshold = 0.5;        // independent of similarityThreshold
    int corroborationMinTitleTokens = 3;

    // Popularity
    double freshnessHalfLifeHours = 24.0;
    double viewWeight = 0.40;
    double shareWeight = 0.35;
    double commentWeight = 0.25;
    double velocityNormalization = 10000.0;     // engagement units/hour mapped to 1.0
    double velocityMinHours = 1.0;

    // Policy
    double integrityExcludeBelow = 0.5;
    double spamExcludeAbove = 0.7;
    double credibilityFlagBelow = 0.6;

    // Output
    QString presetName = QStringLiteral("quality");
    int diversityCap = 3;
    int limit = 20;
    int offset = 0;

    // 0 = std::thread::hardware_concurrency()
    int workerThreads = 0;

    // Presets added to (or overriding) the built-in table.
    std::vector<RankingPreset> customPresets;

    // Reference clock for freshness and velocity. Unset = current time at
    // the start of the run.
    std::optional<QDateTime> referenceTime;
};

} // namespace nr
