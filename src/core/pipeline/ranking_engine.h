#pragma once

#include "core/dedup/deduplicator.h"
#include "core/ranking/ranker.h"
#include "core/scoring/source_trust.h"
#include "core/shared/article.h"
#include "core/shared/scoring_types.h"
#include "core/shared/settings.h"

#include <QDateTime>
#include <QHash>
#include <QString>

#include <optional>
#include <vector>

namespace nr {

struct RankingRequest {
    std::vector<NormalizedArticle> articles;    // arrival order

    // Overrides EngineSettings::presetName when set.
    std::optional<QString> presetName;

    // Caller-supplied query relevance per article id, in [0,1]. Articles
    // without an entry use their quality score.
    QHash<QString, double> relevanceById;
};

struct EngineResult {
    enum class Status {
        Ok,
        UnknownPreset,
        InvalidConfiguration,
    };

    Status status = Status::Ok;
    std::optional<QString> errorMessage;

    QString presetName;
    std::vector<RankedArticle> ranked;
    std::vector<DedupCluster> clusters;
    DedupStats dedupStats;
    int excludedCount = 0;
    int diversitySkipped = 0;

    bool ok() const { return status == Status::Ok; }
};

// RankingEngine -- runs one batch through the full pipeline:
//
//   dedup -> {integrity, credibility/quality, popularity} -> ranker
//
// The three scoring stages run concurrently over the representatives, each
// writing its own result vector; the join into ScoreVectors happens after
// all of them finish. The engine holds no state between runs.
class RankingEngine {
public:
    RankingEngine(const SourceTrustLookup& trustLookup, EngineSettings settings);

    EngineResult run(const RankingRequest& request) const;

    const EngineSettings& settings() const { return m_settings; }

private:
    QDateTime referenceTime() const;

    const SourceTrustLookup& m_trustLookup;
    EngineSettings m_settings;
};

} // namespace nr
