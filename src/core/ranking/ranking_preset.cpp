#include "core/ranking/ranking_preset.h"

#include <cmath>

namespace nr {

namespace {

constexpr double kPresetSumTolerance = 1e-6;

RankingPreset makePreset(const QString& name, double popularity, double relevance,
                         double quality, double credibility)
{
    RankingPreset preset;
    preset.name = name;
    preset.popularity = popularity;
    preset.relevance = relevance;
    preset.quality = quality;
    preset.credibility = credibility;
    return preset;
}

bool inUnitRange(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

const std::vector<RankingPreset>& builtinPresets()
{
    static const std::vector<RankingPreset> kPresets = {
        makePreset(QStringLiteral("quality"),  0.15, 0.30, 0.40, 0.15),
        makePreset(QStringLiteral("trending"), 0.50, 0.10, 0.20, 0.20),
        makePreset(QStringLiteral("credible"), 0.10, 0.20, 0.20, 0.50),
        makePreset(QStringLiteral("latest"),   0.10, 0.20, 0.30, 0.40),
    };
    return kPresets;
}

std::optional<RankingPreset> findPreset(const QString& name,
                                        const std::vector<RankingPreset>& customPresets)
{
    for (const RankingPreset& preset : customPresets) {
        if (preset.name == name) {
            return preset;
        }
    }
    for (const RankingPreset& preset : builtinPresets()) {
        if (preset.name == name) {
            return preset;
        }
    }
    return std::nullopt;
}

std::optional<QString> validatePreset(const RankingPreset& preset)
{
    if (preset.name.trimmed().isEmpty()) {
        return QStringLiteral("Preset name must not be empty");
    }
    if (!inUnitRange(preset.popularity) || !inUnitRange(preset.relevance)
        || !inUnitRange(preset.quality) || !inUnitRange(preset.credibility)) {
        return QStringLiteral("Preset '%1' has a weight outside [0,1]").arg(preset.name);
    }
    const double sum = preset.sum();
    if (std::abs(sum - 1.0) > kPresetSumTolerance) {
        return QStringLiteral("Preset '%1' weights sum to %2, expected 1.0")
            .arg(preset.name)
            .arg(sum, 0, 'f', 6);
    }
    return std::nullopt;
}

} // namespace nr
