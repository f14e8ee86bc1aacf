#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

#include <optional>
#include <vector>

namespace nr {

// Built-in presets: quality, trending, credible, latest.
const std::vector<RankingPreset>& builtinPresets();

// Resolve a preset by exact name. Custom presets shadow built-ins of the same
// name. Returns nullopt for unknown names; callers must treat that as an error.
std::optional<RankingPreset> findPreset(const QString& name,
                                        const std::vector<RankingPreset>& customPresets = {});

// Returns an error message if the preset is malformed (empty name, component
// outside [0,1], or components not summing to 1.0).
std::optional<QString> validatePreset(const RankingPreset& preset);

} // namespace nr
