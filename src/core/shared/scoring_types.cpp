#include "core/shared/scoring_types.h"

#include <algorithm>

namespace nr {

std::vector<QString> ScoreVector::diagnosticFlags() const
{
    std::vector<QString> flags;
    flags.reserve(integrity.flags.size() + credibility.flags.size());
    for (const QString& flag : integrity.flags) {
        flags.push_back(flag);
    }
    for (const QString& flag : credibility.flags) {
        if (std::find(flags.begin(), flags.end(), flag) == flags.end()) {
            flags.push_back(flag);
        }
    }
    return flags;
}

} // namespace nr
