#pragma once

#include <QSet>
#include <QString>

namespace nr {

// Case-folded, whitespace-delimited token set of a title.
QSet<QString> titleTokens(const QString& title);

// |A ∩ B| / |A ∪ B|. Returns 0.0 when either set is empty.
double jaccardSimilarity(const QSet<QString>& a, const QSet<QString>& b);

// Convenience overload tokenizing both titles.
double titleJaccard(const QString& lhs, const QString& rhs);

// Trimmed, whitespace-collapsed, case-folded title used for identity checks.
QString normalizeTitle(const QString& title);

// Hex MD5 of normalizeTitle(title).
QString titleHash(const QString& title);

} // namespace nr
