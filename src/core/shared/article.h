#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace nr {

// Normalized news record handed over by the external normalizer.
// The ranking core treats it as immutable input.
struct NormalizedArticle {
    QString id;
    QString sourceId;
    QString sourceName;
    QString title;
    QString body;
    QString url;
    QString language;
    QString category;
    std::vector<QString> tags;

    std::optional<QDateTime> publishedAt;

    std::optional<int64_t> viewCount;
    std::optional<int64_t> shareCount;
    std::optional<int64_t> commentCount;

    // True when at least one engagement counter is non-zero.
    bool hasEngagement() const
    {
        return viewCount.value_or(0) > 0
            || shareCount.value_or(0) > 0
            || commentCount.value_or(0) > 0;
    }
};

// JSON field names follow the normalizer's wire format (camelCase).
// publishedAt is ISO 8601; a value that fails to parse is treated as unknown.
NormalizedArticle articleFromJson(const QJsonObject& json);
QJsonObject articleToJson(const NormalizedArticle& article);

} // namespace nr
