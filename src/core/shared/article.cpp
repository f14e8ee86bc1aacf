#include "core/shared/article.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonValue>

#include <cmath>
#include <limits>

namespace nr {

namespace {

std::optional<int64_t> optionalCounter(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double raw = value.toDouble();
    if (!std::isfinite(raw) || raw < 0.0 || std::floor(raw) != raw) {
        LOG_WARN(nrCore, "ignoring %s=%g: not a non-negative integer",
                 qUtf8Printable(key), raw);
        return std::nullopt;
    }
    // 2^63 is exactly representable; anything at or above it saturates.
    constexpr double kInt64Limit = 9223372036854775808.0;
    if (raw >= kInt64Limit) {
        LOG_WARN(nrCore, "%s=%g out of range, saturating", qUtf8Printable(key), raw);
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(raw);
}

void insertCounter(QJsonObject& json, const QString& key, const std::optional<int64_t>& value)
{
    if (value.has_value()) {
        json.insert(key, static_cast<qint64>(*value));
    }
}

} // namespace

NormalizedArticle articleFromJson(const QJsonObject& json)
{
    NormalizedArticle article;
    article.id = json.value(QStringLiteral("id")).toString();
    article.sourceId = json.value(QStringLiteral("sourceId")).toString();
    article.sourceName = json.value(QStringLiteral("sourceName")).toString(article.sourceId);
    article.title = json.value(QStringLiteral("title")).toString();
    article.body = json.value(QStringLiteral("body")).toString();
    article.url = json.value(QStringLiteral("url")).toString();
    article.language = json.value(QStringLiteral("language")).toString();
    article.category = json.value(QStringLiteral("category")).toString();

    const QJsonArray tagsArray = json.value(QStringLiteral("tags")).toArray();
    article.tags.reserve(static_cast<size_t>(tagsArray.size()));
    for (const QJsonValue& value : tagsArray) {
        article.tags.push_back(value.toString());
    }

    const QString published = json.value(QStringLiteral("publishedAt")).toString();
    if (!published.isEmpty()) {
        const QDateTime dt = QDateTime::fromString(published, Qt::ISODate);
        if (dt.isValid()) {
            article.publishedAt = dt;
        }
    }

    article.viewCount = optionalCounter(json, QStringLiteral("viewCount"));
    article.shareCount = optionalCounter(json, QStringLiteral("shareCount"));
    article.commentCount = optionalCounter(json, QStringLiteral("commentCount"));
    return article;
}

QJsonObject articleToJson(const NormalizedArticle& article)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), article.id);
    json.insert(QStringLiteral("sourceId"), article.sourceId);
    json.insert(QStringLiteral("sourceName"), article.sourceName);
    json.insert(QStringLiteral("title"), article.title);
    json.insert(QStringLiteral("body"), article.body);
    json.insert(QStringLiteral("url"), article.url);
    if (!article.language.isEmpty()) {
        json.insert(QStringLiteral("language"), article.language);
    }
    if (!article.category.isEmpty()) {
        json.insert(QStringLiteral("category"), article.category);
    }
    if (!article.tags.empty()) {
        QJsonArray tags;
        for (const QString& tag : article.tags) {
            tags.append(tag);
        }
        json.insert(QStringLiteral("tags"), tags);
    }
    if (article.publishedAt.has_value()) {
        json.insert(QStringLiteral("publishedAt"),
                    article.publishedAt->toUTC().toString(Qt::ISODate));
    }
    insertCounter(json, QStringLiteral("viewCount"), article.viewCount);
    insertCounter(json, QStringLiteral("shareCount"), article.shareCount);
    insertCounter(json, QStringLiteral("commentCount"), article.commentCount);
    return json;
}

} // namespace nr
