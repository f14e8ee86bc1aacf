#pragma once

#include "core/shared/article.h"

#include <QDateTime>
#include <QString>

namespace nr::test {

// Article with a distinct URL derived from the id and a plain, clean body.
inline NormalizedArticle makeArticle(const QString& id,
                                     const QString& sourceId,
                                     const QString& title,
                                     const QString& body = {})
{
    NormalizedArticle article;
    article.id = id;
    article.sourceId = sourceId;
    article.sourceName = sourceId;
    article.title = title;
    article.body = body.isEmpty()
        ? QStringLiteral("reporters covered %1 with several details today").arg(title.toLower())
        : body;
    article.url = QStringLiteral("https://news.example.com/articles/%1").arg(id);
    return article;
}

inline QDateTime referenceNow()
{
    return QDateTime::fromString(QStringLiteral("2024-05-01T12:00:00Z"), Qt::ISODate);
}

} // namespace nr::test
