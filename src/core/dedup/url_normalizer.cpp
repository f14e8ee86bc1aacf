#include "core/dedup/url_normalizer.h"

#include <QUrl>

namespace nr {

QString UrlNormalizer::normalize(const QString& rawUrl)
{
    const QString trimmed = rawUrl.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    QUrl url(trimmed, QUrl::TolerantMode);
    if (!url.isValid()) {
        return {};
    }

    url.setFragment(QString());
    url.setQuery(QString());
    url.setScheme(url.scheme().toLower());
    url.setHost(url.host().toLower());

    QString path = url.path();
    while (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path);

    QString normalized = url.toString(QUrl::FullyEncoded);
    while (normalized.endsWith(QLatin1Char('/'))) {
        normalized.chop(1);
    }
    return normalized;
}

} // namespace nr
