#include "core/dedup/text_similarity.h"

#include <QCryptographicHash>
#include <QStringList>

namespace nr {

QSet<QString> titleTokens(const QString& title)
{
    QSet<QString> tokens;
    const QStringList words = normalizeTitle(title).split(QChar(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        tokens.insert(word);
    }
    return tokens;
}

double jaccardSimilarity(const QSet<QString>& a, const QSet<QString>& b)
{
    if (a.isEmpty() || b.isEmpty()) {
        return 0.0;
    }

    const QSet<QString>& smaller = a.size() <= b.size() ? a : b;
    const QSet<QString>& larger = a.size() <= b.size() ? b : a;

    int intersection = 0;
    for (const QString& token : smaller) {
        if (larger.contains(token)) {
            ++intersection;
        }
    }
    const int unionSize = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

double titleJaccard(const QString& lhs, const QString& rhs)
{
    return jaccardSimilarity(titleTokens(lhs), titleTokens(rhs));
}

QString normalizeTitle(const QString& title)
{
    return title.simplified().toCaseFolded();
}

QString titleHash(const QString& title)
{
    const QByteArray hash = QCryptographicHash::hash(
        normalizeTitle(title).toUtf8(), QCryptographicHash::Md5);
    return QString::fromLatin1(hash.toHex());
}

} // namespace nr
