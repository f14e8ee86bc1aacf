#include "core/integrity/integrity_assessor.h"
#include "core/shared/logging.h"

#include <QRegularExpression>
#include <QSet>

#include <algorithm>

namespace nr {

namespace {

constexpr int kConsistencyParagraphs = 5;
constexpr int kContaminationParagraphs = 10;
constexpr double kLowPairSimilarity = 0.2;
constexpr double kUnrelatedAverage = 0.3;
constexpr double kRepeatedSentenceRatio = 0.3;
constexpr double kDensityFloor = 0.4;

const QStringList& adKeywords()
{
    static const QStringList kKeywords = {
        QStringLiteral("클릭"),        QStringLiteral("지금구매"),
        QStringLiteral("할인"),        QStringLiteral("특가"),
        QStringLiteral("무료배송"),    QStringLiteral("광고"),
        QStringLiteral("sponsored"),   QStringLiteral("click here"),
        QStringLiteral("buy now"),     QStringLiteral("limited offer"),
        QStringLiteral("free shipping"), QStringLiteral("promoted"),
    };
    return kKeywords;
}

const QStringList& illegalKeywords()
{
    static const QStringList kKeywords = {
        QStringLiteral("도박"),     QStringLiteral("카지노"),
        QStringLiteral("성인"),     QStringLiteral("음란"),
        QStringLiteral("gambling"), QStringLiteral("casino"),
    };
    return kKeywords;
}

const std::vector<QRegularExpression>& sensationalTitlePatterns()
{
    static const std::vector<QRegularExpression> kPatterns = {
        QRegularExpression(QStringLiteral("\\[충격\\]")),
        QRegularExpression(QStringLiteral("\\[경악\\]")),
        QRegularExpression(QStringLiteral("놀라운\\s(발표|비밀|진실)")),
        QRegularExpression(QStringLiteral("\\d+번\\s(이것|저것)")),
        QRegularExpression(QStringLiteral("이\\s사실일\\s리\\s없다")),
        QRegularExpression(QStringLiteral("you won'?t believe"),
                           QRegularExpression::CaseInsensitiveOption),
        QRegularExpression(QStringLiteral("\\[(shocking|breaking)\\]"),
                           QRegularExpression::CaseInsensitiveOption),
    };
    return kPatterns;
}

const QSet<QString>& functionWords()
{
    static const QSet<QString> kWords = {
        QStringLiteral("의"),   QStringLiteral("이"),     QStringLiteral("가"),
        QStringLiteral("을"),   QStringLiteral("를"),     QStringLiteral("에"),
        QStringLiteral("에서"), QStringLiteral("로"),     QStringLiteral("과"),
        QStringLiteral("그리고"), QStringLiteral("또는"), QStringLiteral("있다"),
        QStringLiteral("하다"), QStringLiteral("되다"),
    };
    return kWords;
}

const QSet<QString>& paragraphStopwords()
{
    static const QSet<QString> kWords = {
        QStringLiteral("의"),   QStringLiteral("이"),   QStringLiteral("그"),
        QStringLiteral("저"),   QStringLiteral("것"),   QStringLiteral("수"),
        QStringLiteral("등"),   QStringLiteral("같은"), QStringLiteral("있다"),
        QStringLiteral("하다"), QStringLiteral("and"),  QStringLiteral("the"),
        QStringLiteral("is"),
    };
    return kWords;
}

bool containsAny(const QString& haystack, const QStringList& needles)
{
    for (const QString& needle : needles) {
        if (haystack.contains(needle)) {
            return true;
        }
    }
    return false;
}

QStringList nonEmptyParagraphs(const QString& body, int maxCount)
{
    QStringList paragraphs;
    const QStringList lines = body.split(QLatin1Char('\n'));
    for (const QString& line : lines) {
        const QString trimmed = line.trimmed();
        if (trimmed.isEmpty()) {
            continue;
        }
        paragraphs.append(trimmed);
        if (paragraphs.size() >= maxCount) {
            break;
        }
    }
    return paragraphs;
}

QSet<QString> paragraphKeywords(const QString& paragraph)
{
    QSet<QString> keywords;
    const QStringList words = paragraph.toLower().simplified().split(QChar(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (word.size() > 2 && !paragraphStopwords().contains(word)) {
            keywords.insert(word);
        }
    }
    return keywords;
}

} // namespace

IntegrityAssessor::IntegrityAssessor()
{
    m_detectors = {
        {QStringLiteral("repetitive_content"), 0.3,
         [](const ArticleText& text) { return hasRepetitiveSentences(text.body); }},
        {QStringLiteral("ad_content"), 0.3,
         [](const ArticleText& text) { return containsAny(text.combinedLower, adKeywords()); }},
        {QStringLiteral("illegal_content"), 0.5,
         [](const ArticleText& text) { return containsAny(text.combinedLower, illegalKeywords()); }},
        {QStringLiteral("low_content_quality"), 0.2,
         [](const ArticleText& text) { return vocabularyDensity(text.combinedLower) < kDensityFloor; }},
        {QStringLiteral("sensational_title"), 0.1,
         [](const ArticleText& text) {
             for (const QRegularExpression& pattern : sensationalTitlePatterns()) {
                 if (pattern.match(text.title).hasMatch()) {
                     return true;
                 }
             }
             return false;
         }},
    };
}

IntegrityAssessment IntegrityAssessor::assess(const NormalizedArticle& article) const
{
    IntegrityAssessment assessment;

    const bool emptyTitle = article.title.trimmed().isEmpty();
    const bool emptyBody = article.body.trimmed().isEmpty();
    if (emptyTitle) {
        assessment.flags.push_back(QStringLiteral("empty_title"));
    }
    if (emptyBody) {
        assessment.flags.push_back(QStringLiteral("empty_body"));
    }
    if (article.url.trimmed().isEmpty()) {
        assessment.flags.push_back(QStringLiteral("missing_url"));
    }

    if (emptyTitle || emptyBody) {
        assessment.titleBodyConsistency = 0.0;
        assessment.contamination = 1.0;
        assessment.spamScore = 1.0;
        assessment.score = 0.0;
        LOG_WARN(nrIntegrity, "article '%s' has an empty %s; worst-case integrity",
                 qUtf8Printable(article.id), emptyTitle ? "title" : "body");
        return assessment;
    }

    assessment.titleBodyConsistency = titleBodyConsistency(article.title, article.body);
    assessment.contamination = contamination(article.body, assessment.flags);
    assessment.spamScore = spamScore(article.title, article.body, assessment.flags);

    const double score = kConsistencyWeight * assessment.titleBodyConsistency
                         + kContaminationWeight * (1.0 - assessment.contamination)
                         + kSpamWeight * (1.0 - assessment.spamScore);
    assessment.score = std::clamp(score, 0.0, 1.0);

    LOG_DEBUG(nrIntegrity, "integrity: id=%s consistency=%.3f contamination=%.3f spam=%.3f -> %.3f",
              qUtf8Printable(article.id), assessment.titleBodyConsistency,
              assessment.contamination, assessment.spamScore, assessment.score);
    return assessment;
}

double IntegrityAssessor::titleBodyConsistency(const QString& title, const QString& body) const
{
    if (title.trimmed().isEmpty() || body.trimmed().isEmpty()) {
        return 0.0;
    }

    const QStringList terms = salientTerms(title);
    if (terms.isEmpty()) {
        return 1.0;
    }

    const QString bodyLower = body.toLower();
    int covered = 0;
    for (const QString& term : terms) {
        if (bodyLower.contains(term.toLower())) {
            ++covered;
        }
    }
    const double coverage = static_cast<double>(covered) / static_cast<double>(terms.size());

    // Dispersion: title words concentrated in one paragraph count for less.
    QSet<QString> titleWords;
    const QStringList words = title.toLower().simplified().split(QChar(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (word.size() > 2) {
            titleWords.insert(word);
        }
    }
    const QStringList paragraphs = nonEmptyParagraphs(body, kConsistencyParagraphs);
    if (paragraphs.isEmpty() || titleWords.isEmpty()) {
        return coverage;
    }

    int total = 0;
    int maxInParagraph = 0;
    for (const QString& paragraph : paragraphs) {
        const QString paragraphLower = paragraph.toLower();
        int count = 0;
        for (const QString& word : titleWords) {
            if (paragraphLower.contains(word)) {
                ++count;
            }
        }
        total += count;
        maxInParagraph = std::max(maxInParagraph, count);
    }

    if (total == 0) {
        return coverage * 0.5;
    }

    const double maxConcentration = static_cast<double>(maxInParagraph) / static_cast<double>(total);
    return std::min(1.0, coverage * (1.0 - maxConcentration * 0.2));
}

double IntegrityAssessor::contamination(const QString& body, std::vector<QString>& flags) const
{
    const QStringList paragraphs = nonEmptyParagraphs(body, kContaminationParagraphs);
    if (paragraphs.size() < 2) {
        return 0.0;
    }

    std::vector<QSet<QString>> keywords;
    keywords.reserve(static_cast<size_t>(paragraphs.size()));
    for (const QString& paragraph : paragraphs) {
        keywords.push_back(paragraphKeywords(paragraph));
    }

    std::vector<double> similarities;
    for (size_t i = 0; i + 1 < keywords.size(); ++i) {
        const QSet<QString>& a = keywords[i];
        const QSet<QString>& b = keywords[i + 1];
        const int unionSize = static_cast<int>((a + b).size());
        if (unionSize == 0) {
            continue;
        }
        const int intersection = static_cast<int>((a & b).size());
        similarities.push_back(static_cast<double>(intersection) / static_cast<double>(unionSize));
    }

    if (similarities.empty()) {
        return 0.0;
    }

    double sum = 0.0;
    int lowCount = 0;
    for (double similarity : similarities) {
        sum += similarity;
        if (similarity < kLowPairSimilarity) {
            ++lowCount;
        }
    }
    const double average = sum / static_cast<double>(similarities.size());

    double score = 0.0;
    if (average < kUnrelatedAverage) {
        score = 0.7;
        flags.push_back(QStringLiteral("unrelated_topics"));
    } else if (lowCount * 2 > static_cast<int>(similarities.size())) {
        score = 0.5;
        flags.push_back(QStringLiteral("inconsistent_topics"));
    }
    return std::min(1.0, score);
}

double IntegrityAssessor::spamScore(const QString& title, const QString& body,
                                    std::vector<QString>& flags) const
{
    ArticleText text;
    text.title = title;
    text.body = body;
    text.combinedLower = (body + QLatin1Char(' ') + title).toLower();

    double score = 0.0;
    for (const SpamDetector& detector : m_detectors) {
        if (detector.triggered(text)) {
            score += detector.penalty;
            flags.push_back(detector.flag);
        }
    }
    return std::min(1.0, score);
}

QStringList IntegrityAssessor::salientTerms(const QString& title)
{
    static const QRegularExpression kLatinProperNoun(QStringLiteral("\\b[A-Z][a-zA-Z]+\\b"));
    static const QRegularExpression kHangulRun(QStringLiteral("[\\x{AC00}-\\x{D7A3}]{2,}"));
    static const QRegularExpression kQuoted(QStringLiteral("[\"\\x{201C}]([^\"\\x{201D}]{2,})[\"\\x{201D}]"));

    QStringList terms;
    auto collect = [&terms, &title](const QRegularExpression& pattern, int group) {
        QRegularExpressionMatchIterator it = pattern.globalMatch(title);
        while (it.hasNext()) {
            const QString term = it.next().captured(group).trimmed();
            if (!term.isEmpty() && !terms.contains(term)) {
                terms.append(term);
            }
        }
    };
    collect(kQuoted, 1);
    collect(kHangulRun, 0);
    collect(kLatinProperNoun, 0);
    return terms;
}

bool IntegrityAssessor::hasRepetitiveSentences(const QString& body)
{
    QStringList sentences;
    const QStringList parts = body.split(QLatin1Char('.'));
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty()) {
            sentences.append(trimmed);
        }
    }
    if (sentences.size() < 3) {
        return false;
    }

    const QSet<QString> unique(sentences.begin(), sentences.end());
    const double repeatedRatio =
        1.0 - static_cast<double>(unique.size()) / static_cast<double>(sentences.size());
    return repeatedRatio > kRepeatedSentenceRatio;
}

double IntegrityAssessor::vocabularyDensity(const QString& lowerText)
{
    const QStringList words = lowerText.simplified().split(QChar(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return 1.0;
    }
    int meaningful = 0;
    for (const QString& word : words) {
        if (word.size() > 1 && !functionWords().contains(word)) {
            ++meaningful;
        }
    }
    return static_cast<double>(meaningful) / static_cast<double>(words.size());
}

} // namespace nr
