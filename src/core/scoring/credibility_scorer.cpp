#include "core/scoring/credibility_scorer.h"
#include "core/dedup/text_similarity.h"
#include "core/shared/logging.h"

#include <QStringList>

#include <algorithm>

namespace nr {

namespace {

const QStringList& sensationalWords()
{
    static const QStringList kWords = {
        QStringLiteral("충격"),   QStringLiteral("경악"),   QStringLiteral("발칵"),
        QStringLiteral("폭탄"),   QStringLiteral("대박"),   QStringLiteral("역대급"),
        QStringLiteral("초대형"), QStringLiteral("긴급"),   QStringLiteral("속보"),
        QStringLiteral("단독"),   QStringLiteral("breaking"), QStringLiteral("shock"),
    };
    return kWords;
}

QRegularExpression caseInsensitive(const QString& pattern)
{
    return QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption);
}

} // namespace

CredibilityScorer::CredibilityScorer(const SourceTrustLookup& trustLookup,
                                     CredibilityConfig config)
    : m_trustLookup(trustLookup)
    , m_config(config)
{
    m_evidenceRules = {
        {QStringLiteral("numeric_statistics"),
         caseInsensitive(QStringLiteral(
             "\\d+(?:\\.\\d+)?\\s?%|\\d+\\s?(?:억|만|조)|\\b\\d[\\d,.]*\\s?(?:million|billion|trillion|percent)\\b")),
         0.20},
        {QStringLiteral("direct_quotation"),
         QRegularExpression(QStringLiteral(
             "\"[^\"]{5,}\"|\\x{201C}[^\\x{201D}]{5,}\\x{201D}|'[^']{5,}'")),
         0.20},
        {QStringLiteral("official_statement"),
         caseInsensitive(QStringLiteral(
             "관계자는?\\s|대변인|\\bspokes(?:man|woman|person)\\b|\\bofficials?\\s+said\\b|\\baccording to\\b")),
         0.15},
        {QStringLiteral("report_reference"),
         caseInsensitive(QStringLiteral(
             "보고서|연구\\s결과|발표\\s자료|\\breports?\\b|\\bstud(?:y|ies)\\b|\\bsurvey\\b")),
         0.15},
        {QStringLiteral("reference_link"),
         QRegularExpression(QStringLiteral("https?://\\S+")),
         0.10},
    };
}

std::vector<CredibilityAssessment> CredibilityScorer::scoreBatch(
    const std::vector<NormalizedArticle>& batch) const
{
    std::vector<QSet<QString>> tokenSets;
    tokenSets.reserve(batch.size());
    std::vector<int> nodes;
    nodes.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        tokenSets.push_back(titleTokens(batch[i].title));
        nodes.push_back(static_cast<int>(i));
    }
    const SimilarityGraph graph =
        SimilarityGraph::build(tokenSets, m_config.corroborationThreshold);
    return scoreBatch(batch, graph, nodes);
}

std::vector<CredibilityAssessment> CredibilityScorer::scoreBatch(
    const std::vector<NormalizedArticle>& batch,
    const SimilarityGraph& graph,
    const std::vector<int>& graphNodes) const
{
    if (graph.floor() > m_config.corroborationThreshold
        || graphNodes.size() != batch.size()) {
        LOG_DEBUG(nrScoring, "shared graph cannot answer corroboration queries; rebuilding");
        return scoreBatch(batch);
    }

    // graph node -> batch index; nodes absent from the batch map to -1
    std::vector<int> batchIndexOfNode(static_cast<size_t>(graph.nodeCount()), -1);
    for (size_t i = 0; i < graphNodes.size(); ++i) {
        const int node = graphNodes[i];
        if (node >= 0 && node < graph.nodeCount()) {
            batchIndexOfNode[static_cast<size_t>(node)] = static_cast<int>(i);
        }
    }

    std::vector<CredibilityAssessment> assessments;
    assessments.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        const NormalizedArticle& article = batch[i];
        CredibilityAssessment assessment;

        assessment.sourceTrust = sourceTrustScore(article.sourceId, assessment.flags);

        int corroborating = 0;
        if (titleTokens(article.title).size() >= m_config.corroborationMinTitleTokens) {
            for (int neighbor : graph.neighbors(graphNodes[i], m_config.corroborationThreshold)) {
                const int other = batchIndexOfNode[static_cast<size_t>(neighbor)];
                if (other < 0 || other == static_cast<int>(i)) {
                    continue;
                }
                if (batch[static_cast<size_t>(other)].sourceId == article.sourceId) {
                    continue;
                }
                ++corroborating;
            }
        }
        assessment.corroborationCount = corroborating;
        assessment.corroborationBonus = corroborationBonus(corroborating);
        assessment.credibility =
            std::clamp(assessment.sourceTrust + assessment.corroborationBonus, 0.0, 1.0);

        if (article.body.trimmed().isEmpty()) {
            assessment.flags.push_back(QStringLiteral("empty_body"));
        }
        assessment.evidenceScore = evidenceScore(article.body);
        assessment.sensationalismPenalty = sensationalismPenalty(article.title);
        assessment.quality = std::clamp(
            assessment.evidenceScore - assessment.sensationalismPenalty, 0.0, 1.0);

        LOG_DEBUG(nrScoring,
                  "credibility: id=%s trust=%.2f corroborating=%d -> %.3f; "
                  "evidence=%.3f sensational=%.3f -> quality %.3f",
                  qUtf8Printable(article.id), assessment.sourceTrust, corroborating,
                  assessment.credibility, assessment.evidenceScore,
                  assessment.sensationalismPenalty, assessment.quality);

        assessments.push_back(std::move(assessment));
    }
    return assessments;
}

double CredibilityScorer::sourceTrustScore(const QString& sourceId,
                                           std::vector<QString>& flags) const
{
    const std::optional<SourceTrust> source = m_trustLookup.lookup(sourceId);
    if (!source.has_value()) {
        flags.push_back(QStringLiteral("unknown_source"));
        LOG_WARN(nrScoring, "unknown source '%s'; using tier3 trust",
                 qUtf8Printable(sourceId));
        return tierBaseTrust(SourceTier::Tier3);
    }
    if (source->tier == SourceTier::Blacklist) {
        flags.push_back(QStringLiteral("blacklisted_source"));
    }
    return source->trust();
}

double CredibilityScorer::corroborationBonus(int corroboratingArticles)
{
    if (corroboratingArticles >= kLargeCorroborationCount) {
        return kLargeCorroborationBonus;
    }
    if (corroboratingArticles >= 1) {
        return kSmallCorroborationBonus;
    }
    return 0.0;
}

double CredibilityScorer::evidenceScore(const QString& body) const
{
    if (body.trimmed().isEmpty()) {
        return 0.0;
    }

    double score = 0.0;
    for (const EvidenceRule& rule : m_evidenceRules) {
        if (rule.pattern.match(body).hasMatch()) {
            score += rule.weight;
        }
    }
    const double lengthBonus =
        std::min(kLengthBonusCap, static_cast<double>(body.size()) / kLengthBonusChars);
    return std::min(1.0, score + lengthBonus);
}

double CredibilityScorer::sensationalismPenalty(const QString& title) const
{
    static const QRegularExpression kEmphasis(QStringLiteral("[!?]{2,}|[ㅋㅎ]{2,}"));

    const QString titleLower = title.toLower();
    int wordMatches = 0;
    for (const QString& word : sensationalWords()) {
        if (titleLower.contains(word)) {
            ++wordMatches;
        }
    }
    const double wordPenalty = std::min(kSensationalWordCap, wordMatches * kSensationalWordPenalty);

    int emphasisMatches = 0;
    QRegularExpressionMatchIterator it = kEmphasis.globalMatch(title);
    while (it.hasNext()) {
        it.next();
        ++emphasisMatches;
    }
    const double emphasisPenalty = std::min(kEmphasisCap, emphasisMatches * kEmphasisPenalty);

    return std::min(1.0, wordPenalty + emphasisPenalty);
}

} // namespace nr
