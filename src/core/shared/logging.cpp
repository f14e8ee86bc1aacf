#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(nrCore, "newsrank.core")
Q_LOGGING_CATEGORY(nrDedup, "newsrank.dedup")
Q_LOGGING_CATEGORY(nrIntegrity, "newsrank.integrity")
Q_LOGGING_CATEGORY(nrScoring, "newsrank.scoring")
Q_LOGGING_CATEGORY(nrRanking, "newsrank.ranking")
Q_LOGGING_CATEGORY(nrRegistry, "newsrank.registry")
