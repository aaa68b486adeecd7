#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(mcCore, "mediacatalog.core")
Q_LOGGING_CATEGORY(mcIndex, "mediacatalog.index")
Q_LOGGING_CATEGORY(mcRanking, "mediacatalog.ranking")
Q_LOGGING_CATEGORY(mcFuzzy, "mediacatalog.fuzzy")
Q_LOGGING_CATEGORY(mcEmbedding, "mediacatalog.embedding")
Q_LOGGING_CATEGORY(mcRecommend, "mediacatalog.recommend")
