#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(mcCore, "memctl.core")
Q_LOGGING_CATEGORY(mcIndex, "memctl.index")
Q_LOGGING_CATEGORY(mcEmbedding, "memctl.embedding")
Q_LOGGING_CATEGORY(mcRanking, "memctl.ranking")
Q_LOGGING_CATEGORY(mcMaintenance, "memctl.maintenance")
