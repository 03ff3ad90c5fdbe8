#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(cdirCore, "cdir.core")
Q_LOGGING_CATEGORY(cdirStore, "cdir.store")
Q_LOGGING_CATEGORY(cdirSearch, "cdir.search")
Q_LOGGING_CATEGORY(cdirRanking, "cdir.ranking")
Q_LOGGING_CATEGORY(cdirCache, "cdir.cache")
