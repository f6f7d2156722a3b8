#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(cwCore, "codexwatcher.core")
Q_LOGGING_CATEGORY(cwIngest, "codexwatcher.ingest")
Q_LOGGING_CATEGORY(cwFs, "codexwatcher.fs")
Q_LOGGING_CATEGORY(cwIndex, "codexwatcher.index")
Q_LOGGING_CATEGORY(cwSearch, "codexwatcher.search")
Q_LOGGING_CATEGORY(cwIpc, "codexwatcher.ipc")
