#include "pawpal/Logging.hpp"

Q_LOGGING_CATEGORY(lcData, "pawpal.data")
Q_LOGGING_CATEGORY(lcScheduler, "pawpal.scheduler")
Q_LOGGING_CATEGORY(lcConflicts, "pawpal.conflicts")
