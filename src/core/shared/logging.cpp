#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(hqCore, "helmquery.core")
Q_LOGGING_CATEGORY(hqGuard, "helmquery.guard")
Q_LOGGING_CATEGORY(hqRouter, "helmquery.router")
Q_LOGGING_CATEGORY(hqExtraction, "helmquery.extraction")
