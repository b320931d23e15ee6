#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(crlCore, "crl.core")
Q_LOGGING_CATEGORY(crlLearning, "crl.learning")
Q_LOGGING_CATEGORY(crlStore, "crl.store")
Q_LOGGING_CATEGORY(crlEvents, "crl.events")
