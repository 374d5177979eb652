#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ssCore, "stratosort.core")
Q_LOGGING_CATEGORY(ssEmbed, "stratosort.embed")
Q_LOGGING_CATEGORY(ssQueue, "stratosort.queue")
Q_LOGGING_CATEGORY(ssFs, "stratosort.fs")
Q_LOGGING_CATEGORY(ssPipeline, "stratosort.pipeline")
