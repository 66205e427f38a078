// Qt logging categories of the command-line front end and the bridge that
// routes core log messages into them.
#pragma once
#include "rdispatch/RuntimeLogging.hpp"
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(rdCli)
Q_DECLARE_LOGGING_CATEGORY(rdXfer)
Q_DECLARE_LOGGING_CATEGORY(rdSession)

// Debug output is off unless verbose; rdispatch.* info and above stays on.
void applyLogVerbosity(bool verbose);

rdispatch::LogCB makeCoreLogger(const QLoggingCategory &category);
