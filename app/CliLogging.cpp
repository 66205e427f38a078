#include "CliLogging.hpp"
#include <QString>

Q_LOGGING_CATEGORY(rdCli, "rdispatch.cli")
Q_LOGGING_CATEGORY(rdXfer, "rdispatch.transfer")
Q_LOGGING_CATEGORY(rdSession, "rdispatch.session")

void applyLogVerbosity(bool verbose) {
    qSetMessagePattern("%{time hh:mm:ss.zzz} [%{type}] %{category}: %{message}");
    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("rdispatch.*=true")
                                             : QStringLiteral("rdispatch.*.debug=false\n"
                                                              "rdispatch.*.info=true"));
}

rdispatch::LogCB makeCoreLogger(const QLoggingCategory &category) {
    const QLoggingCategory *cat = &category;
    return [cat](rdispatch::LogLevel level, const std::string &msg) {
        const QLoggingCategory &c = *cat;
        const QString text = QString::fromStdString(msg);
        switch (level) {
        case rdispatch::LogLevel::Debug:
            qCDebug(c).noquote() << text;
            break;
        case rdispatch::LogLevel::Info:
            qCInfo(c).noquote() << text;
            break;
        case rdispatch::LogLevel::Warning:
            qCWarning(c).noquote() << text;
            break;
        case rdispatch::LogLevel::Error:
            qCCritical(c).noquote() << text;
            break;
        }
    };
}
