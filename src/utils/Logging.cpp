#include "Logging.h"

namespace CER {

Q_LOGGING_CATEGORY(lcConfig, "cer.config", QtInfoMsg)
Q_LOGGING_CATEGORY(lcEvents, "cer.events", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSession, "cer.session", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPipeline, "cer.pipeline", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSupervisor, "cer.supervisor", QtInfoMsg)

void setupLogging(bool verbose) {
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} "
        "%{if-debug}DEBUG%{endif}%{if-info}INFO %{endif}%{if-warning}WARN %{endif}"
        "%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif} "
        "%{category}: %{message}"));

    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("cer.*.debug=true"));
    }
}

} // namespace CER
