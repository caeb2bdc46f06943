#include "log.h"

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

Q_LOGGING_CATEGORY(lcBbd, "bbd")

namespace bbd {

LogFn MakeQtLogger(const std::string& component) {
    const QString tag = QStringLiteral("[%1]").arg(QString::fromStdString(component));
    return [tag](LogLevel level, const std::string& msg) {
        const QString text = QString::fromStdString(msg);
        switch (level) {
        case LogLevel::Debug:
            qCDebug(lcBbd).noquote() << tag << text;
            break;
        case LogLevel::Info:
            qCInfo(lcBbd).noquote() << tag << text;
            break;
        case LogLevel::Warning:
            qCWarning(lcBbd).noquote() << tag << text;
            break;
        }
    };
}

LogFn TagLogger(const LogFn& logger, const std::string& component) {
    if (!logger) {
        return LogFn();
    }
    const std::string prefix = "[" + component + "] ";
    return [logger, prefix](LogLevel level, const std::string& msg) { logger(level, prefix + msg); };
}

} // namespace bbd
