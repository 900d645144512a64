#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace common
{

namespace
{

void outputMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QString level;
    switch (type)
    {
    case QtDebugMsg: level = QStringLiteral("DEBUG"); break;
    case QtInfoMsg: level = QStringLiteral("INFO"); break;
    case QtWarningMsg: level = QStringLiteral("WARN"); break;
    case QtCriticalMsg: level = QStringLiteral("CRITICAL"); break;
    case QtFatalMsg: level = QStringLiteral("FATAL"); break;
    }

    const QString category = context.category ? QString::fromUtf8(context.category) : QString();

    QTextStream stream(stderr);
    stream << '[' << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << "] "
           << level << ' ' << category << ": " << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        abort();
    }
}

} // namespace

void initLogging(bool verbose)
{
    qInstallMessageHandler(outputMessage);
    // Per-trip chatter from the sim category is debug-level noise unless asked for.
    if (!verbose)
    {
        QLoggingCategory::setFilterRules(QStringLiteral("haulgrade.sim.info=false"));
    }
}

} // namespace common
