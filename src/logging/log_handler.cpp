#include "logging/log_handler.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <memory>

namespace WalletCore {

namespace {

QMutex s_logMutex;
std::unique_ptr<QFile> s_logFile;
QtMessageHandler s_previousHandler = nullptr;
bool s_installed = false;

const char* levelName(QtMsgType type)
{
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARNING";
        case QtCriticalMsg:
            return "CRITICAL";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

} // namespace

bool LogHandler::install(bool enabled, const QString& filePath)
{
    QMutexLocker locker(&s_logMutex);

    s_logFile.reset();

    if (!s_installed) {
        s_previousHandler = qInstallMessageHandler(&LogHandler::handleMessage);
        s_installed = true;
    }

    if (!enabled || filePath.isEmpty()) {
        return true;
    }

    QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !QDir().mkpath(dir.absolutePath())) {
        locker.unlock();
        qWarning() << "LogHandler: Failed to create log directory:" << dir.absolutePath();
        return false;
    }

    auto file = std::make_unique<QFile>(filePath);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        QString error = file->errorString();
        locker.unlock();
        qWarning() << "LogHandler: Failed to open log file" << filePath << ":" << error;
        return false;
    }

    s_logFile = std::move(file);
    return true;
}

void LogHandler::uninstall()
{
    QMutexLocker locker(&s_logMutex);

    if (s_installed) {
        qInstallMessageHandler(s_previousHandler);
        s_previousHandler = nullptr;
        s_installed = false;
    }

    s_logFile.reset();
}

bool LogHandler::isFileLoggingActive()
{
    QMutexLocker locker(&s_logMutex);
    return s_logFile != nullptr;
}

QString LogHandler::formatMessage(QtMsgType type, const QString& message)
{
    return QString("[%1] [%2] %3")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
             QString::fromLatin1(levelName(type)),
             message);
}

void LogHandler::handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker locker(&s_logMutex);
        previous = s_previousHandler;

        if (s_logFile) {
            QTextStream stream(s_logFile.get());
            stream << formatMessage(type, message) << '\n';
            stream.flush();
        }
    }

    if (previous) {
        previous(type, context, message);
    }
}

} // namespace WalletCore
