#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>
#include "logging/log_handler.h"

using namespace WalletCore;

class TestLogHandler : public QObject
{
    Q_OBJECT

private slots:
    void cleanup()
    {
        LogHandler::uninstall();
    }

    void testFormatMessage()
    {
        QString line = LogHandler::formatMessage(QtWarningMsg, "FileWalletKeyStore: Wrong PIN");

        QVERIFY(line.startsWith("["));
        QVERIFY(line.contains("[WARNING]"));
        QVERIFY(line.endsWith("FileWalletKeyStore: Wrong PIN"));
        QVERIFY(LogHandler::formatMessage(QtCriticalMsg, "x").contains("[CRITICAL]"));
        QVERIFY(LogHandler::formatMessage(QtDebugMsg, "x").contains("[DEBUG]"));
    }

    void testWritesToFileWhenEnabled()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.filePath("logs/wallet.log");

        QVERIFY(LogHandler::install(true, path));
        QVERIFY(LogHandler::isFileLoggingActive());

        qWarning() << "SecureUnlockStateMachine: test message";
        LogHandler::uninstall();
        QVERIFY(!LogHandler::isFileLoggingActive());

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QString contents = QString::fromUtf8(file.readAll());
        QVERIFY(contents.contains("[WARNING]"));
        QVERIFY(contents.contains("SecureUnlockStateMachine: test message"));
    }

    void testDisabledWritesNothing()
    {
        QTemporaryDir dir;
        QString path = dir.filePath("wallet.log");

        QVERIFY(LogHandler::install(false, path));
        QVERIFY(!LogHandler::isFileLoggingActive());

        qWarning() << "not written";
        QVERIFY(!QFile::exists(path));
    }

    void testReinstallSwitchesFile()
    {
        QTemporaryDir dir;
        QString first = dir.filePath("first.log");
        QString second = dir.filePath("second.log");

        QVERIFY(LogHandler::install(true, first));
        qWarning() << "to first";
        QVERIFY(LogHandler::install(true, second));
        qWarning() << "to second";
        LogHandler::uninstall();

        QFile firstFile(first);
        QVERIFY(firstFile.open(QIODevice::ReadOnly));
        QString firstContents = QString::fromUtf8(firstFile.readAll());
        QVERIFY(firstContents.contains("to first"));
        QVERIFY(!firstContents.contains("to second"));

        QFile secondFile(second);
        QVERIFY(secondFile.open(QIODevice::ReadOnly));
        QVERIFY(QString::fromUtf8(secondFile.readAll()).contains("to second"));
    }
};

QTEST_MAIN(TestLogHandler)
#include "test_log_handler.moc"
