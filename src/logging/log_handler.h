#pragma once

#include <QString>
#include <QtGlobal>

namespace WalletCore {

/**
 * @brief Process-wide Qt message handler with an optional file sink
 *
 * Messages are always forwarded to the handler that was active before
 * install(). When enabled, they are also appended to the log file with a
 * timestamp and level.
 */
class LogHandler {
public:
    /**
     * @brief Install the handler
     * @param enabled Write messages to filePath
     * @param filePath Log file, opened in append mode
     * @return false if the file could not be opened (handler still installed)
     */
    static bool install(bool enabled, const QString& filePath);

    /**
     * @brief Restore the previous handler and close the log file
     */
    static void uninstall();

    static bool isFileLoggingActive();

    static QString formatMessage(QtMsgType type, const QString& message);

private:
    static void handleMessage(QtMsgType type, const QMessageLogContext& context, const QString& message);
};

} // namespace WalletCore
