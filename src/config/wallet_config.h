#pragma once

#include <QJsonObject>
#include <QString>

namespace WalletCore {

/**
 * @brief Keys of the JSON configuration file
 */
namespace ConfigKeys {
    const QString STORAGE_PATH = "storage-path";
    const QString WALLET_KEY_VERSION = "wallet-key-version";
    const QString PIN_KDF_ITERATIONS = "pin-kdf-iterations";
    const QString MAX_BIOMETRIC_ATTEMPTS = "max-biometric-attempts";
    const QString AUTO_INITIALIZE = "auto-initialize";
    const QString LOG_ENABLED = "log-enabled";
    const QString LOG_FILE = "log-file";
    const QString ISSUANCE_CLIENT_ID = "issuance-client-id";
    const QString ISSUANCE_REDIRECT_URI = "issuance-redirect-uri";
}

struct UnlockPolicy;
struct IssuanceProfile;

/**
 * @brief Runtime configuration of the wallet core
 *
 * Every key is optional. Missing keys keep their defaults.
 * {
 *   "storage-path": "/path/to/wallet-key-store.json",
 *   "wallet-key-version": 1,
 *   "pin-kdf-iterations": 100000,
 *   "max-biometric-attempts": 3,
 *   "auto-initialize": true,
 *   "log-enabled": false,
 *   "log-file": "",
 *   "issuance-client-id": "...",
 *   "issuance-redirect-uri": "..."
 * }
 */
class WalletConfig {
public:
    static constexpr int MIN_PIN_KDF_ITERATIONS = 1000;

    WalletConfig();

    bool load(const QString& filePath);
    bool fromJson(const QJsonObject& json);
    QJsonObject toJson() const;

    QString storagePath() const { return m_storagePath; }
    int walletKeyVersion() const { return m_walletKeyVersion; }
    int pinKdfIterations() const { return m_pinKdfIterations; }
    int maxBiometricAttempts() const { return m_maxBiometricAttempts; }
    bool autoInitialize() const { return m_autoInitialize; }
    bool logEnabled() const { return m_logEnabled; }
    QString logFilePath() const { return m_logFilePath; }
    QString issuanceClientId() const { return m_issuanceClientId; }
    QString issuanceRedirectUri() const { return m_issuanceRedirectUri; }

    void setStoragePath(const QString& path) { m_storagePath = path; }
    void setLogging(bool enabled, const QString& filePath);

    /**
     * @brief Unlock policy derived from this configuration
     */
    UnlockPolicy unlockPolicy() const;

    /**
     * @brief Apply client id and redirect overrides to a profile
     */
    IssuanceProfile applyTo(const IssuanceProfile& profile) const;

    QString lastError() const { return m_lastError; }

private:
    bool readInt(const QJsonObject& json, const QString& key, int minimum, int* out);
    bool readBool(const QJsonObject& json, const QString& key, bool* out);
    bool readString(const QJsonObject& json, const QString& key, QString* out);

    QString m_storagePath;
    int m_walletKeyVersion;
    int m_pinKdfIterations;
    int m_maxBiometricAttempts;
    bool m_autoInitialize;
    bool m_logEnabled;
    QString m_logFilePath;
    QString m_issuanceClientId;
    QString m_issuanceRedirectUri;
    QString m_lastError;
};

} // namespace WalletCore
