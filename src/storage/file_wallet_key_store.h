#pragma once

#include "storage/wallet_key_store.h"
#include <QByteArray>
#include <QMap>
#include <QString>

namespace WalletCore {

class BiometricAuthenticator;

/**
 * @brief Software wallet key store backed by a JSON file
 *
 * Used on desktop builds and in tests. The PIN-derived key is never written;
 * only its salt and a check value are. The biometry-backed copy of the key is
 * written only through storeWalletKey() and is released only after the
 * BiometricAuthenticator approves.
 *
 * No at-rest protection: the biometry-backed key is stored unencrypted, as
 * hex, in the same file as the salt. Anyone who can read the file has the
 * wallet key without any biometric check. Do not use it where the file can
 * leave the device; mobile builds use a platform keychain WalletKeyStore.
 *
 * File format: wallet-key-store.json
 * {
 *   "salts": {
 *     "1": { "salt": "hex", "biometrics": true, "check": "hex" }
 *   },
 *   "biometricKeys": {
 *     "1": "hex"
 *   }
 * }
 */
class FileWalletKeyStore : public WalletKeyStore {
public:
    static constexpr int DEFAULT_KEY_VERSION = 1;
    static constexpr int DEFAULT_PIN_KDF_ITERATIONS = 100000;
    static constexpr int SALT_LENGTH = 32;
    static constexpr int KEY_LENGTH = 32;

    /**
     * @param filePath JSON file, created on first save
     * @param authenticator Biometric prompt, nullptr if the device has none (not owned)
     * @param keyVersion Version reported by getWalletKeyVersion()
     * @param pinKdfIterations PBKDF2 iteration count
     */
    explicit FileWalletKeyStore(const QString& filePath,
                                BiometricAuthenticator* authenticator = nullptr,
                                int keyVersion = DEFAULT_KEY_VERSION,
                                int pinKdfIterations = DEFAULT_PIN_KDF_ITERATIONS);
    ~FileWalletKeyStore() override;

    // Load/save operations
    bool load();
    bool save();

    // WalletKeyStore
    std::optional<QByteArray> getSalt(int version) override;
    int getWalletKeyVersion() const override { return m_keyVersion; }
    bool canUseBiometryBackedWalletKey() override;
    void createAndStoreSalt(bool useBiometrics, int version) override;
    WalletKey getWalletKeyUsingPin(const QString& pin, int version) override;
    std::optional<WalletKey> getWalletKeyUsingBiometrics(int version) override;
    void storeWalletKey(const WalletKey& key, int version) override;

    bool hasBiometricKey(int version) const;
    bool removeWalletKey(int version);
    void clear();

    QString filePath() const { return m_filePath; }
    QString lastError() const { return m_lastError; }

private:
    struct SaltEntry {
        QByteArray salt;
        bool biometrics = false;
        QByteArray check;
    };

    void persist();
    QByteArray derivePinKey(const QString& pin, const QByteArray& salt);
    static QByteArray checkValue(const QByteArray& key);
    void wipeBiometricKeys();

    QString m_filePath;
    QString m_lastError;
    BiometricAuthenticator* m_authenticator;
    int m_keyVersion;
    int m_pinKdfIterations;
    QMap<int, SaltEntry> m_salts;
    QMap<int, QByteArray> m_biometricKeys;
    bool m_modified;
};

} // namespace WalletCore
