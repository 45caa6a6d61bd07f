#pragma once

#include "unlock/wallet_key.h"
#include <QByteArray>
#include <QString>
#include <optional>

namespace WalletCore {

/**
 * @brief Contract of the platform secret store holding the wallet key
 *
 * Implementations report failures by throwing KeychainError.
 */
class WalletKeyStore {
public:
    virtual ~WalletKeyStore() = default;

    /**
     * @brief Salt for a key version, absent if the wallet was never set up
     */
    virtual std::optional<QByteArray> getSalt(int version) = 0;

    /**
     * @brief Key version new and existing wallets use
     */
    virtual int getWalletKeyVersion() const = 0;

    virtual bool canUseBiometryBackedWalletKey() = 0;

    virtual void createAndStoreSalt(bool useBiometrics, int version) = 0;

    /**
     * @brief Derive the wallet key from the PIN
     * @throws KeychainError on wrong PIN, missing salt or corrupted storage
     */
    virtual WalletKey getWalletKeyUsingPin(const QString& pin, int version) = 0;

    /**
     * @brief Read the biometry-backed key, prompting the user
     * @return Key, or nullopt when no key was stored for biometrics
     * @throws KeychainError with reason UserCancelled when the prompt was dismissed
     */
    virtual std::optional<WalletKey> getWalletKeyUsingBiometrics(int version) = 0;

    /**
     * @brief Persist the key for later biometric retrieval
     */
    virtual void storeWalletKey(const WalletKey& key, int version) = 0;
};

} // namespace WalletCore
