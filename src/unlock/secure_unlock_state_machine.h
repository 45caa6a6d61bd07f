#pragma once

#include "unlock/unlock_types.h"
#include "unlock/wallet_key.h"
#include "errors.h"
#include <QMutex>
#include <QObject>
#include <QVariantMap>

namespace WalletCore {

class WalletKeyStore;

/**
 * @brief Single source of truth for wallet key availability
 *
 * One instance per session, passed by reference to its consumers.
 * Each operation is only valid in specific states; calling it in any other
 * state throws ContractViolation.
 *
 * Initializing --(salt found)-------------------> Locked
 * Initializing --(no salt)----------------------> NotConfigured
 * NotConfigured --setup(pin)--------------------> KeyAcquired(Pin)
 * Locked --unlockUsingPin(pin)------------------> KeyAcquired(Pin)
 * Locked --tryUnlockingUsingBiometrics()--------> KeyAcquired(Biometrics)
 * KeyAcquired --setWalletKeyValid(ctx, opts)----> Unlocked(ctx)
 * KeyAcquired --setWalletKeyInvalid()-----------> Locked
 * Unlocked --lock()-----------------------------> Locked
 * (any) --reinitialize()------------------------> Initializing
 *
 * Operations block on the store and must not run concurrently with each other;
 * observers may read the state from any thread. The internal mutex is never
 * held across a key retrieval (which may prompt the user) or a signal emission.
 * A reinitialize() issued while a retrieval is in flight makes that operation
 * fail with KeychainError::Reason::Aborted.
 */
class SecureUnlockStateMachine : public QObject {
    Q_OBJECT

public:
    explicit SecureUnlockStateMachine(WalletKeyStore* store, QObject* parent = nullptr);
    SecureUnlockStateMachine(WalletKeyStore* store, const UnlockPolicy& policy, QObject* parent = nullptr);
    ~SecureUnlockStateMachine() override;

    UnlockState state() const;

    /**
     * @brief Snapshot of the current state and its data
     */
    UnlockStatus status() const;

    // ============================================================================
    // Operations
    // ============================================================================

    /**
     * @brief Detect salt and biometric capability
     *
     * No-op unless in Initializing and not already running.
     * @throws KeychainError if the store query fails (state stays Initializing)
     */
    void initialize();

    /**
     * @brief Create the wallet key for a fresh wallet (NotConfigured)
     * @return Key owned by the state machine, valid until it leaves KeyAcquired
     * @throws SetupError if salt creation or key derivation fails
     */
    const WalletKey& setup(const QString& pin);

    /**
     * @brief Unlock using the PIN (Locked)
     * @return Key owned by the state machine, valid until it leaves KeyAcquired
     * @throws KeychainError on wrong PIN or store failure (state stays Locked)
     */
    const WalletKey& unlockUsingPin(const QString& pin);

    /**
     * @brief Unlock using biometrics (Locked)
     *
     * Cancellation revokes biometrics for the session. Other failures revoke
     * it once the attempt budget is exceeded.
     */
    BiometricUnlockResult tryUnlockingUsingBiometrics();

    /**
     * @brief Confirm the acquired key is usable (KeyAcquired)
     *
     * Persists the key for biometric retrieval when the device supports it
     * and options.enableBiometrics is set. Persisting happens first, without
     * holding the internal mutex.
     * @throws KeychainError if persisting fails (state stays KeyAcquired), or
     *         with reason Aborted if the session changed during the write
     */
    void setWalletKeyValid(const QVariantMap& context, const UnlockOptions& options);

    /**
     * @brief Reject the acquired key (KeyAcquired)
     */
    void setWalletKeyInvalid();

    /**
     * @brief Drop key and context (Unlocked)
     */
    void lock();

    /**
     * @brief Forget everything and start over (any state)
     */
    void reinitialize();

    // ============================================================================
    // State-specific accessors
    // ============================================================================

    bool isUnlocking() const;                     // Locked
    bool canTryUnlockingUsingBiometrics() const;  // Locked
    const WalletKey& walletKey() const;           // KeyAcquired
    UnlockMethod unlockMethod() const;            // KeyAcquired, Unlocked
    QVariantMap context() const;                  // Unlocked

    bool canUseBiometrics() const;
    int biometricAttempts() const;
    const UnlockPolicy& policy() const { return m_policy; }

signals:
    void stateChanged(WalletCore::UnlockState newState, WalletCore::UnlockState oldState);
    void unlockingChanged(bool unlocking);
    void biometricsAvailabilityChanged(bool canTry);
    void biometricUnlockFailed(const QString& reason, const QString& message);
    void initializationFailed(const QString& message);

private slots:
    void autoInitialize();

private:
    void scheduleInitialize();
    void requireState(UnlockState expected, const char* operation) const;
    void requireAnyState(UnlockState first, UnlockState second, const char* operation) const;

    /**
     * @brief Switch state and emit stateChanged
     *
     * Caller holds the lock; it is released before emitting.
     */
    void applyState(UnlockState newState, QMutexLocker<QMutex>& locker);

    BiometricUnlockResult handleBiometricFailure(quint64 generation,
                                                 KeychainError::Reason reason,
                                                 const QString& message);
    void finishUnlocking(quint64 generation);
    void wipeSecretsLocked();

    WalletKeyStore* m_store;
    UnlockPolicy m_policy;

    UnlockState m_state;
    WalletKey m_walletKey;
    UnlockMethod m_unlockMethod;
    QVariantMap m_context;

    bool m_canUseBiometrics;
    bool m_canTryBiometrics;
    int m_biometricAttempts;
    bool m_isUnlocking;
    bool m_initializing;

    // Bumped by reinitialize() so in-flight operations can detect they are stale
    quint64 m_generation;

    mutable QMutex m_mutex;
};

} // namespace WalletCore
