#pragma once

#include <QMetaType>
#include <QString>
#include <QVariantMap>
#include <variant>

namespace WalletCore {

/**
 * @brief Lifecycle states of the wallet key
 */
enum class UnlockState {
    Initializing,   // Detecting salt and biometric capability
    NotConfigured,  // No salt stored yet, setup() required
    Locked,         // Salt exists, key not in memory
    KeyAcquired,    // Key in memory, waiting for the caller to confirm it
    Unlocked        // Key confirmed, caller context attached
};

enum class UnlockMethod {
    Pin,
    Biometrics
};

/**
 * @brief Outcome of a biometric unlock attempt
 *
 * Everything except Unlocked leaves the machine Locked. Inspect
 * canTryUnlockingUsingBiometrics() to know whether another attempt is allowed.
 */
enum class BiometricUnlockResult {
    Unlocked,
    NotAllowed,   // Biometrics revoked or unavailable for this session
    NoStoredKey,  // Store holds no biometry-backed key
    Cancelled,    // User dismissed the prompt, biometrics revoked
    Failed        // Counted against the attempt budget
};

QString unlockStateToString(UnlockState state);
QString unlockMethodToString(UnlockMethod method);
QString biometricUnlockResultToString(BiometricUnlockResult result);

// Per-state snapshots. Each alternative carries only the data of its state.
struct InitializingStatus {};

struct NotConfiguredStatus {};

struct LockedStatus {
    bool canTryBiometrics = false;
    bool isUnlocking = false;
};

struct KeyAcquiredStatus {
    UnlockMethod unlockMethod = UnlockMethod::Pin;
};

struct UnlockedStatus {
    UnlockMethod unlockMethod = UnlockMethod::Pin;
    QVariantMap context;
};

using UnlockStatus = std::variant<InitializingStatus,
                                  NotConfiguredStatus,
                                  LockedStatus,
                                  KeyAcquiredStatus,
                                  UnlockedStatus>;

struct UnlockPolicy {
    // Non-cancel biometric failures tolerated before biometrics is revoked
    int maxBiometricAttempts = 3;
    // Queue initialize() on the event loop after construction and reinitialize()
    bool autoInitialize = true;
};

struct UnlockOptions {
    bool enableBiometrics = false;
};

} // namespace WalletCore

Q_DECLARE_METATYPE(WalletCore::UnlockState)
Q_DECLARE_METATYPE(WalletCore::UnlockMethod)
