#include "unlock/unlock_types.h"

namespace WalletCore {

QString unlockStateToString(UnlockState state)
{
    switch (state) {
        case UnlockState::Initializing:
            return "initializing";
        case UnlockState::NotConfigured:
            return "not-configured";
        case UnlockState::Locked:
            return "locked";
        case UnlockState::KeyAcquired:
            return "acquired-wallet-key";
        case UnlockState::Unlocked:
            return "unlocked";
    }
    return "unknown";
}

QString unlockMethodToString(UnlockMethod method)
{
    switch (method) {
        case UnlockMethod::Pin:
            return "pin";
        case UnlockMethod::Biometrics:
            return "biometrics";
    }
    return "unknown";
}

QString biometricUnlockResultToString(BiometricUnlockResult result)
{
    switch (result) {
        case BiometricUnlockResult::Unlocked:
            return "unlocked";
        case BiometricUnlockResult::NotAllowed:
            return "not-allowed";
        case BiometricUnlockResult::NoStoredKey:
            return "no-stored-key";
        case BiometricUnlockResult::Cancelled:
            return "cancelled";
        case BiometricUnlockResult::Failed:
            return "failed";
    }
    return "unknown";
}

} // namespace WalletCore
