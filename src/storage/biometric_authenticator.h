#pragma once

#include <QString>

namespace WalletCore {

/**
 * @brief Device biometric prompt used to gate key slots
 */
class BiometricAuthenticator {
public:
    enum class Result {
        Success,
        Cancelled,
        Failed
    };

    virtual ~BiometricAuthenticator() = default;

    virtual bool isAvailable() const = 0;
    virtual Result authenticate(const QString& reason) = 0;
};

} // namespace WalletCore
