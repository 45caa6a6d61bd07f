#pragma once

#include <QString>
#include <stdexcept>

namespace WalletCore {

/**
 * @brief Raised when an operation is invoked in a state that does not allow it
 *
 * Indicates a caller bug. Never retried.
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const QString& message);
};

/**
 * @brief Failure reported by a wallet key store
 */
class KeychainError : public std::runtime_error {
public:
    enum class Reason {
        UserCancelled,
        WrongPin,
        NotFound,
        BiometricsUnavailable,
        AuthenticationFailed,
        StorageFailure,
        Aborted,
        Other
    };

    KeychainError(Reason reason, const QString& message);

    Reason reason() const { return m_reason; }

private:
    Reason m_reason;
};

QString keychainErrorReasonToString(KeychainError::Reason reason);

/**
 * @brief First-time wallet key setup failed; the unlock state did not advance
 */
class SetupError : public std::runtime_error {
public:
    SetupError(KeychainError::Reason reason, const QString& message);

    KeychainError::Reason reason() const { return m_reason; }

private:
    KeychainError::Reason m_reason;
};

/**
 * @brief Biometric user authentication failed while the protocol client
 * accessed a key. Recoverable: the same call may be retried.
 */
class BiometricAuthenticationError : public std::runtime_error {
public:
    explicit BiometricAuthenticationError(const QString& message);
};

/**
 * @brief Fatal failure of a credential issuance flow
 */
class IssuanceError : public std::runtime_error {
public:
    enum class Kind {
        UnsupportedGrant,
        UnexpectedRecordType,
        Protocol
    };

    IssuanceError(Kind kind, const QString& message);

    Kind kind() const { return m_kind; }

private:
    Kind m_kind;
};

} // namespace WalletCore
