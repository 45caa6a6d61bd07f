#include "errors.h"

namespace WalletCore {

ContractViolation::ContractViolation(const QString& message)
    : std::logic_error(message.toStdString())
{
}

KeychainError::KeychainError(Reason reason, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_reason(reason)
{
}

QString keychainErrorReasonToString(KeychainError::Reason reason)
{
    switch (reason) {
        case KeychainError::Reason::UserCancelled:
            return "userCancelled";
        case KeychainError::Reason::WrongPin:
            return "wrongPin";
        case KeychainError::Reason::NotFound:
            return "notFound";
        case KeychainError::Reason::BiometricsUnavailable:
            return "biometricsUnavailable";
        case KeychainError::Reason::AuthenticationFailed:
            return "authenticationFailed";
        case KeychainError::Reason::StorageFailure:
            return "storageFailure";
        case KeychainError::Reason::Aborted:
            return "aborted";
        case KeychainError::Reason::Other:
            return "other";
    }
    return "other";
}

SetupError::SetupError(KeychainError::Reason reason, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_reason(reason)
{
}

BiometricAuthenticationError::BiometricAuthenticationError(const QString& message)
    : std::runtime_error(message.toStdString())
{
}

IssuanceError::IssuanceError(Kind kind, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_kind(kind)
{
}

} // namespace WalletCore
