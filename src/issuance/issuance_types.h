#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace WalletCore {

/**
 * @brief Phases of a credential issuance flow
 *
 * Error and Done are terminal.
 */
enum class IssuanceFlowState {
    NotStarted,
    Authorizing,
    AwaitingUserPresence,   // "id-card-auth"
    RetrievingCredential,   // "retrieve-credential"
    Error,
    Done
};

enum class CredentialFormat {
    SdJwtVc,
    Mdoc,
    W3cVc,
    Unknown
};

QString issuanceFlowStateToString(IssuanceFlowState state);

/**
 * @brief Record type name of a format ("SdJwtVcRecord", "MdocRecord", ...)
 */
QString credentialFormatToRecordType(CredentialFormat format);
CredentialFormat credentialFormatFromRecordType(const QString& recordType);

/**
 * @brief Credential as returned by the issuer
 */
struct CredentialRecord {
    QString id;
    CredentialFormat format = CredentialFormat::Unknown;
    QString credentialConfigurationId;
    QString type;
    QString encoded;
};

struct OfferedCredential {
    QString id;
    CredentialFormat format = CredentialFormat::Unknown;
};

struct ResolvedCredentialOffer {
    QString credentialIssuer;
    QVector<OfferedCredential> offeredCredentials;

    QStringList credentialConfigurationIds() const;
};

struct ResolvedAuthorizationRequest {
    QString authorizationRequestUri;
    QString codeVerifier;
    QString issuerState;
};

/**
 * @brief Result of resolving an offer URI
 *
 * authorizationRequest is empty when the issuer does not offer an
 * authorization-code grant.
 */
struct ResolvedOffer {
    std::optional<ResolvedAuthorizationRequest> authorizationRequest;
    ResolvedCredentialOffer credentialOffer;
};

/**
 * @brief Attributes the issuer asks the user to release
 */
struct AccessRights {
    QStringList requestedAttributes;
};

struct AccessToken {
    QString accessToken;
    QString tokenType;
    QString cNonce;
    int expiresIn = -1;

    bool isValid() const { return !accessToken.isEmpty(); }
};

struct TrustedSchemes {
    QStringList sdJwtVcVcts;
    QStringList msoMdocDoctypes;
};

struct AuthorizationConfig {
    QString clientId;
    QString redirectUri;
};

struct ResolveOfferRequest {
    QString offerUri;
    AuthorizationConfig authorization;
};

struct ReceiveCredentialsRequest {
    AccessToken accessToken;
    ResolvedCredentialOffer credentialOffer;
    QStringList credentialConfigurationIds;
    QString clientId;
    TrustedSchemes trustedSchemes;
};

/**
 * @brief Outcome of IssuanceFlow::retrieveCredentials()
 */
struct RetrievalResult {
    enum class Status {
        Completed,
        RetryableBiometricFailure   // Flow state unchanged, call again
    };

    Status status = Status::Completed;
    QVector<CredentialRecord> credentials;
    QString error;

    bool needsRetry() const { return status == Status::RetryableBiometricFailure; }
};

} // namespace WalletCore

Q_DECLARE_METATYPE(WalletCore::IssuanceFlowState)
