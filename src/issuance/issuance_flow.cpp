#include "issuance/issuance_flow.h"
#include "issuance/credential_protocol_client.h"
#include "issuance/issuance_state_machine.h"
#include "errors.h"
#include <QDebug>
#include <QMutexLocker>

namespace WalletCore {

IssuanceFlow::InitializeResult IssuanceFlow::initialize(const IssuanceFlowOptions& options)
{
    if (!options.client) {
        qCritical() << "IssuanceFlow: No protocol client given";
        throw ContractViolation("IssuanceFlow requires a credential protocol client");
    }

    qDebug() << "IssuanceFlow: Resolving offer for profile" << options.profile.name;

    ResolveOfferRequest request;
    request.offerUri = options.profile.offerUri;
    request.authorization = options.profile.authorization();

    ResolvedOffer resolved;
    try {
        resolved = options.client->resolveOffer(request);
    } catch (const IssuanceError&) {
        throw;
    } catch (const std::exception& e) {
        qWarning() << "IssuanceFlow: Failed to resolve offer:" << e.what();
        throw IssuanceError(IssuanceError::Kind::Protocol,
                            QString("Failed to resolve credential offer: %1").arg(QString::fromUtf8(e.what())));
    }

    if (!resolved.authorizationRequest) {
        qWarning() << "IssuanceFlow: Offer has no authorization-code grant";
        throw IssuanceError(IssuanceError::Kind::UnsupportedGrant,
                            "Credential offer does not support the authorization code grant");
    }

    std::unique_ptr<IssuanceFlow> flow(new IssuanceFlow(options, resolved));
    flow->startAuthFlow();
    flow->setState(IssuanceFlowState::AwaitingUserPresence);

    InitializeResult result;
    result.accessRights = flow->accessRights();
    result.flow = std::move(flow);
    return result;
}

IssuanceFlow::IssuanceFlow(const IssuanceFlowOptions& options, const ResolvedOffer& resolvedOffer)
    : QObject(nullptr)
    , m_client(options.client)
    , m_profile(options.profile)
    , m_onStateChange(options.onStateChange)
    , m_stateMachine(new IssuanceStateMachine(this))
    , m_authorizationRequest(*resolvedOffer.authorizationRequest)
    , m_credentialOffer(resolvedOffer.credentialOffer)
{
    qDebug() << "IssuanceFlow: Created for issuer" << m_credentialOffer.credentialIssuer
             << "offering" << m_credentialOffer.credentialConfigurationIds();
}

IssuanceFlow::~IssuanceFlow()
{
    qDebug() << "IssuanceFlow: Destroyed in state" << issuanceFlowStateToString(state());
}

IssuanceFlowState IssuanceFlow::state() const
{
    return m_stateMachine->state();
}

AccessRights IssuanceFlow::accessRights() const
{
    QMutexLocker locker(&m_mutex);
    return m_accessRights;
}

QString IssuanceFlow::lastError() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

AccessToken IssuanceFlow::accessToken() const
{
    assertState(IssuanceFlowState::RetrievingCredential, "accessToken");
    QMutexLocker locker(&m_mutex);
    return m_accessToken;
}

ResolvedCredentialOffer IssuanceFlow::resolvedCredentialOffer() const
{
    assertState(IssuanceFlowState::RetrievingCredential, "resolvedCredentialOffer");
    QMutexLocker locker(&m_mutex);
    return m_credentialOffer;
}

QVector<CredentialRecord> IssuanceFlow::credentials() const
{
    assertState(IssuanceFlowState::Done, "credentials");
    QMutexLocker locker(&m_mutex);
    return m_credentials;
}

// ============================================================================
// Phases
// ============================================================================

void IssuanceFlow::startAuthFlow()
{
    assertState(IssuanceFlowState::NotStarted, "startAuthFlow");
    setState(IssuanceFlowState::Authorizing);

    AccessRights rights;
    try {
        rights = m_client->startAuthorization(m_authorizationRequest, m_profile.authorization());
    } catch (const std::exception& e) {
        QString error = QString("Failed to start authorization: %1").arg(QString::fromUtf8(e.what()));
        handleError(error);
        throw IssuanceError(IssuanceError::Kind::Protocol, error);
    }

    qDebug() << "IssuanceFlow: Authorization started, requested attributes:"
             << rights.requestedAttributes;

    QMutexLocker locker(&m_mutex);
    m_accessRights = rights;
}

void IssuanceFlow::acceptAuthorizationRequest(const QString& pin)
{
    assertState(IssuanceFlowState::AwaitingUserPresence, "acceptAuthorizationRequest");

    qDebug() << "IssuanceFlow: Completing authorization";

    AccessToken token;
    try {
        token = m_client->completeAuthorization(m_authorizationRequest, m_credentialOffer,
                                                pin, m_profile.authorization());
    } catch (const std::exception& e) {
        QString error = QString("Failed to complete authorization: %1").arg(QString::fromUtf8(e.what()));
        handleError(error);
        throw IssuanceError(IssuanceError::Kind::Protocol, error);
    }

    if (!token.isValid()) {
        QString error("Issuer returned an empty access token");
        handleError(error);
        throw IssuanceError(IssuanceError::Kind::Protocol, error);
    }

    {
        QMutexLocker locker(&m_mutex);
        m_accessToken = token;
    }

    setState(IssuanceFlowState::RetrievingCredential);
}

RetrievalResult IssuanceFlow::retrieveCredentials()
{
    assertState(IssuanceFlowState::RetrievingCredential, "retrieveCredentials");

    ReceiveCredentialsRequest request;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_accessToken.isValid()) {
            qCritical() << "IssuanceFlow: retrieveCredentials() without an access token";
            throw ContractViolation("No access token available for credential retrieval");
        }
        request.accessToken = m_accessToken;
        request.credentialOffer = m_credentialOffer;
        request.credentialConfigurationIds = m_credentialOffer.credentialConfigurationIds();
    }
    request.clientId = m_profile.clientId;
    request.trustedSchemes = m_profile.trustedSchemes;

    qDebug() << "IssuanceFlow: Requesting credentials" << request.credentialConfigurationIds;

    QVector<CredentialRecord> records;
    try {
        records = m_client->receiveCredentials(request);
    } catch (const BiometricAuthenticationError& e) {
        qWarning() << "IssuanceFlow: Biometric authentication failed, retry possible:" << e.what();
        RetrievalResult result;
        result.status = RetrievalResult::Status::RetryableBiometricFailure;
        result.error = QString::fromUtf8(e.what());
        return result;
    } catch (const IssuanceError& e) {
        handleError(QString::fromUtf8(e.what()));
        throw;
    } catch (const std::exception& e) {
        QString error = QString("Failed to receive credentials: %1").arg(QString::fromUtf8(e.what()));
        handleError(error);
        throw IssuanceError(IssuanceError::Kind::Protocol, error);
    }

    for (const CredentialRecord& record : records) {
        if (!m_profile.accepts(record.format)) {
            QString error = QString("Unexpected credential record type %1 for %2")
                                .arg(credentialFormatToRecordType(record.format),
                                     record.credentialConfigurationId);
            handleError(error);
            throw IssuanceError(IssuanceError::Kind::UnexpectedRecordType, error);
        }
    }

    qDebug() << "IssuanceFlow: Received" << records.size() << "credential(s)";

    {
        QMutexLocker locker(&m_mutex);
        m_credentials = records;
    }
    setState(IssuanceFlowState::Done);

    RetrievalResult result;
    result.status = RetrievalResult::Status::Completed;
    result.credentials = records;
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

void IssuanceFlow::assertState(IssuanceFlowState expected, const char* operation) const
{
    IssuanceFlowState current = state();
    if (current != expected) {
        QString message = QString("%1 requires state %2, flow is in %3")
                              .arg(QString::fromLatin1(operation),
                                   issuanceFlowStateToString(expected),
                                   issuanceFlowStateToString(current));
        qCritical() << "IssuanceFlow:" << message;
        throw ContractViolation(message);
    }
}

void IssuanceFlow::handleError(const QString& error)
{
    qCritical() << "IssuanceFlow: Flow failed:" << error;

    {
        QMutexLocker locker(&m_mutex);
        m_lastError = error;
    }

    if (!m_stateMachine->transition(IssuanceFlowState::Error)) {
        return;
    }

    if (m_onStateChange) {
        m_onStateChange(IssuanceFlowState::Error);
    }
    emit stateChanged(IssuanceFlowState::Error);
    emit flowError(error);
}

void IssuanceFlow::setState(IssuanceFlowState newState)
{
    IssuanceFlowState oldState = state();
    if (oldState == newState) {
        return;
    }

    if (!m_stateMachine->transition(newState)) {
        QString message = QString("Invalid issuance transition %1 -> %2")
                              .arg(issuanceFlowStateToString(oldState),
                                   issuanceFlowStateToString(newState));
        qCritical() << "IssuanceFlow:" << message;
        throw ContractViolation(message);
    }

    if (m_onStateChange) {
        m_onStateChange(newState);
    }
    emit stateChanged(newState);
}

} // namespace WalletCore
