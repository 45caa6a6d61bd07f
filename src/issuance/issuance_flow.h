#pragma once

#include "issuance/issuance_profile.h"
#include "issuance/issuance_types.h"
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>

namespace WalletCore {

class CredentialProtocolClient;
class IssuanceStateMachine;

struct IssuanceFlowOptions {
    CredentialProtocolClient* client = nullptr;
    IssuanceProfile profile = IssuanceProfiles::pidSdJwtAndMdoc();
    // Called on every phase change, on the thread that drives the flow
    std::function<void(IssuanceFlowState)> onStateChange;
};

/**
 * @brief One-shot OpenID4VCI authorization-code issuance
 *
 * Created by initialize(), which leaves the flow waiting for user presence.
 * The caller then drives it with acceptAuthorizationRequest() and
 * retrieveCredentials(). Every operation is valid in exactly one phase;
 * calling it in another throws ContractViolation without touching the client.
 *
 * Fatal failures move the flow to Error and are thrown as IssuanceError.
 * A biometric failure during retrieval is not fatal: retrieveCredentials()
 * reports it in its result and may be called again.
 */
class IssuanceFlow : public QObject {
    Q_OBJECT

public:
    struct InitializeResult {
        std::unique_ptr<IssuanceFlow> flow;
        AccessRights accessRights;
    };

    /**
     * @brief Resolve the profile's offer and start authorization
     * @throws IssuanceError(UnsupportedGrant) if the offer has no authorization-code grant
     * @throws IssuanceError(Protocol) if the client fails
     * @throws ContractViolation if options carry no client
     */
    static InitializeResult initialize(const IssuanceFlowOptions& options);

    ~IssuanceFlow() override;

    IssuanceFlowState state() const;
    AccessRights accessRights() const;
    const IssuanceProfile& profile() const { return m_profile; }
    QString lastError() const;

    /**
     * @brief Complete user presence with the eID PIN (AwaitingUserPresence)
     *
     * Exchanges the authorization for an access token and moves to
     * RetrievingCredential.
     * @throws IssuanceError(Protocol) if the client fails (flow moves to Error)
     */
    void acceptAuthorizationRequest(const QString& pin);

    /**
     * @brief Request every offered credential (RetrievingCredential)
     * @throws IssuanceError(UnexpectedRecordType) if a record's format is not accepted
     * @throws IssuanceError(Protocol) on any other client failure
     */
    RetrievalResult retrieveCredentials();

    AccessToken accessToken() const;                          // RetrievingCredential
    ResolvedCredentialOffer resolvedCredentialOffer() const;  // RetrievingCredential
    QVector<CredentialRecord> credentials() const;            // Done

signals:
    void stateChanged(WalletCore::IssuanceFlowState newState);
    void flowError(const QString& error);

private:
    IssuanceFlow(const IssuanceFlowOptions& options, const ResolvedOffer& resolvedOffer);

    void assertState(IssuanceFlowState expected, const char* operation) const;
    void startAuthFlow();
    void handleError(const QString& error);
    void setState(IssuanceFlowState newState);

    CredentialProtocolClient* m_client;
    IssuanceProfile m_profile;
    std::function<void(IssuanceFlowState)> m_onStateChange;
    IssuanceStateMachine* m_stateMachine;

    ResolvedAuthorizationRequest m_authorizationRequest;
    ResolvedCredentialOffer m_credentialOffer;
    AccessRights m_accessRights;
    AccessToken m_accessToken;
    QVector<CredentialRecord> m_credentials;
    QString m_lastError;

    mutable QMutex m_mutex;
};

} // namespace WalletCore
