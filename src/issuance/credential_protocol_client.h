#pragma once

#include "issuance/issuance_types.h"
#include <QString>
#include <QVector>

namespace WalletCore {

/**
 * @brief OpenID4VCI protocol client used by IssuanceFlow
 *
 * Calls block until the exchange is done. Implementations throw
 * BiometricAuthenticationError when a biometry-protected key could not be
 * used (the flow lets the caller retry); any other exception is fatal for
 * the flow.
 */
class CredentialProtocolClient {
public:
    virtual ~CredentialProtocolClient() = default;

    virtual ResolvedOffer resolveOffer(const ResolveOfferRequest& request) = 0;

    /**
     * @brief Begin authorization at the issuer
     * @return Attributes the user is asked to release
     */
    virtual AccessRights startAuthorization(const ResolvedAuthorizationRequest& authorizationRequest,
                                            const AuthorizationConfig& authorization) = 0;

    /**
     * @brief Complete user presence and exchange the authorization for a token
     * @param pin eID PIN entered by the user
     */
    virtual AccessToken completeAuthorization(const ResolvedAuthorizationRequest& authorizationRequest,
                                              const ResolvedCredentialOffer& credentialOffer,
                                              const QString& pin,
                                              const AuthorizationConfig& authorization) = 0;

    virtual QVector<CredentialRecord> receiveCredentials(const ReceiveCredentialsRequest& request) = 0;
};

} // namespace WalletCore
