#pragma once

#include "issuance/issuance_types.h"
#include <QString>
#include <QVector>

namespace WalletCore {

/**
 * @brief Descriptor of one issuance variant
 *
 * IssuanceFlow is the same engine for every variant; only the offer,
 * client registration and the formats it is willing to store differ.
 */
struct IssuanceProfile {
    QString name;
    QString offerUri;
    QString clientId;
    QString redirectUri;
    QVector<CredentialFormat> acceptedFormats;
    TrustedSchemes trustedSchemes;

    bool accepts(CredentialFormat format) const;
    AuthorizationConfig authorization() const;
};

/**
 * @brief Built-in profiles for the PID demo issuer
 */
namespace IssuanceProfiles {
    const QString PID_CLIENT_ID = "7598ca4c-cc2e-4ff1-a4b4-ed58f249e274";
    const QString PID_REDIRECT_URI = "https://funke.animo.id/redirect";

    // SD-JWT VC and mdoc in one offer
    IssuanceProfile pidSdJwtAndMdoc();
    IssuanceProfile pidSdJwt();
    IssuanceProfile pidMdoc();

    TrustedSchemes pidTrustedSchemes();

    /**
     * @brief Look up a built-in profile by name
     * @return Empty profile (no name) if unknown
     */
    IssuanceProfile byName(const QString& name);
}

} // namespace WalletCore
