#include "issuance/issuance_profile.h"

namespace WalletCore {

namespace {

const char* const PID_ISSUER_OFFER_PREFIX =
    "openid-credential-offer://?credential_offer=%7B%22credential_issuer%22%3A%22https%3A%2F%2F"
    "demo.pid-issuer.bundesdruckerei.de%2Fc%22%2C%22credential_configuration_ids%22%3A%5B";
const char* const PID_ISSUER_OFFER_SUFFIX =
    "%5D%2C%22grants%22%3A%7B%22authorization_code%22%3A%7B%7D%7D%7D";

QString pidOffer(const char* configurationIds)
{
    return QString::fromLatin1(PID_ISSUER_OFFER_PREFIX)
        + QString::fromLatin1(configurationIds)
        + QString::fromLatin1(PID_ISSUER_OFFER_SUFFIX);
}

IssuanceProfile pidProfile(const QString& name, const QString& offerUri,
                           const QVector<CredentialFormat>& formats)
{
    IssuanceProfile profile;
    profile.name = name;
    profile.offerUri = offerUri;
    profile.clientId = IssuanceProfiles::PID_CLIENT_ID;
    profile.redirectUri = IssuanceProfiles::PID_REDIRECT_URI;
    profile.acceptedFormats = formats;
    profile.trustedSchemes = IssuanceProfiles::pidTrustedSchemes();
    return profile;
}

} // namespace

bool IssuanceProfile::accepts(CredentialFormat format) const
{
    return acceptedFormats.contains(format);
}

AuthorizationConfig IssuanceProfile::authorization() const
{
    AuthorizationConfig config;
    config.clientId = clientId;
    config.redirectUri = redirectUri;
    return config;
}

namespace IssuanceProfiles {

TrustedSchemes pidTrustedSchemes()
{
    TrustedSchemes schemes;
    schemes.sdJwtVcVcts = QStringList{
        "https://example.bmi.bund.de/credential/pid/1.0",
        "urn:eu.europa.ec.eudi:pid:1"
    };
    schemes.msoMdocDoctypes = QStringList{ "eu.europa.ec.eudi.pid.1" };
    return schemes;
}

IssuanceProfile pidSdJwtAndMdoc()
{
    return pidProfile("pid-sd-jwt-mdoc",
                      pidOffer("%22pid-sd-jwt%22%2C%20%22pid-mso-mdoc%22"),
                      { CredentialFormat::SdJwtVc, CredentialFormat::Mdoc });
}

IssuanceProfile pidSdJwt()
{
    return pidProfile("pid-sd-jwt",
                      pidOffer("%22pid-sd-jwt%22"),
                      { CredentialFormat::SdJwtVc });
}

IssuanceProfile pidMdoc()
{
    return pidProfile("pid-mdoc",
                      pidOffer("%22pid-mso-mdoc%22"),
                      { CredentialFormat::Mdoc });
}

IssuanceProfile byName(const QString& name)
{
    if (name == "pid-sd-jwt-mdoc") {
        return pidSdJwtAndMdoc();
    }
    if (name == "pid-sd-jwt") {
        return pidSdJwt();
    }
    if (name == "pid-mdoc") {
        return pidMdoc();
    }
    return IssuanceProfile();
}

} // namespace IssuanceProfiles

} // namespace WalletCore
