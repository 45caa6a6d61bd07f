#include "issuance/issuance_types.h"

namespace WalletCore {

QString issuanceFlowStateToString(IssuanceFlowState state)
{
    switch (state) {
        case IssuanceFlowState::NotStarted:
            return "not-started";
        case IssuanceFlowState::Authorizing:
            return "authorizing";
        case IssuanceFlowState::AwaitingUserPresence:
            return "id-card-auth";
        case IssuanceFlowState::RetrievingCredential:
            return "retrieve-credential";
        case IssuanceFlowState::Error:
            return "error";
        case IssuanceFlowState::Done:
            return "done";
    }
    return "unknown";
}

QString credentialFormatToRecordType(CredentialFormat format)
{
    switch (format) {
        case CredentialFormat::SdJwtVc:
            return "SdJwtVcRecord";
        case CredentialFormat::Mdoc:
            return "MdocRecord";
        case CredentialFormat::W3cVc:
            return "W3cCredentialRecord";
        case CredentialFormat::Unknown:
            break;
    }
    return "UnknownRecord";
}

CredentialFormat credentialFormatFromRecordType(const QString& recordType)
{
    if (recordType == "SdJwtVcRecord") {
        return CredentialFormat::SdJwtVc;
    }
    if (recordType == "MdocRecord") {
        return CredentialFormat::Mdoc;
    }
    if (recordType == "W3cCredentialRecord") {
        return CredentialFormat::W3cVc;
    }
    return CredentialFormat::Unknown;
}

QStringList ResolvedCredentialOffer::credentialConfigurationIds() const
{
    QStringList ids;
    for (const OfferedCredential& credential : offeredCredentials) {
        ids.append(credential.id);
    }
    return ids;
}

} // namespace WalletCore
