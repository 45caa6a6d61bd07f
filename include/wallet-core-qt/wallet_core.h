#pragma once

/**
 * @file wallet_core.h
 * @brief Public entry point of the wallet core
 *
 * Pulls in the unlock state machine, the key store contracts and the
 * credential issuance flow.
 */

#define WALLET_CORE_QT_VERSION_MAJOR 0
#define WALLET_CORE_QT_VERSION_MINOR 1
#define WALLET_CORE_QT_VERSION_PATCH 0
#define WALLET_CORE_QT_VERSION_STRING "0.1.0"

#include "errors.h"
#include "config/wallet_config.h"
#include "logging/log_handler.h"
#include "storage/biometric_authenticator.h"
#include "storage/wallet_key_store.h"
#include "storage/file_wallet_key_store.h"
#include "unlock/wallet_key.h"
#include "unlock/unlock_types.h"
#include "unlock/secure_unlock_state_machine.h"
#include "issuance/issuance_types.h"
#include "issuance/credential_protocol_client.h"
#include "issuance/issuance_profile.h"
#include "issuance/issuance_state_machine.h"
#include "issuance/issuance_flow.h"
