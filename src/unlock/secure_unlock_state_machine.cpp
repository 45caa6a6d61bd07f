#include "unlock/secure_unlock_state_machine.h"
#include "storage/wallet_key_store.h"
#include <QDebug>
#include <QMetaObject>
#include <QScopeGuard>
#include <optional>
#include <utility>

namespace WalletCore {

SecureUnlockStateMachine::SecureUnlockStateMachine(WalletKeyStore* store, QObject* parent)
    : SecureUnlockStateMachine(store, UnlockPolicy(), parent)
{
}

SecureUnlockStateMachine::SecureUnlockStateMachine(WalletKeyStore* store, const UnlockPolicy& policy, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_policy(policy)
    , m_state(UnlockState::Initializing)
    , m_unlockMethod(UnlockMethod::Pin)
    , m_canUseBiometrics(false)
    , m_canTryBiometrics(false)
    , m_biometricAttempts(0)
    , m_isUnlocking(false)
    , m_initializing(false)
    , m_generation(0)
{
    if (!m_store) {
        throw ContractViolation("SecureUnlockStateMachine requires a wallet key store");
    }

    qDebug() << "SecureUnlockStateMachine: Created, max biometric attempts:"
             << m_policy.maxBiometricAttempts;

    if (m_policy.autoInitialize) {
        scheduleInitialize();
    }
}

SecureUnlockStateMachine::~SecureUnlockStateMachine()
{
    QMutexLocker locker(&m_mutex);
    wipeSecretsLocked();
    qDebug() << "SecureUnlockStateMachine: Destroyed";
}

UnlockState SecureUnlockStateMachine::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

UnlockStatus SecureUnlockStateMachine::status() const
{
    QMutexLocker locker(&m_mutex);

    switch (m_state) {
        case UnlockState::Initializing:
            return InitializingStatus{};
        case UnlockState::NotConfigured:
            return NotConfiguredStatus{};
        case UnlockState::Locked:
            return LockedStatus{m_canTryBiometrics, m_isUnlocking};
        case UnlockState::KeyAcquired:
            return KeyAcquiredStatus{m_unlockMethod};
        case UnlockState::Unlocked:
            return UnlockedStatus{m_unlockMethod, m_context};
    }

    return InitializingStatus{};
}

// ============================================================================
// Operations
// ============================================================================

void SecureUnlockStateMachine::initialize()
{
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (m_state != UnlockState::Initializing) {
            qDebug() << "SecureUnlockStateMachine: initialize() ignored in state"
                     << unlockStateToString(m_state);
            return;
        }
        if (m_initializing) {
            qDebug() << "SecureUnlockStateMachine: Initialization already running";
            return;
        }
        m_initializing = true;
        generation = m_generation;
    }

    auto resetInitializing = qScopeGuard([this, generation] {
        QMutexLocker locker(&m_mutex);
        if (generation == m_generation) {
            m_initializing = false;
        }
    });

    qDebug() << "SecureUnlockStateMachine: Detecting salt and biometric capability...";

    const int version = m_store->getWalletKeyVersion();
    const bool hasSalt = m_store->getSalt(version).has_value();
    const bool canUseBiometrics = m_store->canUseBiometryBackedWalletKey();

    QMutexLocker locker(&m_mutex);
    if (generation != m_generation) {
        qDebug() << "SecureUnlockStateMachine: Discarding stale initialization result";
        return;
    }

    m_initializing = false;
    m_canUseBiometrics = canUseBiometrics;
    m_canTryBiometrics = canUseBiometrics;

    qDebug() << "SecureUnlockStateMachine: Salt found:" << hasSalt
             << "biometrics available:" << canUseBiometrics;

    applyState(hasSalt ? UnlockState::Locked : UnlockState::NotConfigured, locker);
    emit biometricsAvailabilityChanged(canUseBiometrics);
}

const WalletKey& SecureUnlockStateMachine::setup(const QString& pin)
{
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        requireState(UnlockState::NotConfigured, "setup");
        generation = m_generation;
    }

    qDebug() << "SecureUnlockStateMachine: Setting up wallet key";

    WalletKey key;
    try {
        const int version = m_store->getWalletKeyVersion();
        m_store->createAndStoreSalt(true, version);
        key = m_store->getWalletKeyUsingPin(pin, version);
    } catch (const KeychainError& e) {
        qCritical() << "SecureUnlockStateMachine: Setup failed:"
                    << keychainErrorReasonToString(e.reason()) << e.what();
        throw SetupError(e.reason(), QString("Failed to set up wallet key: %1").arg(QString::fromUtf8(e.what())));
    } catch (const std::exception& e) {
        qCritical() << "SecureUnlockStateMachine: Setup failed:" << e.what();
        throw SetupError(KeychainError::Reason::Other,
                         QString("Failed to set up wallet key: %1").arg(QString::fromUtf8(e.what())));
    }

    if (key.isEmpty()) {
        qCritical() << "SecureUnlockStateMachine: Store returned an empty wallet key";
        throw SetupError(KeychainError::Reason::Other, "Store returned an empty wallet key");
    }

    QMutexLocker locker(&m_mutex);
    if (generation != m_generation || m_state != UnlockState::NotConfigured) {
        throw SetupError(KeychainError::Reason::Aborted, "Session was reinitialized during setup");
    }

    m_walletKey = std::move(key);
    m_unlockMethod = UnlockMethod::Pin;
    applyState(UnlockState::KeyAcquired, locker);
    return m_walletKey;
}

const WalletKey& SecureUnlockStateMachine::unlockUsingPin(const QString& pin)
{
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        requireState(UnlockState::Locked, "unlockUsingPin");
        m_isUnlocking = true;
        generation = m_generation;
    }
    emit unlockingChanged(true);

    auto resetUnlocking = qScopeGuard([this, generation] { finishUnlocking(generation); });

    qDebug() << "SecureUnlockStateMachine: Unlocking using PIN";

    WalletKey key;
    try {
        key = m_store->getWalletKeyUsingPin(pin, m_store->getWalletKeyVersion());
    } catch (const KeychainError& e) {
        qWarning() << "SecureUnlockStateMachine: PIN unlock failed:"
                   << keychainErrorReasonToString(e.reason());
        throw;
    }

    if (key.isEmpty()) {
        throw KeychainError(KeychainError::Reason::Other, "Store returned an empty wallet key");
    }

    QMutexLocker locker(&m_mutex);
    if (generation != m_generation || m_state != UnlockState::Locked) {
        throw KeychainError(KeychainError::Reason::Aborted, "Session was reinitialized during PIN unlock");
    }

    m_isUnlocking = false;
    m_walletKey = std::move(key);
    m_unlockMethod = UnlockMethod::Pin;
    applyState(UnlockState::KeyAcquired, locker);
    return m_walletKey;
}

BiometricUnlockResult SecureUnlockStateMachine::tryUnlockingUsingBiometrics()
{
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        requireState(UnlockState::Locked, "tryUnlockingUsingBiometrics");

        if (!m_canTryBiometrics) {
            qDebug() << "SecureUnlockStateMachine: Biometric unlock not allowed";
            return BiometricUnlockResult::NotAllowed;
        }

        ++m_biometricAttempts;
        m_isUnlocking = true;
        generation = m_generation;

        qDebug() << "SecureUnlockStateMachine: Biometric unlock attempt" << m_biometricAttempts;
    }
    emit unlockingChanged(true);

    auto resetUnlocking = qScopeGuard([this, generation] { finishUnlocking(generation); });

    std::optional<WalletKey> key;
    try {
        key = m_store->getWalletKeyUsingBiometrics(m_store->getWalletKeyVersion());
    } catch (const KeychainError& e) {
        return handleBiometricFailure(generation, e.reason(), QString::fromUtf8(e.what()));
    } catch (const std::exception& e) {
        return handleBiometricFailure(generation, KeychainError::Reason::Other, QString::fromUtf8(e.what()));
    }

    QMutexLocker locker(&m_mutex);
    if (generation != m_generation || m_state != UnlockState::Locked) {
        throw KeychainError(KeychainError::Reason::Aborted, "Session was reinitialized during biometric unlock");
    }

    m_isUnlocking = false;

    if (!key || key->isEmpty()) {
        qDebug() << "SecureUnlockStateMachine: No biometry-backed wallet key stored";
        return BiometricUnlockResult::NoStoredKey;
    }

    m_walletKey = std::move(*key);
    m_unlockMethod = UnlockMethod::Biometrics;
    applyState(UnlockState::KeyAcquired, locker);
    return BiometricUnlockResult::Unlocked;
}

void SecureUnlockStateMachine::setWalletKeyValid(const QVariantMap& context, const UnlockOptions& options)
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::KeyAcquired, "setWalletKeyValid");

    if (m_canUseBiometrics && options.enableBiometrics) {
        // Own copy, reinitialize() may wipe m_walletKey while the store writes
        WalletKey pending(QByteArray(m_walletKey.bytes().constData(), m_walletKey.size()));
        const quint64 generation = m_generation;
        locker.unlock();

        qDebug() << "SecureUnlockStateMachine: Persisting wallet key for biometric unlock";
        m_store->storeWalletKey(pending, m_store->getWalletKeyVersion());

        locker.relock();
        if (generation != m_generation || m_state != UnlockState::KeyAcquired) {
            throw KeychainError(KeychainError::Reason::Aborted,
                                "Session changed while persisting the wallet key");
        }
    }

    m_context = context;
    applyState(UnlockState::Unlocked, locker);
}

void SecureUnlockStateMachine::setWalletKeyInvalid()
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::KeyAcquired, "setWalletKeyInvalid");

    bool revoked = false;
    if (m_unlockMethod == UnlockMethod::Biometrics && m_canTryBiometrics) {
        m_canTryBiometrics = false;
        revoked = true;
    }

    qWarning() << "SecureUnlockStateMachine: Wallet key rejected, acquired using"
               << unlockMethodToString(m_unlockMethod);

    wipeSecretsLocked();
    applyState(UnlockState::Locked, locker);

    if (revoked) {
        emit biometricsAvailabilityChanged(false);
    }
}

void SecureUnlockStateMachine::lock()
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::Unlocked, "lock");

    wipeSecretsLocked();
    applyState(UnlockState::Locked, locker);
}

void SecureUnlockStateMachine::reinitialize()
{
    QMutexLocker locker(&m_mutex);

    qDebug() << "SecureUnlockStateMachine: Reinitializing from state" << unlockStateToString(m_state);

    const bool wasUnlocking = m_isUnlocking;

    wipeSecretsLocked();
    m_canUseBiometrics = false;
    m_canTryBiometrics = false;
    m_biometricAttempts = 0;
    m_isUnlocking = false;
    m_initializing = false;
    ++m_generation;

    applyState(UnlockState::Initializing, locker);

    if (wasUnlocking) {
        emit unlockingChanged(false);
    }

    if (m_policy.autoInitialize) {
        scheduleInitialize();
    }
}

// ============================================================================
// State-specific accessors
// ============================================================================

bool SecureUnlockStateMachine::isUnlocking() const
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::Locked, "isUnlocking");
    return m_isUnlocking;
}

bool SecureUnlockStateMachine::canTryUnlockingUsingBiometrics() const
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::Locked, "canTryUnlockingUsingBiometrics");
    return m_canTryBiometrics;
}

const WalletKey& SecureUnlockStateMachine::walletKey() const
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::KeyAcquired, "walletKey");
    return m_walletKey;
}

UnlockMethod SecureUnlockStateMachine::unlockMethod() const
{
    QMutexLocker locker(&m_mutex);
    requireAnyState(UnlockState::KeyAcquired, UnlockState::Unlocked, "unlockMethod");
    return m_unlockMethod;
}

QVariantMap SecureUnlockStateMachine::context() const
{
    QMutexLocker locker(&m_mutex);
    requireState(UnlockState::Unlocked, "context");
    return m_context;
}

bool SecureUnlockStateMachine::canUseBiometrics() const
{
    QMutexLocker locker(&m_mutex);
    return m_canUseBiometrics;
}

int SecureUnlockStateMachine::biometricAttempts() const
{
    QMutexLocker locker(&m_mutex);
    return m_biometricAttempts;
}

// ============================================================================
// Internals
// ============================================================================

void SecureUnlockStateMachine::autoInitialize()
{
    try {
        initialize();
    } catch (const std::exception& e) {
        qWarning() << "SecureUnlockStateMachine: Automatic initialization failed:" << e.what();
        emit initializationFailed(QString::fromUtf8(e.what()));
    }
}

void SecureUnlockStateMachine::scheduleInitialize()
{
    QMetaObject::invokeMethod(this, &SecureUnlockStateMachine::autoInitialize, Qt::QueuedConnection);
}

void SecureUnlockStateMachine::requireState(UnlockState expected, const char* operation) const
{
    if (m_state == expected) {
        return;
    }

    QString message = QString("%1() requires state %2, current state is %3")
                          .arg(QString::fromLatin1(operation),
                               unlockStateToString(expected),
                               unlockStateToString(m_state));
    qCritical() << "SecureUnlockStateMachine: Contract violation:" << message;
    throw ContractViolation(message);
}

void SecureUnlockStateMachine::requireAnyState(UnlockState first, UnlockState second, const char* operation) const
{
    if (m_state == first || m_state == second) {
        return;
    }

    QString message = QString("%1() requires state %2 or %3, current state is %4")
                          .arg(QString::fromLatin1(operation),
                               unlockStateToString(first),
                               unlockStateToString(second),
                               unlockStateToString(m_state));
    qCritical() << "SecureUnlockStateMachine: Contract violation:" << message;
    throw ContractViolation(message);
}

void SecureUnlockStateMachine::applyState(UnlockState newState, QMutexLocker<QMutex>& locker)
{
    UnlockState oldState = m_state;
    if (oldState == newState) {
        locker.unlock();
        return;
    }

    m_state = newState;

    qDebug() << "SecureUnlockStateMachine: State transition:"
             << unlockStateToString(oldState) << "->" << unlockStateToString(newState);

    locker.unlock();
    emit stateChanged(newState, oldState);
}

BiometricUnlockResult SecureUnlockStateMachine::handleBiometricFailure(quint64 generation,
                                                                       KeychainError::Reason reason,
                                                                       const QString& message)
{
    BiometricUnlockResult result = BiometricUnlockResult::Failed;
    bool revoked = false;
    int attempts = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (generation != m_generation) {
            throw KeychainError(KeychainError::Reason::Aborted, "Session was reinitialized during biometric unlock");
        }

        attempts = m_biometricAttempts;

        if (reason == KeychainError::Reason::UserCancelled) {
            // No further biometric prompts for this session once the user declined
            result = BiometricUnlockResult::Cancelled;
            revoked = m_canTryBiometrics;
            m_canTryBiometrics = false;
        } else if (m_biometricAttempts > m_policy.maxBiometricAttempts && m_canTryBiometrics) {
            m_canTryBiometrics = false;
            revoked = true;
        }

        m_isUnlocking = false;
    }

    const QString reasonString = keychainErrorReasonToString(reason);
    qWarning() << "SecureUnlockStateMachine: Biometric unlock failed:" << reasonString
               << "attempt:" << attempts << "revoked:" << revoked;

    emit biometricUnlockFailed(reasonString, message);
    if (revoked) {
        emit biometricsAvailabilityChanged(false);
    }

    return result;
}

void SecureUnlockStateMachine::finishUnlocking(quint64 generation)
{
    {
        QMutexLocker locker(&m_mutex);
        if (generation != m_generation) {
            return; // reinitialize() already reset the flag
        }
        m_isUnlocking = false;
    }
    emit unlockingChanged(false);
}

void SecureUnlockStateMachine::wipeSecretsLocked()
{
    m_walletKey.clear();
    m_context.clear();
    m_unlockMethod = UnlockMethod::Pin;
}

} // namespace WalletCore
