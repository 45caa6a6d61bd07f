#pragma once

#include "issuance/issuance_types.h"
#include <QMutex>
#include <QObject>

namespace WalletCore {

/**
 * @brief Thread-safe transition table for IssuanceFlowState
 *
 * NotStarted           -> Authorizing | Error
 * Authorizing          -> AwaitingUserPresence | Error
 * AwaitingUserPresence -> RetrievingCredential | Error
 * RetrievingCredential -> Done | Error
 * Error, Done          -> (terminal)
 */
class IssuanceStateMachine : public QObject {
    Q_OBJECT

public:
    explicit IssuanceStateMachine(QObject* parent = nullptr);
    ~IssuanceStateMachine() override;

    IssuanceFlowState state() const;

    /**
     * @brief Move to newState if the table allows it
     * @return false if the transition is invalid (state unchanged).
     *         A transition to the current state is a no-op returning true.
     */
    bool transition(IssuanceFlowState newState);

    bool isTerminal() const;

    static bool isAllowed(IssuanceFlowState from, IssuanceFlowState to);

signals:
    void stateChanged(WalletCore::IssuanceFlowState oldState, WalletCore::IssuanceFlowState newState);

private:
    IssuanceFlowState m_state;
    mutable QMutex m_mutex;
};

} // namespace WalletCore
