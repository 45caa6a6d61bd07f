#include "issuance/issuance_state_machine.h"
#include <QDebug>
#include <QMutexLocker>

namespace WalletCore {

IssuanceStateMachine::IssuanceStateMachine(QObject* parent)
    : QObject(parent)
    , m_state(IssuanceFlowState::NotStarted)
{
}

IssuanceStateMachine::~IssuanceStateMachine()
{
}

IssuanceFlowState IssuanceStateMachine::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

bool IssuanceStateMachine::isTerminal() const
{
    QMutexLocker locker(&m_mutex);
    return m_state == IssuanceFlowState::Error || m_state == IssuanceFlowState::Done;
}

bool IssuanceStateMachine::isAllowed(IssuanceFlowState from, IssuanceFlowState to)
{
    if (from == to) {
        return true;
    }

    switch (from) {
        case IssuanceFlowState::NotStarted:
            return to == IssuanceFlowState::Authorizing || to == IssuanceFlowState::Error;

        case IssuanceFlowState::Authorizing:
            return to == IssuanceFlowState::AwaitingUserPresence || to == IssuanceFlowState::Error;

        case IssuanceFlowState::AwaitingUserPresence:
            return to == IssuanceFlowState::RetrievingCredential || to == IssuanceFlowState::Error;

        case IssuanceFlowState::RetrievingCredential:
            return to == IssuanceFlowState::Done || to == IssuanceFlowState::Error;

        case IssuanceFlowState::Error:
        case IssuanceFlowState::Done:
            return false;
    }

    return false;
}

bool IssuanceStateMachine::transition(IssuanceFlowState newState)
{
    QMutexLocker locker(&m_mutex);

    IssuanceFlowState oldState = m_state;

    if (!isAllowed(oldState, newState)) {
        qWarning() << "IssuanceStateMachine: Invalid transition:"
                   << issuanceFlowStateToString(oldState) << "->"
                   << issuanceFlowStateToString(newState);
        return false;
    }

    if (oldState == newState) {
        return true;
    }

    m_state = newState;

    qDebug() << "IssuanceStateMachine: State transition:"
             << issuanceFlowStateToString(oldState) << "->"
             << issuanceFlowStateToString(newState);

    // Emit without the lock so slots may query state()
    locker.unlock();
    emit stateChanged(oldState, newState);

    return true;
}

} // namespace WalletCore
