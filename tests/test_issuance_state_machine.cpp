#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include "issuance/issuance_state_machine.h"

using namespace WalletCore;

class TestIssuanceStateMachine : public QObject
{
    Q_OBJECT

private:
    void advanceToRetrieving(IssuanceStateMachine& sm)
    {
        QVERIFY(sm.transition(IssuanceFlowState::Authorizing));
        QVERIFY(sm.transition(IssuanceFlowState::AwaitingUserPresence));
        QVERIFY(sm.transition(IssuanceFlowState::RetrievingCredential));
    }

private slots:
    void initTestCase()
    {
        qRegisterMetaType<IssuanceFlowState>("WalletCore::IssuanceFlowState");
    }

    void testInitialState()
    {
        IssuanceStateMachine sm;
        QCOMPARE(sm.state(), IssuanceFlowState::NotStarted);
        QVERIFY(!sm.isTerminal());
    }

    void testHappyPath()
    {
        IssuanceStateMachine sm;

        QVERIFY(sm.transition(IssuanceFlowState::Authorizing));
        QCOMPARE(sm.state(), IssuanceFlowState::Authorizing);

        QVERIFY(sm.transition(IssuanceFlowState::AwaitingUserPresence));
        QCOMPARE(sm.state(), IssuanceFlowState::AwaitingUserPresence);

        QVERIFY(sm.transition(IssuanceFlowState::RetrievingCredential));
        QCOMPARE(sm.state(), IssuanceFlowState::RetrievingCredential);

        QVERIFY(sm.transition(IssuanceFlowState::Done));
        QCOMPARE(sm.state(), IssuanceFlowState::Done);
        QVERIFY(sm.isTerminal());
    }

    void testInvalidTransitions()
    {
        IssuanceStateMachine sm;

        // No skipping ahead
        QVERIFY(!sm.transition(IssuanceFlowState::RetrievingCredential));
        QCOMPARE(sm.state(), IssuanceFlowState::NotStarted);

        QVERIFY(!sm.transition(IssuanceFlowState::Done));
        QCOMPARE(sm.state(), IssuanceFlowState::NotStarted);

        QVERIFY(sm.transition(IssuanceFlowState::Authorizing));

        // No going back
        QVERIFY(!sm.transition(IssuanceFlowState::NotStarted));
        QCOMPARE(sm.state(), IssuanceFlowState::Authorizing);
    }

    void testErrorFromEveryActivePhase_data()
    {
        QTest::addColumn<int>("steps");

        QTest::newRow("not-started") << 0;
        QTest::newRow("authorizing") << 1;
        QTest::newRow("id-card-auth") << 2;
        QTest::newRow("retrieve-credential") << 3;
    }

    void testErrorFromEveryActivePhase()
    {
        QFETCH(int, steps);

        const IssuanceFlowState path[] = {
            IssuanceFlowState::Authorizing,
            IssuanceFlowState::AwaitingUserPresence,
            IssuanceFlowState::RetrievingCredential
        };

        IssuanceStateMachine sm;
        for (int i = 0; i < steps; ++i) {
            QVERIFY(sm.transition(path[i]));
        }

        QVERIFY(sm.transition(IssuanceFlowState::Error));
        QCOMPARE(sm.state(), IssuanceFlowState::Error);
    }

    void testTerminalStates()
    {
        IssuanceStateMachine sm;
        advanceToRetrieving(sm);
        QVERIFY(sm.transition(IssuanceFlowState::Error));

        QVERIFY(!sm.transition(IssuanceFlowState::Done));
        QVERIFY(!sm.transition(IssuanceFlowState::NotStarted));
        QCOMPARE(sm.state(), IssuanceFlowState::Error);

        QVERIFY(!IssuanceStateMachine::isAllowed(IssuanceFlowState::Done, IssuanceFlowState::Error));
    }

    void testSameStateTransition()
    {
        IssuanceStateMachine sm;
        QSignalSpy spy(&sm, &IssuanceStateMachine::stateChanged);

        QVERIFY(sm.transition(IssuanceFlowState::NotStarted));
        QCOMPARE(spy.count(), 0);

        sm.transition(IssuanceFlowState::Authorizing);
        QVERIFY(sm.transition(IssuanceFlowState::Authorizing));
        QCOMPARE(spy.count(), 1);
    }

    void testCompletedFlowCannotRestart_data()
    {
        QTest::addColumn<IssuanceFlowState>("terminal");

        QTest::newRow("done") << IssuanceFlowState::Done;
        QTest::newRow("error") << IssuanceFlowState::Error;
    }

    void testCompletedFlowCannotRestart()
    {
        QFETCH(IssuanceFlowState, terminal);

        IssuanceStateMachine sm;
        advanceToRetrieving(sm);
        QVERIFY(sm.transition(terminal));

        QSignalSpy spy(&sm, &IssuanceStateMachine::stateChanged);

        const IssuanceFlowState others[] = {
            IssuanceFlowState::NotStarted,
            IssuanceFlowState::Authorizing,
            IssuanceFlowState::AwaitingUserPresence,
            IssuanceFlowState::RetrievingCredential
        };
        for (IssuanceFlowState target : others) {
            QVERIFY(!sm.transition(target));
            QCOMPARE(sm.state(), terminal);
        }

        QVERIFY(sm.isTerminal());
        QCOMPARE(spy.count(), 0);
    }

    void testStateChangedSignal()
    {
        IssuanceStateMachine sm;
        QSignalSpy spy(&sm, &IssuanceStateMachine::stateChanged);

        sm.transition(IssuanceFlowState::Authorizing);

        QCOMPARE(spy.count(), 1);
        QList<QVariant> arguments = spy.takeFirst();
        QCOMPARE(arguments.at(0).value<IssuanceFlowState>(), IssuanceFlowState::NotStarted);
        QCOMPARE(arguments.at(1).value<IssuanceFlowState>(), IssuanceFlowState::Authorizing);
    }

    void testStateNames()
    {
        QCOMPARE(issuanceFlowStateToString(IssuanceFlowState::NotStarted), QString("not-started"));
        QCOMPARE(issuanceFlowStateToString(IssuanceFlowState::AwaitingUserPresence), QString("id-card-auth"));
        QCOMPARE(issuanceFlowStateToString(IssuanceFlowState::RetrievingCredential), QString("retrieve-credential"));
        QCOMPARE(issuanceFlowStateToString(IssuanceFlowState::Done), QString("done"));
    }

    void testThreadSafety()
    {
        IssuanceStateMachine sm;
        advanceToRetrieving(sm);

        // Completion and failure race; exactly one wins
        QFuture<bool> done = QtConcurrent::run([&sm]() {
            return sm.transition(IssuanceFlowState::Done);
        });

        QFuture<bool> failed = QtConcurrent::run([&sm]() {
            QThread::msleep(10);
            return sm.transition(IssuanceFlowState::Error);
        });

        done.waitForFinished();
        failed.waitForFinished();

        QVERIFY(done.result() != failed.result());
        IssuanceFlowState finalState = sm.state();
        QVERIFY(finalState == IssuanceFlowState::Done ||
                finalState == IssuanceFlowState::Error);
    }
};

QTEST_MAIN(TestIssuanceStateMachine)
#include "test_issuance_state_machine.moc"
