#include "PassphraseGate.hpp"

#include <QSignalSpy>
#include <QTest>

namespace
{

// Records every answer the gate hands back to the loader
struct AnswerLog
{
    QList<PassphraseGate::Answer> answers;

    PassphraseGate::Resolver resolver()
    {
        return [this](const PassphraseGate::Answer &answer)
        { answers.append(answer); };
    }
};

} // namespace

class PassphraseGateTests : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase()
    {
        qRegisterMetaType<PassphraseGate::Request>();
    }

    void retryScenario()
    {
        PassphraseGate gate;
        AnswerLog log;
        QSignalSpy requests(&gate, &PassphraseGate::requestChanged);
        QSignalSpy opened(&gate, &PassphraseGate::opened);

        const auto session = gate.beginSession();
        QCOMPARE(gate.state(), PassphraseGate::State::Closed);

        QVERIFY(gate.needsPassphrase(
            session, PassphraseGate::Reason::FirstRequest, log.resolver()));
        QCOMPARE(gate.state(), PassphraseGate::State::AwaitingInput);
        QCOMPARE(gate.request().attemptNumber, 1);
        QVERIFY(!gate.request().lastAttemptFailed);
        QCOMPARE(requests.count(), 1);

        QVERIFY(gate.submit("wrong"));
        QCOMPARE(gate.state(), PassphraseGate::State::Verifying);
        QCOMPARE(log.answers.size(), 1);
        QCOMPARE(*log.answers.at(0), QString("wrong"));

        QVERIFY(gate.needsPassphrase(session,
                                     PassphraseGate::Reason::PriorAttemptRejected,
                                     log.resolver()));
        QCOMPARE(gate.request().attemptNumber, 2);
        QVERIFY(gate.request().lastAttemptFailed);
        QCOMPARE(requests.count(), 2);
        const auto second
            = requests.at(1).at(0).value<PassphraseGate::Request>();
        QCOMPARE(second.attemptNumber, 2);
        QVERIFY(second.lastAttemptFailed);

        QVERIFY(gate.submit("right"));
        QCOMPARE(*log.answers.at(1), QString("right"));

        QVERIFY(gate.markOpened(session));
        QCOMPARE(gate.state(), PassphraseGate::State::Open);
        QVERIFY(!gate.hasPendingRequest());
        QCOMPARE(opened.count(), 1);
    }

    void openWithoutPassphrase()
    {
        PassphraseGate gate;
        const auto session = gate.beginSession();
        QVERIFY(gate.markOpened(session));
        QCOMPARE(gate.state(), PassphraseGate::State::Open);

        // Nothing more to ask once open
        AnswerLog log;
        QVERIFY(!gate.needsPassphrase(
            session, PassphraseGate::Reason::FirstRequest, log.resolver()));
        QVERIFY(!gate.markOpened(session));
    }

    void secondSubmitIsIgnored()
    {
        PassphraseGate gate;
        AnswerLog log;
        const auto session = gate.beginSession();
        gate.needsPassphrase(session, PassphraseGate::Reason::FirstRequest,
                             log.resolver());

        QVERIFY(gate.submit("first"));
        QVERIFY(!gate.submit("second"));
        QVERIFY(!gate.cancel());
        QCOMPARE(log.answers.size(), 1);
    }

    void reentrantSubmitIsIgnored()
    {
        PassphraseGate gate;
        bool innerAccepted = true;
        int calls          = 0;
        const auto session = gate.beginSession();
        gate.needsPassphrase(session, PassphraseGate::Reason::FirstRequest,
                             [&](const PassphraseGate::Answer &)
        {
            ++calls;
            innerAccepted = gate.submit("again");
        });

        QVERIFY(gate.submit("pw"));
        QCOMPARE(calls, 1);
        QVERIFY(!innerAccepted);
    }

    void cancelResolvesWithNothing()
    {
        PassphraseGate gate;
        AnswerLog log;
        QSignalSpy cancelled(&gate, &PassphraseGate::cancelled);
        const auto session = gate.beginSession();
        gate.needsPassphrase(session, PassphraseGate::Reason::FirstRequest,
                             log.resolver());

        QVERIFY(gate.cancel());
        QCOMPARE(log.answers.size(), 1);
        QVERIFY(!log.answers.at(0).has_value());
        QCOMPARE(gate.state(), PassphraseGate::State::Closed);
        QCOMPARE(cancelled.count(), 1);
        QVERIFY(!gate.submit("late"));
    }

    void requestWhileAwaitingIsRejected()
    {
        PassphraseGate gate;
        AnswerLog first;
        AnswerLog second;
        const auto session = gate.beginSession();
        QVERIFY(gate.needsPassphrase(
            session, PassphraseGate::Reason::FirstRequest, first.resolver()));
        QVERIFY(!gate.needsPassphrase(
            session, PassphraseGate::Reason::FirstRequest, second.resolver()));
        QCOMPARE(gate.request().attemptNumber, 1);

        gate.submit("pw");
        QCOMPARE(first.answers.size(), 1);
        QVERIFY(second.answers.isEmpty());
    }

    void emptyResolverIsRejected()
    {
        PassphraseGate gate;
        const auto session = gate.beginSession();
        QVERIFY(!gate.needsPassphrase(
            session, PassphraseGate::Reason::FirstRequest, nullptr));
        QCOMPARE(gate.state(), PassphraseGate::State::Closed);
    }

    void newSessionDropsPendingResolver()
    {
        PassphraseGate gate;
        AnswerLog stale;
        const auto first = gate.beginSession();
        gate.needsPassphrase(first, PassphraseGate::Reason::FirstRequest,
                             stale.resolver());

        const auto second = gate.beginSession();
        QVERIFY(second != first);
        QCOMPARE(gate.state(), PassphraseGate::State::Closed);
        QVERIFY(!gate.submit("pw"));
        // The dropped resolver is never called
        QVERIFY(stale.answers.isEmpty());

        // Late callbacks from the old document are ignored
        QVERIFY(!gate.needsPassphrase(
            first, PassphraseGate::Reason::PriorAttemptRejected,
            stale.resolver()));
        QVERIFY(!gate.markOpened(first));
        QVERIFY(gate.markOpened(second));
    }
};

QTEST_GUILESS_MAIN(PassphraseGateTests)
#include "tst_passphrasegate.moc"
