#include <QtTest/QtTest>
#include <QSignalSpy>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Session/MediatorSession.hpp>
#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <mdsync/Transport/ReplayConnection.hpp>

#include "TestDoubles.hpp"

using namespace mdsync;
using test::ScriptedExecution;

class TestMediatorSession : public QObject {
    Q_OBJECT

private:
    ReplayConnection* connection_ = nullptr;
    EnvelopeCryptor* cryptor_ = nullptr;
    MediatorMessenger* messenger_ = nullptr;
    TaskQueue* queue_ = nullptr;
    MediatorSession* session_ = nullptr;
    std::shared_ptr<ScriptedExecution::Script> script_;
    QList<QByteArray> executedReflectIds_;
    QList<SessionState> states_;

    void feedReflected(const QByteArray& reflectId)
    {
        connection_->feedFrame(FrameCodec::encodeReflected(
            reflectId, QDateTime::currentDateTimeUtc(), QByteArray("sealed")));
    }

private slots:
    void init()
    {
        connection_ = new ReplayConnection();
        cryptor_ = new EnvelopeCryptor();
        messenger_ = new MediatorMessenger(connection_, cryptor_);
        queue_ = new TaskQueue(connection_, TaskContext());
        script_ = std::make_shared<ScriptedExecution::Script>();
        executedReflectIds_.clear();
        states_.clear();

        auto script = script_;
        auto* executed = &executedReflectIds_;
        queue_->setExecutionFactory([script, executed](TaskDefinition& task) {
            if (auto* receive = dynamic_cast<TaskDefinitionReceiveReflectedMessage*>(&task))
                executed->append(receive->reflectId());
            return std::make_shared<ScriptedExecution>(script);
        });

        session_ = new MediatorSession(connection_, messenger_, queue_);
        connect(session_, &MediatorSession::stateChanged, this,
                [this](SessionState state) { states_.append(state); });
    }

    void cleanup()
    {
        delete session_;
        delete queue_;
        delete messenger_;
        delete cryptor_;
        delete connection_;
    }

    void testLoginActivatesAndSpools()
    {
        QList<ErrorCode> outcomes;
        proto::csp::AbstractMessage message;
        message.set_message_id(1);
        message.mutable_text()->set_text("queued offline");
        queue_->enqueue(std::make_shared<TaskDefinitionReceiveMessage>(
                            message, QByteArray(24, 'n'), QDateTime::currentDateTimeUtc()),
                        [&outcomes](const TaskDefinition&, const Error& e) { outcomes.append(e.code); });

        session_->start();
        QVERIFY(session_->state() == SessionState::Connecting);
        QCOMPARE(script_->runs, 0);

        connection_->simulateLogin();
        QVERIFY(session_->state() == SessionState::Active);
        QTRY_COMPARE(outcomes.size(), 1);
        QVERIFY(outcomes.first() == ErrorCode::None);

        QCOMPARE(states_.size(), 2);
        QVERIFY(states_.at(0) == SessionState::Connecting);
        QVERIFY(states_.at(1) == SessionState::Active);
    }

    void testStartWhenAlreadyLoggedIn()
    {
        connection_->simulateLogin();
        session_->start();
        QVERIFY(session_->state() == SessionState::Active);

        // A second start is ignored
        session_->start();
        QCOMPARE(states_.size(), 2);
    }

    void testLoginBeforeStartIsIgnored()
    {
        connection_->simulateLogin();
        QVERIFY(session_->state() == SessionState::Idle);
        QVERIFY(states_.isEmpty());
    }

    void testReflectedEnvelopesBecomeReceiveTasks()
    {
        connection_->simulateLogin();
        session_->start();

        feedReflected(QByteArray::fromHex("01000000"));
        feedReflected(QByteArray::fromHex("02000000"));

        QTRY_COMPARE(executedReflectIds_.size(), 2);
        QCOMPARE(executedReflectIds_.at(0), QByteArray::fromHex("01000000"));
        QCOMPARE(executedReflectIds_.at(1), QByteArray::fromHex("02000000"));
        QTRY_COMPARE(queue_->count(), 0);
    }

    void testReflectedOutsideActiveSessionIsIgnored()
    {
        session_->start();
        QVERIFY(session_->state() == SessionState::Connecting);

        feedReflected(QByteArray::fromHex("03000000"));
        QCOMPARE(queue_->count(), 0);
    }

    void testDisconnectInterruptsQueue()
    {
        script_->hold = true;
        connection_->simulateLogin();
        session_->start();
        QSignalSpy completed(queue_, &TaskQueue::taskCompleted);

        feedReflected(QByteArray::fromHex("04000000"));
        QTRY_COMPARE(script_->runs, 1);

        connection_->simulateDisconnect();
        QVERIFY(session_->state() == SessionState::Disconnected);

        script_->held(Error(ErrorCode::NotConnectedToMediator));
        QTRY_COMPARE(completed.count(), 1);
        QCOMPARE(completed.at(0).at(1).toBool(), false);
        QCOMPARE(queue_->count(), 0);
    }

    void testRestartAfterDisconnect()
    {
        connection_->simulateLogin();
        session_->start();
        connection_->simulateDisconnect();
        QVERIFY(session_->state() == SessionState::Disconnected);

        session_->start();
        QVERIFY(session_->state() == SessionState::Connecting);
        connection_->simulateLogin();
        QVERIFY(session_->state() == SessionState::Active);
    }

    void testStopDetachesMessenger()
    {
        connection_->simulateLogin();
        session_->start();
        session_->stop();
        QVERIFY(session_->state() == SessionState::Disconnected);

        QSignalSpy dry(session_, &MediatorSession::reflectionQueueDry);
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        QCOMPARE(dry.count(), 0);
    }

    void testMediatorSignalsAreForwarded()
    {
        connection_->simulateLogin();
        session_->start();

        QSignalSpy dry(session_, &MediatorSession::reflectionQueueDry);
        QSignalSpy leader(session_, &MediatorSession::rolePromotedToLeader);
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::RolePromotedToLeader));
        QCOMPARE(dry.count(), 1);
        QCOMPARE(leader.count(), 1);
    }

    void testStateNames()
    {
        QCOMPARE(QString(sessionStateName(SessionState::Idle)), QString("Idle"));
        QCOMPARE(QString(sessionStateName(SessionState::Active)), QString("Active"));
    }
};

QTEST_MAIN(TestMediatorSession)
#include "test_mediator_session.moc"
