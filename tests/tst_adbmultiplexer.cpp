#include <QtTest>
#include "adbconnection.h"
#include "adberror.h"
#include "asynccall.h"
#include "fakedevice.h"

class TestAdbMultiplexer : public QObject
{
    Q_OBJECT

private slots:
    void openBindsRemoteId();
    void localIdsNotReused();
    void demultiplexes();
    void writeWaitsForOkay();
    void writeSplitsAtMaxPayload();
    void fullQueueWithholdsOkay();
    void rejectedOpen();
    void openTimesOut();
    void remoteClose();
    void hostClose();
    void closeUnblocksRead();
    void deviceHangUp();
    void deviceOpenRefused();
    void cnxnAfterHandshakeIsFatal();

private:
    ConnectionOptions quickOptions() const;
};

ConnectionOptions TestAdbMultiplexer::quickOptions() const
{
    ConnectionOptions options;
    options.banner = "test";
    options.timeoutMs = 2000;
    options.pollIntervalMs = 20;
    return options;
}

void TestAdbMultiplexer::openBindsRemoteId()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:echo hi", 1234);

    QCOMPARE(stream->localId(), quint32(1));
    QCOMPARE(stream->remoteId(), quint32(1234));
    QCOMPARE(stream->state(), StreamChannel::Open);
    QCOMPARE(stream->destination(), QString("shell:echo hi"));
    QCOMPARE(stream->maxPayload(), MAX_PAYLOAD_V1);
    QVERIFY(session.connection->isConnected());
    QCOMPARE(session.connection->deviceState(), QString("device"));
    QVERIFY(session.connection->hasFeature("shell_v2"));
    session.connection->close();
}

void TestAdbMultiplexer::localIdsNotReused()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> first = session.open("shell:a", 10);
    std::unique_ptr<AdbStream> second = session.open("shell:b", 11);
    QCOMPARE(first->localId(), quint32(1));
    QCOMPARE(second->localId(), quint32(2));

    session.device->closeStream(1, 10);
    QVERIFY(session.device->expect(A_CLSE).arg0 == 1);
    QByteArray data;
    QVERIFY(!first->read(&data));
    first.reset();

    std::unique_ptr<AdbStream> third = session.open("shell:c", 12);
    QCOMPARE(third->localId(), quint32(3));
    session.connection->close();
}

void TestAdbMultiplexer::demultiplexes()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> a = session.open("shell:a", 100);
    std::unique_ptr<AdbStream> b = session.open("shell:b", 200);

    session.device->writeStream(2, 200, "to-b");
    session.device->writeStream(1, 100, "to-a");

    AdbMessage okay = session.device->expect(A_OKAY);
    QCOMPARE(okay.arg0, quint32(2));
    QCOMPARE(okay.arg1, quint32(200));
    okay = session.device->expect(A_OKAY);
    QCOMPARE(okay.arg0, quint32(1));
    QCOMPARE(okay.arg1, quint32(100));

    QByteArray data;
    QVERIFY(a->read(&data));
    QCOMPARE(data, QByteArray("to-a"));
    QVERIFY(b->read(&data));
    QCOMPARE(data, QByteArray("to-b"));
    session.connection->close();
}

void TestAdbMultiplexer::writeWaitsForOkay()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 7);
    session.device->setAutoAck(false);

    QByteArray payload = QByteArray(MAX_PAYLOAD_V1, 'a') + QByteArray(10, 'b');
    AsyncCall call([&]() { stream->write(payload); });

    QCOMPARE(session.device->readStream(1, 7).size(), int(MAX_PAYLOAD_V1));
    // Nothing more goes out until the first frame is acknowledged.
    QVERIFY(session.device->idle(300));
    QVERIFY(!call.isFinished());

    session.device->ack(1, 7);
    QCOMPARE(session.device->readStream(1, 7), QByteArray(10, 'b'));
    QVERIFY(!call.finish(200));

    session.device->ack(1, 7);
    QVERIFY(call.finish());
    call.rethrow();
    session.connection->close();
}

void TestAdbMultiplexer::writeSplitsAtMaxPayload()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 7);

    QByteArray payload(3 * MAX_PAYLOAD_V1 + 1, 'z');
    AsyncCall call([&]() { stream->write(payload); });

    QList<int> sizes;
    QByteArray received;
    while (received.size() < payload.size()) {
        QByteArray frame = session.device->readStream(1, 7);
        sizes << frame.size();
        received += frame;
    }
    QVERIFY(call.finish());
    call.rethrow();

    QCOMPARE(sizes, QList<int>() << int(MAX_PAYLOAD_V1) << int(MAX_PAYLOAD_V1)
                                 << int(MAX_PAYLOAD_V1) << 1);
    QCOMPARE(received, payload);
    session.connection->close();
}

void TestAdbMultiplexer::fullQueueWithholdsOkay()
{
    ConnectionOptions options = quickOptions();
    options.streamQueueDepth = 2;
    FakeSession session(options);
    std::unique_ptr<AdbStream> stream = session.open("shell:", 9);

    session.device->writeStream(1, 9, "one");
    session.device->expect(A_OKAY);
    session.device->writeStream(1, 9, "two");
    QVERIFY(session.device->idle(300));

    QByteArray data;
    QVERIFY(stream->read(&data));
    QCOMPARE(data, QByteArray("one"));
    AdbMessage okay = session.device->expect(A_OKAY);
    QCOMPARE(okay.arg0, quint32(1));
    QCOMPARE(okay.arg1, quint32(9));

    QVERIFY(stream->read(&data));
    QCOMPARE(data, QByteArray("two"));
    QVERIFY(session.device->idle(100));
    session.connection->close();
}

void TestAdbMultiplexer::rejectedOpen()
{
    FakeSession session(quickOptions());
    AsyncCall call([&]() { session.connection->openStream("bogus:"); });
    session.device->rejectOpen("bogus:");
    QVERIFY(call.finish());
    QVERIFY(call.threw<StreamRejectedError>());
    QVERIFY(session.connection->isConnected());
}

void TestAdbMultiplexer::openTimesOut()
{
    FakeSession session(quickOptions());
    QVERIFY_EXCEPTION_THROWN(session.connection->openStream("shell:", 200), TimeoutError);
}

void TestAdbMultiplexer::remoteClose()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:exit", 5);

    session.device->writeStream(1, 5, "bye");
    session.device->closeStream(1, 5);
    session.device->expect(A_OKAY);
    AdbMessage close = session.device->expect(A_CLSE);
    QCOMPARE(close.arg0, quint32(1));
    QCOMPARE(close.arg1, quint32(5));

    QCOMPARE(stream->readAll(), QByteArray("bye"));
    QCOMPARE(stream->state(), StreamChannel::Closed);
    QVERIFY_EXCEPTION_THROWN(stream->write("more"), StreamClosedError);
    QVERIFY_EXCEPTION_THROWN(stream->write(QByteArray()), StreamClosedError);

    stream->close();
    QVERIFY(session.device->idle(100));
}

void TestAdbMultiplexer::hostClose()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 5);

    AsyncCall call([&]() { stream->close(); });
    AdbMessage close = session.device->expect(A_CLSE);
    QCOMPARE(close.arg0, quint32(1));
    QCOMPARE(close.arg1, quint32(5));
    QVERIFY(!call.finish(100));

    session.device->closeStream(1, 5);
    QVERIFY(call.finish());
    call.rethrow();
    QCOMPARE(stream->state(), StreamChannel::Closed);
    // The device's CLSE answered ours; nothing more is sent.
    QVERIFY(session.device->idle(100));
}

void TestAdbMultiplexer::closeUnblocksRead()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 5);

    AsyncCall call([&]() {
        QByteArray data;
        stream->read(&data, 10000);
    });
    QTest::qWait(100);

    QElapsedTimer timer;
    timer.start();
    session.transport->close();
    QVERIFY(call.finish(2000));
    QVERIFY(timer.elapsed() < 2000);
    QVERIFY(call.threw<ConnectionClosedError>());
    QTRY_VERIFY(!session.connection->isConnected());
}

void TestAdbMultiplexer::deviceHangUp()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 5);

    session.transport->disconnect();
    QByteArray data;
    QVERIFY_EXCEPTION_THROWN(stream->read(&data), ConnectionClosedError);
    QVERIFY_EXCEPTION_THROWN(session.connection->openStream("shell:"), ConnectionClosedError);
    QVERIFY(!session.connection->isConnected());
}

void TestAdbMultiplexer::deviceOpenRefused()
{
    FakeSession session(quickOptions());
    session.transport->pushMessage(A_OPEN, 555, 0, QByteArray("tcp:1234\0", 9));

    AdbMessage refusal = session.device->expect(A_CLSE);
    QCOMPARE(refusal.arg0, quint32(0));
    QCOMPARE(refusal.arg1, quint32(555));

    std::unique_ptr<AdbStream> stream = session.open("shell:", 6);
    QCOMPARE(stream->localId(), quint32(1));
    session.connection->close();
}

void TestAdbMultiplexer::cnxnAfterHandshakeIsFatal()
{
    FakeSession session(quickOptions());
    std::unique_ptr<AdbStream> stream = session.open("shell:", 5);

    session.transport->pushMessage(A_CNXN, A_VERSION_MIN, MAX_PAYLOAD_V1, "device::");
    QByteArray data;
    try {
        stream->read(&data);
        QFAIL("read survived a second CNXN");
    } catch (const ConnectionClosedError& e) {
        QVERIFY(e.message().contains("CNXN"));
    }
    QTRY_VERIFY(!session.connection->isConnected());
}

QTEST_GUILESS_MAIN(TestAdbMultiplexer)
#include "tst_adbmultiplexer.moc"
