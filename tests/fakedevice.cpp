#include "fakedevice.h"
#include "adberror.h"
#include "asynccall.h"
#include "syncrecords.h"

FakeDevice::FakeDevice(FakeTransport* transport, int timeoutMs)
    : transport(transport), timeoutMs(timeoutMs), autoAck(true)
{
}

void FakeDevice::queueConnect(quint32 version, quint32 maxPayload, const QByteArray& banner)
{
    transport->pushMessage(A_CNXN, version, maxPayload, banner);
}

AdbMessage FakeDevice::receive()
{
    AdbMessage message;
    if (!transport->takeMessage(&message, timeoutMs)) {
        throw AdbError("fake device: host sent nothing");
    }
    return message;
}

AdbMessage FakeDevice::expect(quint32 command)
{
    AdbMessage message = receive();
    if (message.command != command) {
        throw AdbError(QString("fake device: expected %1, got %2")
                           .arg(commandName(command)).arg(describeMessage(message)));
    }
    return message;
}

bool FakeDevice::idle(int ms)
{
    QByteArray data;
    return !transport->takeWrite(&data, ms);
}

quint32 FakeDevice::acceptOpen(const QString& destination, quint32 remoteId)
{
    AdbMessage open = expect(A_OPEN);
    QByteArray wanted = destination.toUtf8();
    wanted.append('\0');
    if (open.payload != wanted) {
        throw AdbError(QString("fake device: OPEN of '%1', expected '%2'")
                           .arg(QString::fromUtf8(open.payload)).arg(destination));
    }
    transport->pushMessage(A_OKAY, remoteId, open.arg0);
    return open.arg0;
}

void FakeDevice::rejectOpen(const QString& destination)
{
    AdbMessage open = expect(A_OPEN);
    if (!open.payload.startsWith(destination.toUtf8())) {
        throw AdbError(QString("fake device: unexpected OPEN of '%1'").arg(QString::fromUtf8(open.payload)));
    }
    transport->pushMessage(A_CLSE, 0, open.arg0);
}

QByteArray FakeDevice::readStream(quint32 localId, quint32 remoteId)
{
    AdbMessage write = expect(A_WRTE);
    if (write.arg0 != localId || write.arg1 != remoteId) {
        throw AdbError(QString("fake device: WRTE(%1, %2) on stream (%3, %4)")
                           .arg(write.arg0).arg(write.arg1).arg(localId).arg(remoteId));
    }
    if (autoAck) {
        ack(localId, remoteId);
    }
    return write.payload;
}

QByteArray FakeDevice::readStreamBytes(quint32 localId, quint32 remoteId, int size)
{
    while (streamBuffer.size() < size) {
        streamBuffer += readStream(localId, remoteId);
    }
    QByteArray result = streamBuffer.left(size);
    streamBuffer.remove(0, size);
    return result;
}

QByteArray FakeDevice::readSyncRequest(quint32 localId, quint32 remoteId, quint32 expectedId)
{
    QByteArray header = readStreamBytes(localId, remoteId, 8);
    if (readLe32(header) != expectedId) {
        throw AdbError(QString("fake device: sync request %1, expected %2")
                           .arg(readLe32(header), 8, 16).arg(expectedId, 8, 16));
    }
    return readStreamBytes(localId, remoteId, readLe32(header, 4));
}

void FakeDevice::writeStream(quint32 localId, quint32 remoteId, const QByteArray& data)
{
    transport->pushMessage(A_WRTE, remoteId, localId, data);
}

void FakeDevice::reply(quint32 localId, quint32 remoteId, const QByteArray& data)
{
    writeStream(localId, remoteId, data);
    AdbMessage okay = expect(A_OKAY);
    if (okay.arg0 != localId || okay.arg1 != remoteId) {
        throw AdbError(QString("fake device: OKAY(%1, %2) on stream (%3, %4)")
                           .arg(okay.arg0).arg(okay.arg1).arg(localId).arg(remoteId));
    }
}

void FakeDevice::ack(quint32 localId, quint32 remoteId)
{
    transport->pushMessage(A_OKAY, remoteId, localId);
}

void FakeDevice::closeStream(quint32 localId, quint32 remoteId)
{
    transport->pushMessage(A_CLSE, remoteId, localId);
}

FakeSession::FakeSession(const ConnectionOptions& options, quint32 maxPayload)
    : transport(new FakeTransport)
{
    device.reset(new FakeDevice(transport));
    device->queueConnect(A_VERSION_MIN, maxPayload);
    connection.reset(new AdbConnection(std::unique_ptr<Transport>(transport), options));
    connection->connect();
    device->expect(A_CNXN);
}

FakeSession::~FakeSession()
{
    connection->close();
}

std::unique_ptr<AdbStream> FakeSession::open(const QString& destination, quint32 remoteId)
{
    std::unique_ptr<AdbStream> stream;
    AsyncCall call([&]() { stream = connection->openStream(destination); });
    device->acceptOpen(destination, remoteId);
    if (!call.finish()) {
        throw AdbError(QString("opening %1 did not finish").arg(destination));
    }
    call.rethrow();
    return stream;
}
