#include "faketransport.h"
#include "adberror.h"
#include <QElapsedTimer>
#include <QMutexLocker>

FakeTransport::FakeTransport()
    : closed(false), hungUp(false)
{
}

QByteArray FakeTransport::read(int maxBytes, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    QMutexLocker locker(&lock);
    while (inbound.isEmpty()) {
        if (closed) {
            throw ConnectionClosedError("fake transport closed");
        }
        if (hungUp) {
            throw ConnectionClosedError("fake device hung up");
        }
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return QByteArray();
        }
        changed.wait(&lock, remaining);
    }
    if (closed) {
        throw ConnectionClosedError("fake transport closed");
    }

    QByteArray& head = inbound.head();
    if (head.size() <= maxBytes) {
        return inbound.dequeue();
    }
    QByteArray part = head.left(maxBytes);
    head.remove(0, maxBytes);
    return part;
}

void FakeTransport::write(const QByteArray& data, int)
{
    QMutexLocker locker(&lock);
    if (closed || hungUp) {
        throw ConnectionClosedError("fake transport closed");
    }
    pending.enqueue(data);
    history << data;
    changed.wakeAll();
}

void FakeTransport::close()
{
    QMutexLocker locker(&lock);
    closed = true;
    changed.wakeAll();
}

bool FakeTransport::isOpen() const
{
    QMutexLocker locker(&lock);
    return !closed && !hungUp;
}

void FakeTransport::pushPacket(const QByteArray& packet)
{
    QMutexLocker locker(&lock);
    inbound.enqueue(packet);
    changed.wakeAll();
}

void FakeTransport::pushMessage(const AdbMessage& message)
{
    pushPacket(encodeHeader(message));
    if (!message.payload.isEmpty()) {
        pushPacket(message.payload);
    }
}

void FakeTransport::pushMessage(quint32 command, quint32 arg0, quint32 arg1, const QByteArray& payload)
{
    pushMessage(AdbMessage(command, arg0, arg1, payload));
}

bool FakeTransport::takeWrite(QByteArray* data, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    QMutexLocker locker(&lock);
    while (pending.isEmpty()) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return false;
        }
        changed.wait(&lock, remaining);
    }
    *data = pending.dequeue();
    return true;
}

bool FakeTransport::takeMessage(AdbMessage* message, int timeoutMs)
{
    QByteArray raw;
    if (!takeWrite(&raw, timeoutMs)) {
        return false;
    }
    AdbMessageHeader header = decodeHeader(raw);
    message->command = header.command;
    message->arg0 = header.arg0;
    message->arg1 = header.arg1;
    message->payload.clear();
    if (header.dataLength > 0) {
        if (!takeWrite(&message->payload, timeoutMs)) {
            return false;
        }
    }
    return true;
}

void FakeTransport::disconnect()
{
    QMutexLocker locker(&lock);
    hungUp = true;
    changed.wakeAll();
}

QList<QByteArray> FakeTransport::writes() const
{
    QMutexLocker locker(&lock);
    return history;
}

int FakeTransport::writeCount() const
{
    QMutexLocker locker(&lock);
    return history.size();
}
