#include "adbwire.h"
#include "adberror.h"
#include "adblogging.h"
#include "transport.h"
#include <QElapsedTimer>
#include <QMutexLocker>

AdbWire::AdbWire(Transport* transport)
    : link(transport), maxData(MAX_PAYLOAD), verifyChecksums(true)
{
}

void AdbWire::send(const AdbMessage& message, int timeoutMs)
{
    QMutexLocker locker(&writeLock);

    qCDebug(lcAdbWire) << ">>" << qPrintable(describeMessage(message));
    link->write(encodeHeader(message), timeoutMs);
    if (!message.payload.isEmpty()) {
        link->write(message.payload, timeoutMs);
    }
}

bool AdbWire::fill(int needed, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    while (rxBuffer.size() < needed) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return false;
        }
        int chunk = qMax<int>(maxData, MAX_PAYLOAD_V1) + ADB_HEADER_SIZE;
        QByteArray data = link->read(chunk, remaining);
        if (data.isEmpty()) {
            return false;
        }
        rxBuffer += data;
    }
    return true;
}

bool AdbWire::receive(AdbMessage* message, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    if (!fill(ADB_HEADER_SIZE, timeoutMs)) {
        return false;
    }

    AdbMessageHeader header = decodeHeader(rxBuffer);
    if (!isKnownCommand(header.command)) {
        throw ProtocolError(ProtocolError::UnexpectedCommand,
                            QString("unknown command %1").arg(commandName(header.command)));
    }
    if (header.dataLength > maxData) {
        throw ProtocolError(ProtocolError::OversizedPayload,
                            QString("%1 carries %2 bytes, limit is %3")
                                .arg(commandName(header.command))
                                .arg(header.dataLength)
                                .arg(maxData));
    }

    int total = ADB_HEADER_SIZE + header.dataLength;
    int remaining = qMax<int>(0, timeoutMs - timer.elapsed());
    if (!fill(total, remaining)) {
        return false;
    }

    QByteArray payload = rxBuffer.mid(ADB_HEADER_SIZE, header.dataLength);
    rxBuffer.remove(0, total);

    if (verifyChecksums && !verifyChecksum(payload, header.dataCheck)) {
        throw ProtocolError(ProtocolError::ChecksumMismatch,
                            QString("%1 payload sums to %2, header says %3")
                                .arg(commandName(header.command))
                                .arg(adbChecksum(payload))
                                .arg(header.dataCheck));
    }

    message->command = header.command;
    message->arg0 = header.arg0;
    message->arg1 = header.arg1;
    message->payload = payload;
    qCDebug(lcAdbWire) << "<<" << qPrintable(describeMessage(*message));
    return true;
}
