#include "adbmessage.h"
#include "adberror.h"
#include <QtEndian>

bool AdbMessageHeader::operator==(const AdbMessageHeader& other) const
{
    return command == other.command && arg0 == other.arg0 && arg1 == other.arg1 &&
           dataLength == other.dataLength && dataCheck == other.dataCheck &&
           magic == other.magic;
}

AdbMessageHeader AdbMessage::header() const
{
    AdbMessageHeader h;
    h.command = command;
    h.arg0 = arg0;
    h.arg1 = arg1;
    h.dataLength = payload.size();
    h.dataCheck = adbChecksum(payload);
    h.magic = command ^ 0xffffffff;
    return h;
}

quint32 adbChecksum(const QByteArray& payload)
{
    quint32 sum = 0;
    const uchar* p = reinterpret_cast<const uchar*>(payload.constData());
    for (int i = 0; i < payload.size(); i++) {
        sum += p[i];
    }
    return sum;
}

bool verifyChecksum(const QByteArray& payload, quint32 claimed)
{
    return adbChecksum(payload) == claimed;
}

QByteArray encodeHeader(const AdbMessageHeader& header)
{
    QByteArray raw(ADB_HEADER_SIZE, '\0');
    uchar* p = reinterpret_cast<uchar*>(raw.data());
    qToLittleEndian<quint32>(header.command, p);
    qToLittleEndian<quint32>(header.arg0, p + 4);
    qToLittleEndian<quint32>(header.arg1, p + 8);
    qToLittleEndian<quint32>(header.dataLength, p + 12);
    qToLittleEndian<quint32>(header.dataCheck, p + 16);
    qToLittleEndian<quint32>(header.magic, p + 20);
    return raw;
}

QByteArray encodeHeader(const AdbMessage& message)
{
    return encodeHeader(message.header());
}

AdbMessageHeader decodeHeader(const QByteArray& raw)
{
    if (raw.size() < ADB_HEADER_SIZE) {
        throw ProtocolError(ProtocolError::MalformedHeader,
                            QString("short header (%1 bytes)").arg(raw.size()));
    }

    const uchar* p = reinterpret_cast<const uchar*>(raw.constData());
    AdbMessageHeader h;
    h.command = qFromLittleEndian<quint32>(p);
    h.arg0 = qFromLittleEndian<quint32>(p + 4);
    h.arg1 = qFromLittleEndian<quint32>(p + 8);
    h.dataLength = qFromLittleEndian<quint32>(p + 12);
    h.dataCheck = qFromLittleEndian<quint32>(p + 16);
    h.magic = qFromLittleEndian<quint32>(p + 20);

    if (h.magic != (h.command ^ 0xffffffff)) {
        throw ProtocolError(ProtocolError::MalformedHeader,
                            QString("bad magic %1 for command %2")
                                .arg(h.magic, 8, 16, QChar('0'))
                                .arg(h.command, 8, 16, QChar('0')));
    }
    return h;
}

bool isKnownCommand(quint32 command)
{
    switch (command) {
    case A_SYNC:
    case A_CNXN:
    case A_AUTH:
    case A_OPEN:
    case A_OKAY:
    case A_CLSE:
    case A_WRTE:
        return true;
    }
    return false;
}

QString commandName(quint32 command)
{
    if (!isKnownCommand(command)) {
        return QString("0x%1").arg(command, 8, 16, QChar('0'));
    }
    char name[5];
    qToLittleEndian<quint32>(command, reinterpret_cast<uchar*>(name));
    name[4] = 0;
    return QString::fromLatin1(name);
}

QString describeMessage(const AdbMessage& message)
{
    return QString("%1(%2, %3, %4 bytes)")
        .arg(commandName(message.command))
        .arg(message.arg0)
        .arg(message.arg1)
        .arg(message.payload.size());
}
