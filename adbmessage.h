// -*- mode: c++ -*-
#ifndef ADBMESSAGE_H
#define ADBMESSAGE_H
#include <QByteArray>
#include <QString>

#define A_SYNC 0x434e5953
#define A_CNXN 0x4e584e43
#define A_AUTH 0x48545541
#define A_OPEN 0x4e45504f
#define A_OKAY 0x59414b4f
#define A_CLSE 0x45534c43
#define A_WRTE 0x45545257

// 0x01000000: first version
// 0x01000001: skip checksum
#define A_VERSION_MIN 0x01000000
#define A_VERSION_SKIP_CHECKSUM 0x01000001

#define ADB_AUTH_TOKEN 1
#define ADB_AUTH_SIGNATURE 2
#define ADB_AUTH_RSAPUBLICKEY 3

const quint32 MAX_PAYLOAD_V1 = 4 * 1024;
const quint32 MAX_PAYLOAD = 1024 * 1024;

const int ADB_HEADER_SIZE = 24;

/** The fixed part of a message, exactly as it travels on the wire. */
struct AdbMessageHeader
{
    quint32 command;
    quint32 arg0;
    quint32 arg1;
    quint32 dataLength;
    quint32 dataCheck;
    quint32 magic;

    bool operator==(const AdbMessageHeader& other) const;
    bool operator!=(const AdbMessageHeader& other) const { return !(*this == other); }
};

struct AdbMessage
{
    quint32 command;
    quint32 arg0;
    quint32 arg1;
    QByteArray payload;

    AdbMessage() : command(0), arg0(0), arg1(0) {}
    AdbMessage(quint32 cmd, quint32 a0, quint32 a1, const QByteArray& data = QByteArray())
        : command(cmd), arg0(a0), arg1(a1), payload(data) {}

    /** Header with length, checksum and magic filled in from the payload. */
    AdbMessageHeader header() const;
};

quint32 adbChecksum(const QByteArray& payload);
bool verifyChecksum(const QByteArray& payload, quint32 claimed);

QByteArray encodeHeader(const AdbMessageHeader& header);
QByteArray encodeHeader(const AdbMessage& message);

/** Decodes the first ADB_HEADER_SIZE bytes of raw.
Throws ProtocolError(MalformedHeader) when raw is short or the magic does not match the command. */
AdbMessageHeader decodeHeader(const QByteArray& raw);

bool isKnownCommand(quint32 command);
QString commandName(quint32 command);

/** One-line description used by the wire trace. */
QString describeMessage(const AdbMessage& message);

#endif // ADBMESSAGE_H
