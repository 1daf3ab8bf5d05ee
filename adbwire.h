// -*- mode: c++ -*-
#ifndef ADBWIRE_H
#define ADBWIRE_H
#include "adbmessage.h"
#include <QMutex>

class Transport;

/** Moves whole AdbMessages over a Transport.

Incoming bytes are buffered so a message split over several reads (TCP) or
a read that returned more than one message is handled; a receive that timed
out keeps what it already got for the next call. Sends from several threads
are serialized. */
class AdbWire
{
public:
    explicit AdbWire(Transport* transport);

    /** Header then payload, as two transport writes. */
    void send(const AdbMessage& message, int timeoutMs);

    /** Returns false when no complete message arrived within timeoutMs.
    Throws ProtocolError for a bad magic, an unknown command, a payload over
    the limit or (while verification is on) a checksum mismatch. */
    bool receive(AdbMessage* message, int timeoutMs);

    quint32 maxPayload() const { return maxData; }
    void setMaxPayload(quint32 size) { maxData = size; }

    bool checksumVerification() const { return verifyChecksums; }
    void setChecksumVerification(bool on) { verifyChecksums = on; }

    Transport* transport() const { return link; }

private:
    bool fill(int needed, int timeoutMs);

    Transport* link;
    QByteArray rxBuffer;
    QMutex writeLock;
    quint32 maxData;
    bool verifyChecksums;
};

#endif // ADBWIRE_H
