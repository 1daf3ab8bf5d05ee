// -*- mode: c++ -*-
#ifndef ADBOPTIONS_H
#define ADBOPTIONS_H
#include "adbmessage.h"
#include <QHostInfo>
#include <QString>

/** Everything a connection can be tuned with. Defaults suit library use. */
struct ConnectionOptions
{
    QString banner;             // sent as "host::<banner>"
    quint32 version;
    quint32 maxPayload;         // offered; at most MAX_PAYLOAD
    int timeoutMs;              // per blocking operation
    int authTimeoutMs;          // waiting for the user to accept our public key
    int pollIntervalMs;         // dispatcher read slice
    int streamQueueDepth;       // WRTE frames buffered per stream before acks stop
    bool sendPublicKey;

    ConnectionOptions()
        : banner(QHostInfo::localHostName()),
          version(A_VERSION_MIN),
          maxPayload(MAX_PAYLOAD_V1),
          timeoutMs(10000),
          authTimeoutMs(100),
          pollIntervalMs(100),
          streamQueueDepth(16),
          sendPublicKey(true)
    {
    }
};

#endif // ADBOPTIONS_H
