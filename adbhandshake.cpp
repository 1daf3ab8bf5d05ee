#include "adbhandshake.h"
#include "adberror.h"
#include "adblogging.h"
#include "adbwire.h"
#include "authsigner.h"
#include "transport.h"
#include <QElapsedTimer>

DeviceBanner DeviceBanner::parse(const QByteArray& payload)
{
    QByteArray raw = payload;
    int nul = raw.indexOf('\0');
    if (nul >= 0) {
        raw.truncate(nul);
    }

    DeviceBanner banner;
    QString text = QString::fromUtf8(raw);
    int sep = text.indexOf("::");
    if (sep < 0) {
        banner.state = text.section(':', 0, 0);
        return banner;
    }

    banner.state = text.left(sep);
    foreach (const QString& item, text.mid(sep + 2).split(';', QString::SkipEmptyParts)) {
        int eq = item.indexOf('=');
        if (eq < 0) {
            continue;
        }
        QString key = item.left(eq);
        QString value = item.mid(eq + 1);
        if (key == "features") {
            banner.features = value.split(',', QString::SkipEmptyParts);
        } else {
            banner.properties.insert(key, value);
        }
    }
    return banner;
}

AdbHandshake::AdbHandshake(AdbWire* wire, const ConnectionOptions& options)
    : wire(wire), options(options), currentState(hsStart), currentAuth(asUnauthenticated), authSent(0)
{
}

const char* AdbHandshake::stateName(State state)
{
    switch (state) {
    case hsStart:
        return "Start";
    case hsSentCnxn:
        return "SentCnxn";
    case hsWaitAuthOrCnxn:
        return "WaitAuthOrCnxn";
    case hsAuthToken:
        return "AuthToken";
    case hsSentSignature:
        return "SentSignature";
    case hsWaitAuthResult:
        return "WaitAuthResult";
    case hsAuthenticated:
        return "Authenticated";
    case hsRejected:
        return "Rejected";
    case hsFailed:
        return "Failed";
    }
    return "?";
}

void AdbHandshake::setState(State next)
{
    qCDebug(lcAdbAuth) << stateName(currentState) << "->" << stateName(next);
    currentState = next;
}

bool AdbHandshake::waitFor(AdbMessage* message, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    for (;;) {
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            return false;
        }
        if (wire->receive(message, remaining)) {
            if (message->command == A_CNXN || message->command == A_AUTH) {
                return true;
            }
            throw ProtocolError(ProtocolError::UnexpectedCommand,
                                QString("%1 during handshake").arg(describeMessage(*message)));
        }
    }
}

void AdbHandshake::sendAuth(quint32 type, const QByteArray& data)
{
    wire->send(AdbMessage(A_AUTH, type, 0, data), options.timeoutMs);
    authSent++;
}

AdbConnectionInfo AdbHandshake::run(const QList<AuthSigner*>& signers)
{
    try {
        QByteArray hostBanner = "host::" + options.banner.toUtf8();
        hostBanner.append('\0');
        wire->setMaxPayload(MAX_PAYLOAD);
        wire->send(AdbMessage(A_CNXN, options.version, options.maxPayload, hostBanner), options.timeoutMs);
        setState(hsSentCnxn);

        setState(hsWaitAuthOrCnxn);
        AdbMessage reply;
        if (!waitFor(&reply, options.timeoutMs)) {
            throw TimeoutError(QString("device %1 did not answer CNXN within %2ms")
                                   .arg(wire->transport()->description())
                                   .arg(options.timeoutMs));
        }
        if (reply.command == A_CNXN) {
            return accept(reply);
        }
        return authenticate(reply, signers);
    } catch (const AuthRejectedError&) {
        setState(hsRejected);
        throw;
    } catch (const AdbError&) {
        setState(hsFailed);
        throw;
    }
}

AdbConnectionInfo AdbHandshake::authenticate(const AdbMessage& firstToken, const QList<AuthSigner*>& signers)
{
    AdbMessage reply = firstToken;

    foreach (AuthSigner* signer, signers) {
        if (reply.arg0 != ADB_AUTH_TOKEN) {
            throw ProtocolError(ProtocolError::InvalidResponse,
                                QString("unknown AUTH type %1").arg(reply.arg0));
        }
        setState(hsAuthToken);

        QByteArray signature = signer->sign(reply.payload);
        sendAuth(ADB_AUTH_SIGNATURE, signature);
        currentAuth = asTokenSent;
        setState(hsSentSignature);

        setState(hsWaitAuthResult);
        if (!waitFor(&reply, options.timeoutMs)) {
            throw TimeoutError(QString("device did not answer AUTH within %1ms").arg(options.timeoutMs));
        }
        if (reply.command == A_CNXN) {
            return accept(reply);
        }
        qCDebug(lcAdbAuth) << "signature" << authSent << "refused";
    }

    if (reply.arg0 != ADB_AUTH_TOKEN) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("unknown AUTH type %1").arg(reply.arg0));
    }
    setState(hsAuthToken);

    QByteArray key;
    foreach (AuthSigner* signer, signers) {
        key = signer->publicKey();
        if (!key.isEmpty()) {
            break;
        }
    }
    if (!options.sendPublicKey || key.isEmpty()) {
        throw AuthRejectedError("device authentication required, no usable keys available");
    }

    key.append('\0');
    sendAuth(ADB_AUTH_RSAPUBLICKEY, key);
    setState(hsWaitAuthResult);
    if (!waitFor(&reply, options.authTimeoutMs) || reply.command != A_CNXN) {
        throw AuthRejectedError("device did not accept our key: accept the key on the device, then retry");
    }
    return accept(reply);
}

AdbConnectionInfo AdbHandshake::accept(const AdbMessage& cnxn)
{
    AdbConnectionInfo info;
    info.version = qMin(options.version, cnxn.arg0);
    if (info.version != A_VERSION_MIN && info.version != A_VERSION_SKIP_CHECKSUM) {
        throw ProtocolError(ProtocolError::UnsupportedVersion,
                            QString("device speaks version %1").arg(cnxn.arg0, 8, 16, QChar('0')));
    }
    if (cnxn.arg1 == 0) {
        throw ProtocolError(ProtocolError::InvalidResponse, "device offered a zero payload size");
    }

    info.maxPayload = qMin(options.maxPayload, cnxn.arg1);
    info.rawBanner = cnxn.payload;
    info.banner = DeviceBanner::parse(cnxn.payload);

    wire->setMaxPayload(info.maxPayload);
    wire->setChecksumVerification(info.version < A_VERSION_SKIP_CHECKSUM);

    currentAuth = asAuthenticated;
    setState(hsAuthenticated);
    qCDebug(lcAdbAuth) << "connected:" << info.banner.state << "version"
                       << QString::number(info.version, 16) << "max payload" << info.maxPayload;
    return info;
}
