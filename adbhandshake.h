// -*- mode: c++ -*-
#ifndef ADBHANDSHAKE_H
#define ADBHANDSHAKE_H
#include "adboptions.h"
#include <QList>
#include <QMap>
#include <QStringList>

class AdbWire;
class AuthSigner;

/** The device half of CNXN: "<state>::<key>=<value>;...;features=a,b". */
struct DeviceBanner
{
    QString state;
    QMap<QString, QString> properties;
    QStringList features;

    static DeviceBanner parse(const QByteArray& payload);
};

struct AdbConnectionInfo
{
    quint32 version;
    quint32 maxPayload;
    QByteArray rawBanner;
    DeviceBanner banner;

    AdbConnectionInfo() : version(0), maxPayload(0) {}
};

/** CNXN/AUTH negotiation on a fresh transport.

Every signer gets exactly one try, in order. When all of them were refused
the first available public key is offered once and the device is given
authTimeoutMs to show that the user accepted it. */
class AdbHandshake
{
public:
    enum State {
        hsStart,
        hsSentCnxn,
        hsWaitAuthOrCnxn,
        hsAuthToken,
        hsSentSignature,
        hsWaitAuthResult,
        hsAuthenticated,
        hsRejected,
        hsFailed
    };

    enum AuthState {
        asUnauthenticated,
        asTokenSent,
        asAuthenticated
    };

    AdbHandshake(AdbWire* wire, const ConnectionOptions& options);

    /** Runs the exchange to completion. On success the wire is switched to the
    negotiated payload limit and checksum mode.
    Throws AuthRejectedError (state hsRejected); TransportError or ProtocolError (hsFailed). */
    AdbConnectionInfo run(const QList<AuthSigner*>& signers);

    State state() const { return currentState; }
    AuthState authState() const { return currentAuth; }
    int authMessagesSent() const { return authSent; }

    static const char* stateName(State state);

private:
    void setState(State next);
    bool waitFor(AdbMessage* message, int timeoutMs);
    void sendAuth(quint32 type, const QByteArray& data);
    AdbConnectionInfo accept(const AdbMessage& cnxn);
    AdbConnectionInfo authenticate(const AdbMessage& firstToken, const QList<AuthSigner*>& signers);

    AdbWire* wire;
    ConnectionOptions options;
    State currentState;
    AuthState currentAuth;
    int authSent;
};

#endif // ADBHANDSHAKE_H
