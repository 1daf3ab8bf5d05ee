// -*- mode: c++ -*-
#ifndef AUTHSIGNER_H
#define AUTHSIGNER_H
#include <QByteArray>

/** Signs the device's AUTH token with a key the device may already trust. */
class AuthSigner
{
public:
    virtual ~AuthSigner() {}

    /** Signature over the 20-byte token. Throws AdbError when signing fails. */
    virtual QByteArray sign(const QByteArray& token) = 0;

    /** Public key in adb's base64 format, sent when every signature was refused. */
    virtual QByteArray publicKey() const = 0;
};

#endif // AUTHSIGNER_H
