// -*- mode: c++ -*-
#ifndef RSASIGNER_H
#define RSASIGNER_H
#include "authsigner.h"
#include <QString>
#include <memory>

typedef struct evp_pkey_st EVP_PKEY;

/** adbkey/adbkey.pub pair as written by the stock adb tools. */
class RsaKeySigner : public AuthSigner
{
public:
    ~RsaKeySigner();

    /** Loads the PEM private key at path and the public key at path + ".pub".
    Throws AdbError when either cannot be read. */
    static std::unique_ptr<RsaKeySigner> fromKeyFile(const QString& path);

    QByteArray sign(const QByteArray& token);
    QByteArray publicKey() const { return pubKey; }

private:
    RsaKeySigner(EVP_PKEY* key, const QByteArray& pubKey);
    RsaKeySigner(const RsaKeySigner&);
    RsaKeySigner& operator=(const RsaKeySigner&);

    EVP_PKEY* key;
    QByteArray pubKey;
};

#endif // RSASIGNER_H
