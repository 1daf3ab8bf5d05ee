#include "rsasigner.h"
#include "adberror.h"
#include "adblogging.h"
#include <QFile>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

static QString opensslError()
{
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof buf);
    return QString::fromLatin1(buf);
}

static QByteArray readKeyFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw AdbError(QString("cannot read key file %1: %2").arg(path).arg(file.errorString()));
    }
    return file.readAll();
}

RsaKeySigner::RsaKeySigner(EVP_PKEY* key, const QByteArray& pubKey)
    : key(key), pubKey(pubKey)
{
}

RsaKeySigner::~RsaKeySigner()
{
    EVP_PKEY_free(key);
}

std::unique_ptr<RsaKeySigner> RsaKeySigner::fromKeyFile(const QString& path)
{
    QByteArray pem = readKeyFile(path);
    QByteArray pub = readKeyFile(path + ".pub").trimmed();

    BIO* bio = BIO_new_mem_buf(pem.constData(), pem.size());
    if (!bio) {
        throw AdbError("cannot allocate BIO: " + opensslError());
    }
    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio, 0, 0, 0);
    BIO_free(bio);
    if (!key) {
        throw AdbError(QString("cannot parse private key %1: %2").arg(path).arg(opensslError()));
    }
    if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA) {
        EVP_PKEY_free(key);
        throw AdbError(QString("%1 is not an RSA key").arg(path));
    }

    qCDebug(lcAdbAuth) << "loaded key" << path;
    return std::unique_ptr<RsaKeySigner>(new RsaKeySigner(key, pub));
}

QByteArray RsaKeySigner::sign(const QByteArray& token)
{
    // The token is used as an already computed SHA-1 digest.
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key, 0);
    if (!ctx) {
        throw AdbError("cannot create signing context: " + opensslError());
    }

    size_t sigLen = 0;
    if (EVP_PKEY_sign_init(ctx) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) != 1 ||
        EVP_PKEY_CTX_set_signature_md(ctx, EVP_sha1()) != 1 ||
        EVP_PKEY_sign(ctx, 0, &sigLen,
                      reinterpret_cast<const unsigned char*>(token.constData()), token.size()) != 1) {
        EVP_PKEY_CTX_free(ctx);
        throw AdbError("cannot prepare signature: " + opensslError());
    }

    QByteArray signature(int(sigLen), '\0');
    if (EVP_PKEY_sign(ctx, reinterpret_cast<unsigned char*>(signature.data()), &sigLen,
                      reinterpret_cast<const unsigned char*>(token.constData()), token.size()) != 1) {
        EVP_PKEY_CTX_free(ctx);
        throw AdbError("signing the auth token failed: " + opensslError());
    }
    EVP_PKEY_CTX_free(ctx);

    signature.resize(int(sigLen));
    return signature;
}
