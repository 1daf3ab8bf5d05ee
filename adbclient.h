// -*- mode: c++ -*-
#ifndef ADBCLIENT_H
#define ADBCLIENT_H
#include "adbconnection.h"
#include "filesync.h"
#include "usbtransport.h"
#include <QString>
#include <QStringList>
#include <functional>

class QIODevice;

typedef std::function<void(const QByteArray&)> OutputSink;

/** Device operations, each run on a stream of its own over an established connection. */
class AdbClient
{
public:
    explicit AdbClient(AdbConnection* connection);

    /** Opens a TCP connection when serial looks like host[:port], otherwise
    the first USB device matching serial and portPath, and authenticates. */
    static std::unique_ptr<AdbConnection> connectDevice(const QString& serial,
                                                        const QString& portPath,
                                                        const ConnectionOptions& options,
                                                        const QList<AuthSigner*>& signers);

    static QList<UsbDeviceInfo> devices();

    QString shell(const QStringList& cmdAndArgs);
    QString shell(const QString& cmdLine);
    void streamingShell(const QString& cmdLine, const OutputSink& sink);

    /** Opens "service:argument" and returns everything it wrote. */
    QByteArray command(const QString& service, const QString& argument = QString());

    /** A file lands inside remotePath when that is a directory; a directory is
    pushed recursively. */
    void push(const QString& localPath, const QString& remotePath);
    void push(QIODevice* source, const QString& remotePath,
              quint32 mode = SYNC_DEFAULT_PUSH_MODE, quint32 mtime = 0);

    /** The local file is only replaced once the whole file arrived. */
    void pull(const QString& remotePath, const QString& localPath);
    QByteArray pull(const QString& remotePath);

    SyncStat stat(const QString& remotePath);
    QList<SyncDirEntry> list(const QString& remotePath);

    QString install(const QString& apkPath, const QString& destinationDir = "/data/local/tmp/");
    QString uninstall(const QString& package, bool keepData = false);

    void logcat(const QString& options, const OutputSink& sink);

    void reboot(const QString& target = QString());
    void rebootBootloader();
    QString remount();
    QString root();

    QString deviceState() const;

private:
    void doSyncPush(FileSync* sync, const QString& lpath, const QString& rpath);
    void doPushDirectory(const QString& lpath, const QString& rpath);

    AdbConnection* connection;
};

#endif // ADBCLIENT_H
