#include "adbclient.h"
#include "adberror.h"
#include "adblogging.h"
#include "tcptransport.h"
#include <QBuffer>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

AdbClient::AdbClient(AdbConnection* connection)
    : connection(connection)
{
}

std::unique_ptr<AdbConnection> AdbClient::connectDevice(const QString& serial,
                                                        const QString& portPath,
                                                        const ConnectionOptions& options,
                                                        const QList<AuthSigner*>& signers)
{
    std::unique_ptr<Transport> transport;
    QString host;
    quint16 port;
    if (serial.contains(':') && TcpTransport::parseSerial(serial, &host, &port)) {
        transport = TcpTransport::connectTo(host, port, options.timeoutMs);
    } else {
        transport = UsbTransport::open(UsbInterfaceMatch::AdbInterface, serial, portPath, options.timeoutMs);
    }

    std::unique_ptr<AdbConnection> connection(new AdbConnection(std::move(transport), options));
    connection->connect(signers);
    return connection;
}

QList<UsbDeviceInfo> AdbClient::devices()
{
    return UsbTransport::findDevices(UsbInterfaceMatch::AdbInterface);
}

QString AdbClient::deviceState() const
{
    return connection->deviceState();
}

QByteArray AdbClient::command(const QString& service, const QString& argument)
{
    std::unique_ptr<AdbStream> stream = connection->openStream(service + ":" + argument);
    QByteArray output = stream->readAll();
    stream->close();
    return output;
}

QString AdbClient::shell(const QStringList& cmdAndArgs)
{
    QString cmdLine;
    foreach(const QString& a, cmdAndArgs) {
        if (!cmdLine.isEmpty()) {
            cmdLine += " ";
        }
        cmdLine += a;
    }
    return shell(cmdLine);
}

QString AdbClient::shell(const QString& cmdLine)
{
    return QString::fromUtf8(command("shell", cmdLine));
}

void AdbClient::streamingShell(const QString& cmdLine, const OutputSink& sink)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("shell:" + cmdLine);
    QByteArray data;
    while (stream->read(&data)) {
        sink(data);
    }
    stream->close();
}

void AdbClient::logcat(const QString& options, const OutputSink& sink)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("shell:logcat " + options);
    // logcat runs until interrupted.
    stream->setTimeout(24 * 3600 * 1000);
    QByteArray data;
    while (stream->read(&data)) {
        sink(data);
    }
    stream->close();
}

void AdbClient::doSyncPush(FileSync* sync, const QString& lpath, const QString& rpath)
{
    QFileInfo lInfo(lpath);
    QFile file(lpath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw AdbError(QString("cannot open %1: %2").arg(lpath).arg(file.errorString()));
    }

    QString finalRemotePath = rpath;
    SyncStat st;
    if (sync->tryStat(rpath, &st) && st.isDirectory()) {
        // copying a local file into a remote directory means
        // remotedir + "/" + localfilename
        finalRemotePath += "/" + lInfo.fileName();
    }

    sync->push(&file, finalRemotePath, SYNC_DEFAULT_PUSH_MODE, lInfo.lastModified().toTime_t());
}

void AdbClient::doPushDirectory(const QString& lpath, const QString& rpath)
{
    shell(QStringList() << "mkdir" << "-p" << rpath);

    QDir dir(lpath);
    foreach(const QFileInfo& entry, dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                                                      QDir::Name)) {
        push(entry.filePath(), rpath + "/" + entry.fileName());
    }
}

void AdbClient::push(const QString& localPath, const QString& remotePath)
{
    QFileInfo lInfo(localPath);
    if (!lInfo.exists()) {
        throw AdbError(QString("cannot stat '%1': No such file or directory").arg(localPath));
    }
    if (lInfo.isDir()) {
        doPushDirectory(localPath, remotePath);
        return;
    }

    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    doSyncPush(&sync, localPath, remotePath);
    sync.quit();
    stream->close();
}

void AdbClient::push(QIODevice* source, const QString& remotePath, quint32 mode, quint32 mtime)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    sync.push(source, remotePath, mode, mtime);
    sync.quit();
    stream->close();
}

void AdbClient::pull(const QString& remotePath, const QString& localPath)
{
    QString target = localPath;
    if (QFileInfo(localPath).isDir()) {
        target = QDir(localPath).filePath(QFileInfo(remotePath).fileName());
    }

    QSaveFile file(target);
    if (!file.open(QIODevice::WriteOnly)) {
        throw AdbError(QString("cannot create %1: %2").arg(target).arg(file.errorString()));
    }

    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    sync.pull(remotePath, &file);
    if (!file.commit()) {
        throw AdbError(QString("cannot write %1: %2").arg(target).arg(file.errorString()));
    }
    sync.quit();
    stream->close();
}

QByteArray AdbClient::pull(const QString& remotePath)
{
    QBuffer buffer;
    buffer.open(QIODevice::WriteOnly);

    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    sync.pull(remotePath, &buffer);
    sync.quit();
    stream->close();
    return buffer.data();
}

SyncStat AdbClient::stat(const QString& remotePath)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    SyncStat st = sync.stat(remotePath);
    sync.quit();
    stream->close();
    return st;
}

QList<SyncDirEntry> AdbClient::list(const QString& remotePath)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("sync:");
    FileSync sync(stream.get());
    QList<SyncDirEntry> entries = sync.list(remotePath);
    sync.quit();
    stream->close();
    return entries;
}

QString AdbClient::install(const QString& apkPath, const QString& destinationDir)
{
    QString destination = destinationDir;
    if (!destination.endsWith('/')) {
        destination += '/';
    }
    destination += QFileInfo(apkPath).fileName();

    push(apkPath, destination);
    return shell(QString("pm install -r \"%1\"").arg(destination));
}

QString AdbClient::uninstall(const QString& package, bool keepData)
{
    QStringList cmd;
    cmd << "pm" << "uninstall";
    if (keepData) {
        cmd << "-k";
    }
    cmd << package;
    return shell(cmd);
}

void AdbClient::reboot(const QString& target)
{
    std::unique_ptr<AdbStream> stream = connection->openStream("reboot:" + target);
    try {
        stream->readAll();
    } catch (const ConnectionClosedError& e) {
        qCDebug(lcAdbStream) << "device went away while rebooting:" << e.message();
    }
}

void AdbClient::rebootBootloader()
{
    reboot("bootloader");
}

QString AdbClient::remount()
{
    return QString::fromUtf8(command("remount"));
}

QString AdbClient::root()
{
    return QString::fromUtf8(command("root"));
}
