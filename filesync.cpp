#include "filesync.h"
#include "adberror.h"
#include "adblogging.h"
#include "adbstream.h"
#include <QDateTime>
#include <QIODevice>
#include <QtEndian>
#include <string.h>

static QString idName(quint32 id)
{
    char name[5];
    qToLittleEndian<quint32>(id, reinterpret_cast<uchar*>(name));
    name[4] = 0;
    for (int i = 0; i < 4; i++) {
        if (name[i] < 0x20 || name[i] > 0x7e) {
            return QString("0x%1").arg(id, 8, 16, QChar('0'));
        }
    }
    return QString::fromLatin1(name);
}

SyncDirListing::~SyncDirListing()
{
    if (!done) {
        sync->busy = false;
        sync->broken = true;
    }
}

bool SyncDirListing::next(SyncDirEntry* entry)
{
    if (done) {
        return false;
    }
    try {
        if (!sync->nextEntry(entry)) {
            done = true;
        }
    } catch (const RemoteApplicationError&) {
        done = true;
        throw;
    }
    return !done;
}

SyncPullReader::~SyncPullReader()
{
    if (!done) {
        sync->busy = false;
        sync->broken = true;
    }
}

bool SyncPullReader::next(QByteArray* chunk)
{
    if (done) {
        return false;
    }
    try {
        if (!sync->nextChunk(chunk)) {
            done = true;
        }
    } catch (const RemoteApplicationError&) {
        done = true;
        throw;
    }
    return !done;
}

FileSync::FileSync(AdbStream* stream)
    : stream(stream), busy(false), broken(false)
{
    dataMax = qMin<int>(SYNC_DATA_MAX, stream->maxPayload());
}

void FileSync::checkIdle() const
{
    if (broken) {
        throw StreamClosedError("sync session was abandoned in the middle of a transfer");
    }
    if (busy) {
        throw AdbError("sync session is still reading a listing or a file");
    }
}

void FileSync::queue(const void* record, int size, const QByteArray& data)
{
    txBuffer.append(static_cast<const char*>(record), size);
    txBuffer.append(data);
    if (txBuffer.size() >= int(stream->maxPayload())) {
        flush();
    }
}

void FileSync::sendRequest(quint32 id, const QByteArray& data)
{
    syncmsg msg;
    msg.req.id = qToLittleEndian<quint32>(id);
    msg.req.namelen = qToLittleEndian<quint32>(data.size());
    queue(&msg.req, sizeof(msg.req), data);
}

void FileSync::flush()
{
    if (txBuffer.isEmpty()) {
        return;
    }
    QByteArray pending = txBuffer;
    txBuffer.clear();
    stream->write(pending);
}

void FileSync::readExact(void* dest, int size)
{
    flush();
    while (rxBuffer.size() < size) {
        QByteArray data;
        if (!stream->read(&data)) {
            throw StreamClosedError("device closed the sync stream");
        }
        rxBuffer += data;
    }
    memcpy(dest, rxBuffer.constData(), size);
    rxBuffer.remove(0, size);
}

QByteArray FileSync::readBytes(int size)
{
    QByteArray data(size, '\0');
    if (size > 0) {
        readExact(data.data(), size);
    }
    return data;
}

void FileSync::raiseFailure(quint32 msglen)
{
    if (msglen > SYNC_DATA_MAX) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("FAIL message of %1 bytes").arg(msglen));
    }
    QByteArray message = readBytes(msglen);
    qCDebug(lcAdbSync) << "device failed the request:" << message;
    throw RemoteApplicationError(QString::fromUtf8(message));
}

void FileSync::readStatus(const QString& what)
{
    syncmsg msg;
    readExact(&msg.status, sizeof(msg.status));
    quint32 id = qFromLittleEndian<quint32>(msg.status.id);
    if (id == ID_OKAY) {
        return;
    }
    if (id == ID_FAIL) {
        raiseFailure(qFromLittleEndian<quint32>(msg.status.msglen));
    }
    throw ProtocolError(ProtocolError::InvalidResponse,
                        QString("expected OKAY or FAIL after %1, got %2").arg(what).arg(idName(id)));
}

void FileSync::checkPath(const QString& path) const
{
    if (path.toUtf8().size() > SYNC_PATH_MAX) {
        throw AdbError(QString("remote path too long: %1").arg(path));
    }
}

bool FileSync::tryStat(const QString& path, SyncStat* st)
{
    checkIdle();
    checkPath(path);
    qCDebug(lcAdbSync) << "STAT" << path;
    sendRequest(ID_STAT, path.toUtf8());

    // A FAIL is only id and length, so the rest of STAT is read after the id.
    syncmsg msg;
    readExact(&msg.req, sizeof(msg.req));
    quint32 id = qFromLittleEndian<quint32>(msg.req.id);
    if (id == ID_FAIL) {
        raiseFailure(qFromLittleEndian<quint32>(msg.status.msglen));
    }
    if (id != ID_STAT) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("expected STAT in reply to STAT, got %1").arg(idName(id)));
    }
    readExact(&msg.stat.size, sizeof(msg.stat) - sizeof(msg.req));

    st->mode = qFromLittleEndian<quint32>(msg.stat.mode);
    st->size = qFromLittleEndian<quint32>(msg.stat.size);
    st->mtime = qFromLittleEndian<quint32>(msg.stat.time);
    return st->mode != 0;
}

SyncStat FileSync::stat(const QString& path)
{
    SyncStat st;
    if (!tryStat(path, &st)) {
        throw RemoteNotFoundError(path);
    }
    return st;
}

std::unique_ptr<SyncDirListing> FileSync::openList(const QString& path)
{
    checkIdle();
    checkPath(path);
    qCDebug(lcAdbSync) << "LIST" << path;
    sendRequest(ID_LIST, path.toUtf8());
    flush();
    busy = true;
    return std::unique_ptr<SyncDirListing>(new SyncDirListing(this));
}

bool FileSync::nextEntry(SyncDirEntry* entry)
{
    syncmsg msg;
    readExact(&msg.dent, sizeof(msg.req));
    quint32 id = qFromLittleEndian<quint32>(msg.dent.id);
    if (id == ID_FAIL) {
        busy = false;
        raiseFailure(qFromLittleEndian<quint32>(msg.status.msglen));
    }
    if (id != ID_DENT && id != ID_DONE) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("expected DENT or DONE in a listing, got %1").arg(idName(id)));
    }

    readExact(&msg.dent.size, sizeof(msg.dent) - sizeof(msg.req));
    if (id == ID_DONE) {
        busy = false;
        return false;
    }

    quint32 namelen = qFromLittleEndian<quint32>(msg.dent.namelen);
    if (namelen > SYNC_PATH_MAX) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("directory entry name of %1 bytes").arg(namelen));
    }
    entry->mode = qFromLittleEndian<quint32>(msg.dent.mode);
    entry->size = qFromLittleEndian<quint32>(msg.dent.size);
    entry->mtime = qFromLittleEndian<quint32>(msg.dent.time);
    entry->name = QString::fromUtf8(readBytes(namelen));
    return true;
}

QList<SyncDirEntry> FileSync::list(const QString& path)
{
    QList<SyncDirEntry> entries;
    std::unique_ptr<SyncDirListing> listing = openList(path);
    SyncDirEntry entry;
    while (listing->next(&entry)) {
        entries << entry;
    }
    return entries;
}

void FileSync::push(QIODevice* source, const QString& remotePath, quint32 mode, quint32 mtime)
{
    checkIdle();

    QByteArray target = remotePath.toUtf8() + "," + QByteArray::number(mode);
    if (target.size() > SYNC_PATH_MAX) {
        throw AdbError(QString("remote path too long: %1").arg(remotePath));
    }
    if (mtime == 0) {
        mtime = QDateTime::currentDateTime().toTime_t();
    }

    qCDebug(lcAdbSync) << "SEND" << target;
    try {
        sendRequest(ID_SEND, target);

        QByteArray chunk(dataMax, '\0');
        syncmsg msg;
        for (;;) {
            qint64 n = source->read(chunk.data(), dataMax);
            if (n < 0) {
                throw AdbError(QString("reading local data for %1 failed: %2")
                                   .arg(remotePath).arg(source->errorString()));
            }
            if (n == 0) {
                break;
            }
            msg.data.id = qToLittleEndian<quint32>(ID_DATA);
            msg.data.size = qToLittleEndian<quint32>(n);
            queue(&msg.data, sizeof(msg.data), chunk.left(n));
        }

        msg.data.id = qToLittleEndian<quint32>(ID_DONE);
        msg.data.size = qToLittleEndian<quint32>(mtime);
        queue(&msg.data, sizeof(msg.data));
        flush();
    } catch (const StreamClosedError&) {
        // The device closes the stream right after a FAIL; report its reason.
        txBuffer.clear();
        readStatus("SEND");
        throw;
    }

    readStatus("SEND");
}

std::unique_ptr<SyncPullReader> FileSync::openPull(const QString& remotePath)
{
    checkIdle();
    checkPath(remotePath);
    qCDebug(lcAdbSync) << "RECV" << remotePath;
    sendRequest(ID_RECV, remotePath.toUtf8());
    flush();
    busy = true;
    return std::unique_ptr<SyncPullReader>(new SyncPullReader(this));
}

bool FileSync::nextChunk(QByteArray* chunk)
{
    syncmsg msg;
    readExact(&msg.data, sizeof(msg.data));
    quint32 id = qFromLittleEndian<quint32>(msg.data.id);
    quint32 size = qFromLittleEndian<quint32>(msg.data.size);

    switch (id) {
    case ID_DATA:
        if (size > SYNC_DATA_MAX) {
            throw ProtocolError(ProtocolError::InvalidResponse,
                                QString("DATA record of %1 bytes").arg(size));
        }
        *chunk = readBytes(size);
        return true;
    case ID_DONE:
        busy = false;
        return false;
    case ID_FAIL:
        busy = false;
        raiseFailure(size);
    }
    throw ProtocolError(ProtocolError::InvalidResponse,
                        QString("expected DATA or DONE while receiving, got %1").arg(idName(id)));
}

void FileSync::pull(const QString& remotePath, QIODevice* sink)
{
    std::unique_ptr<SyncPullReader> reader = openPull(remotePath);
    QByteArray chunk;
    while (reader->next(&chunk)) {
        if (sink->write(chunk) != chunk.size()) {
            throw AdbError(QString("writing %1 locally failed: %2").arg(remotePath).arg(sink->errorString()));
        }
    }
}

void FileSync::quit()
{
    checkIdle();
    qCDebug(lcAdbSync) << "QUIT";
    sendRequest(ID_QUIT, QByteArray());
    flush();
}
