// -*- mode: c++ -*-
#ifndef FILESYNC_H
#define FILESYNC_H
#include <QByteArray>
#include <QList>
#include <QString>
#include <memory>
#include <sys/stat.h>

class AdbStream;
class QIODevice;

#define MKID(a,b,c,d) ((a) | ((b) << 8) | ((c) << 16) | ((d) << 24))

#define ID_STAT MKID('S','T','A','T')
#define ID_LIST MKID('L','I','S','T')
#define ID_SEND MKID('S','E','N','D')
#define ID_RECV MKID('R','E','C','V')
#define ID_DENT MKID('D','E','N','T')
#define ID_DONE MKID('D','O','N','E')
#define ID_DATA MKID('D','A','T','A')
#define ID_OKAY MKID('O','K','A','Y')
#define ID_FAIL MKID('F','A','I','L')
#define ID_QUIT MKID('Q','U','I','T')

const int SYNC_DATA_MAX = 64 * 1024;
const int SYNC_PATH_MAX = 1024;
const quint32 SYNC_DEFAULT_PUSH_MODE = S_IFREG | 0770;

typedef union {
    quint32 id;
    struct {
        quint32 id;
        quint32 namelen;
    } req;
    struct {
        quint32 id;
        quint32 mode;
        quint32 size;
        quint32 time;
    } stat;
    struct {
        quint32 id;
        quint32 mode;
        quint32 size;
        quint32 time;
        quint32 namelen;
    } dent;
    struct {
        quint32 id;
        quint32 size;
    } data;
    struct {
        quint32 id;
        quint32 msglen;
    } status;
} syncmsg;

struct SyncStat
{
    quint32 mode;
    quint32 size;
    quint32 mtime;

    SyncStat() : mode(0), size(0), mtime(0) {}

    bool isDirectory() const { return S_ISDIR(mode); }
    bool isRegularFile() const { return S_ISREG(mode); }
};

struct SyncDirEntry
{
    QString name;
    quint32 mode;
    quint32 size;
    quint32 mtime;

    SyncDirEntry() : mode(0), size(0), mtime(0) {}
};

class FileSync;

/** Entries of one LIST request, read as they arrive. Not restartable.
Must not outlive the FileSync that opened it. */
class SyncDirListing
{
public:
    ~SyncDirListing();

    /** False once the device sent DONE. */
    bool next(SyncDirEntry* entry);

private:
    friend class FileSync;
    explicit SyncDirListing(FileSync* sync) : sync(sync), done(false) {}

    FileSync* sync;
    bool done;
};

/** Contents of one RECV request, chunk by chunk.

A FAIL part way through throws RemoteApplicationError after some chunks were
already handed out; a caller that needs all-or-nothing keeps them aside
until next() returned false. Must not outlive the FileSync that opened it. */
class SyncPullReader
{
public:
    ~SyncPullReader();

    bool next(QByteArray* chunk);

private:
    friend class FileSync;
    explicit SyncPullReader(FileSync* sync) : sync(sync), done(false) {}

    FileSync* sync;
    bool done;
};

/** The sync: service. Requests run one at a time on the stream it was given. */
class FileSync
{
public:
    explicit FileSync(AdbStream* stream);

    /** Throws RemoteNotFoundError when the device reports mode 0. */
    SyncStat stat(const QString& path);

    /** Like stat() but returns false instead of throwing for a missing path.
    A FAIL from the device is still thrown as RemoteApplicationError. */
    bool tryStat(const QString& path, SyncStat* st);

    std::unique_ptr<SyncDirListing> openList(const QString& path);
    QList<SyncDirEntry> list(const QString& path);

    /** Sends everything source yields as remotePath. mtime 0 stands for now.
    Throws RemoteApplicationError with the device's message when it refuses. */
    void push(QIODevice* source, const QString& remotePath,
              quint32 mode = SYNC_DEFAULT_PUSH_MODE, quint32 mtime = 0);

    std::unique_ptr<SyncPullReader> openPull(const QString& remotePath);
    void pull(const QString& remotePath, QIODevice* sink);

    /** Ends the session; the device closes the stream afterwards. */
    void quit();

    /** Payload size of each DATA record sent by push(). */
    int chunkSize() const { return dataMax; }

private:
    friend class SyncDirListing;
    friend class SyncPullReader;

    void checkIdle() const;
    void checkPath(const QString& path) const;
    void sendRequest(quint32 id, const QByteArray& data);
    void queue(const void* record, int size, const QByteArray& data = QByteArray());
    void flush();
    void readExact(void* dest, int size);
    QByteArray readBytes(int size);
    void readStatus(const QString& what);
    void raiseFailure(quint32 msglen);

    bool nextEntry(SyncDirEntry* entry);
    bool nextChunk(QByteArray* chunk);

    AdbStream* stream;
    QByteArray txBuffer;
    QByteArray rxBuffer;
    int dataMax;
    bool busy;
    bool broken;
};

#endif // FILESYNC_H
