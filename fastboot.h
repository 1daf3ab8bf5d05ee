// -*- mode: c++ -*-
#ifndef FASTBOOT_H
#define FASTBOOT_H
#include "transport.h"
#include "usbtransport.h"
#include <QList>
#include <QString>
#include <functional>
#include <memory>

class QIODevice;

const int FASTBOOT_COMMAND_MAX = 64;
const int FASTBOOT_RESPONSE_SIZE = 64;

/** One response packet: a 4-byte header (INFO, OKAY, FAIL, DATA) and its text. */
struct FastbootMessage
{
    QByteArray header;
    QString message;
};

typedef std::function<void(const FastbootMessage&)> FastbootInfoCallback;

/** Command/response exchange with a bootloader. No framing beyond the
transport's: every command and every response is one transfer. */
class FastbootProtocol
{
public:
    explicit FastbootProtocol(Transport* transport, int chunkKb = 1024);

    /** Sends command and collects responses up to OKAY, which is returned.
    INFO lines go to the info callback on the way. Throws
    RemoteApplicationError on FAIL and ProtocolError on DATA or an
    unknown header. */
    FastbootMessage sendCommand(const QString& command, int timeoutMs = -1);

    /** download:<size>, then length bytes of source in chunkKb pieces.
    Throws RemoteApplicationError when the device will not take that size. */
    FastbootMessage downloadData(QIODevice* source, qint64 length, int timeoutMs = -1);

    void setInfoCallback(const FastbootInfoCallback& callback) { infoCallback = callback; }
    int chunkSize() const { return chunkBytes; }

private:
    void writeCommand(const QString& command);
    FastbootMessage acceptResponses(const QByteArray& expected, int timeoutMs);
    void info(const FastbootMessage& message);

    Transport* transport;
    int chunkBytes;
    FastbootInfoCallback infoCallback;
};

/** Bootloader operations on one device. */
class FastbootCommands
{
public:
    FastbootCommands(std::unique_ptr<Transport> transport, int chunkKb = 1024);

    static std::unique_ptr<FastbootCommands> connectDevice(const QString& serial,
                                                           const QString& portPath,
                                                           int timeoutMs,
                                                           int chunkKb = 1024);
    static QList<UsbDeviceInfo> devices();

    QString getvar(const QString& var);
    QString download(const QString& path);
    QString download(QIODevice* source, qint64 length);
    QString flash(const QString& partition, int timeoutMs = -1);
    QString flashFromFile(const QString& partition, const QString& path);
    QString erase(const QString& partition, int timeoutMs = -1);
    QString oem(const QString& command, int timeoutMs = -1);
    QString continueBoot();
    QString reboot(const QString& target = QString(), int timeoutMs = -1);
    QString rebootBootloader(int timeoutMs = -1);

    void setInfoCallback(const FastbootInfoCallback& callback) { protocol.setInfoCallback(callback); }

    void close();

private:
    std::unique_ptr<Transport> link;
    FastbootProtocol protocol;
};

#endif // FASTBOOT_H
