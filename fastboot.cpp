#include "fastboot.h"
#include "adberror.h"
#include "adblogging.h"
#include <QFile>
#include <QIODevice>

FastbootProtocol::FastbootProtocol(Transport* transport, int chunkKb)
    : transport(transport), chunkBytes(chunkKb * 1024)
{
    if (chunkKb <= 0) {
        throw AdbError(QString("chunk size must be positive, got %1 KiB").arg(chunkKb));
    }
}

void FastbootProtocol::info(const FastbootMessage& message)
{
    qCDebug(lcFastboot) << message.header << message.message;
    if (infoCallback) {
        infoCallback(message);
    }
}

void FastbootProtocol::writeCommand(const QString& command)
{
    QByteArray raw = command.toUtf8();
    if (raw.size() > FASTBOOT_COMMAND_MAX) {
        throw AdbError(QString("fastboot command longer than %1 bytes: %2")
                           .arg(FASTBOOT_COMMAND_MAX).arg(command));
    }
    qCDebug(lcFastboot) << ">>" << raw;
    transport->write(raw, transport->timeout());
}

FastbootMessage FastbootProtocol::acceptResponses(const QByteArray& expected, int timeoutMs)
{
    if (timeoutMs < 0) {
        timeoutMs = transport->timeout();
    }

    for (;;) {
        QByteArray response = transport->read(FASTBOOT_RESPONSE_SIZE, timeoutMs);
        if (response.isEmpty()) {
            throw TimeoutError(QString("no response from %1 within %2ms")
                                   .arg(transport->description()).arg(timeoutMs));
        }

        FastbootMessage message;
        message.header = response.left(4);
        message.message = QString::fromUtf8(response.mid(4));
        qCDebug(lcFastboot) << "<<" << response;

        if (message.header == "INFO") {
            info(message);
        } else if (message.header == "OKAY" || message.header == "DATA") {
            if (message.header != expected) {
                throw ProtocolError(ProtocolError::UnexpectedCommand,
                                    QString("expected %1, got %2")
                                        .arg(QString::fromLatin1(expected))
                                        .arg(QString::fromLatin1(message.header)));
            }
            if (message.header == "OKAY") {
                info(message);
            }
            return message;
        } else if (message.header == "FAIL") {
            info(message);
            throw RemoteApplicationError(message.message);
        } else {
            throw ProtocolError(ProtocolError::InvalidResponse,
                                QString("unknown header %1 and response %2")
                                    .arg(QString::fromLatin1(message.header.toHex()))
                                    .arg(message.message));
        }
    }
}

FastbootMessage FastbootProtocol::sendCommand(const QString& command, int timeoutMs)
{
    writeCommand(command);
    return acceptResponses("OKAY", timeoutMs);
}

FastbootMessage FastbootProtocol::downloadData(QIODevice* source, qint64 length, int timeoutMs)
{
    writeCommand(QString("download:%1").arg(length, 8, 16, QChar('0')));

    FastbootMessage data = acceptResponses("DATA", timeoutMs);
    bool ok = false;
    qint64 accepted = data.message.left(8).toLongLong(&ok, 16);
    if (!ok) {
        throw ProtocolError(ProtocolError::InvalidResponse,
                            QString("bad DATA size '%1'").arg(data.message));
    }
    if (accepted != length) {
        throw RemoteApplicationError(QString("device refused to download %1 bytes of data (accepts %2 bytes)")
                                         .arg(length).arg(accepted));
    }

    qint64 remaining = length;
    while (remaining > 0) {
        QByteArray chunk = source->read(qMin<qint64>(chunkBytes, remaining));
        if (chunk.isEmpty()) {
            throw AdbError(QString("local data ended %1 bytes short: %2")
                               .arg(remaining).arg(source->errorString()));
        }
        transport->write(chunk, transport->timeout());
        remaining -= chunk.size();
    }

    return acceptResponses("OKAY", timeoutMs);
}

FastbootCommands::FastbootCommands(std::unique_ptr<Transport> transport, int chunkKb)
    : link(std::move(transport)), protocol(link.get(), chunkKb)
{
}

std::unique_ptr<FastbootCommands> FastbootCommands::connectDevice(const QString& serial,
                                                                  const QString& portPath,
                                                                  int timeoutMs,
                                                                  int chunkKb)
{
    std::unique_ptr<Transport> transport(
        UsbTransport::open(UsbInterfaceMatch::FastbootInterface, serial, portPath, timeoutMs));
    return std::unique_ptr<FastbootCommands>(new FastbootCommands(std::move(transport), chunkKb));
}

QList<UsbDeviceInfo> FastbootCommands::devices()
{
    return UsbTransport::findDevices(UsbInterfaceMatch::FastbootInterface);
}

QString FastbootCommands::getvar(const QString& var)
{
    return protocol.sendCommand("getvar:" + var).message;
}

QString FastbootCommands::download(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw AdbError(QString("cannot open %1: %2").arg(path).arg(file.errorString()));
    }
    return download(&file, file.size());
}

QString FastbootCommands::download(QIODevice* source, qint64 length)
{
    return protocol.downloadData(source, length).message;
}

QString FastbootCommands::flash(const QString& partition, int timeoutMs)
{
    return protocol.sendCommand("flash:" + partition, timeoutMs).message;
}

QString FastbootCommands::flashFromFile(const QString& partition, const QString& path)
{
    QString downloaded = download(path);
    return downloaded + flash(partition);
}

QString FastbootCommands::erase(const QString& partition, int timeoutMs)
{
    return protocol.sendCommand("erase:" + partition, timeoutMs).message;
}

QString FastbootCommands::oem(const QString& command, int timeoutMs)
{
    return protocol.sendCommand("oem " + command, timeoutMs).message;
}

QString FastbootCommands::continueBoot()
{
    return protocol.sendCommand("continue").message;
}

QString FastbootCommands::reboot(const QString& target, int timeoutMs)
{
    QString command = "reboot";
    if (!target.isEmpty()) {
        command += ":" + target;
    }
    return protocol.sendCommand(command, timeoutMs).message;
}

QString FastbootCommands::rebootBootloader(int timeoutMs)
{
    return protocol.sendCommand("reboot-bootloader", timeoutMs).message;
}

void FastbootCommands::close()
{
    link->close();
}
