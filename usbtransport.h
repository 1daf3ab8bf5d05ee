// -*- mode: c++ -*-
#ifndef USBTRANSPORT_H
#define USBTRANSPORT_H
#include "transport.h"
#include <QAtomicInt>
#include <QList>
#include <memory>

struct libusb_context;
struct libusb_device_handle;

/** Interface class/subclass/protocol triple identifying a service on a device. */
struct UsbInterfaceMatch
{
    quint8 interfaceClass;
    quint8 interfaceSubClass;
    quint8 interfaceProtocol;

    static const UsbInterfaceMatch AdbInterface;
    static const UsbInterfaceMatch FastbootInterface;
};

struct UsbDeviceInfo
{
    QString serial;
    QString portPath;   // "<bus>-<port>[.<port>...]"
    quint16 vendorId;
    quint16 productId;

    UsbDeviceInfo() : vendorId(0), productId(0) {}
};

class UsbTransport : public Transport
{
public:
    ~UsbTransport();

    /** Every attached device exposing an interface that matches. */
    static QList<UsbDeviceInfo> findDevices(const UsbInterfaceMatch& match);

    /** Opens the first matching device, optionally filtered by serial and/or
    port path. Throws TransportError when nothing matches or the interface
    cannot be claimed. */
    static std::unique_ptr<UsbTransport> open(const UsbInterfaceMatch& match,
                                              const QString& serial = QString(),
                                              const QString& portPath = QString(),
                                              int timeoutMs = 10000);

    QByteArray read(int maxBytes, int timeoutMs);
    void write(const QByteArray& data, int timeoutMs);
    void close();
    bool isOpen() const;
    QString description() const;

    UsbDeviceInfo deviceInfo() const { return info; }

private:
    UsbTransport(libusb_context* ctx, libusb_device_handle* handle, int interfaceNumber,
                 quint8 readEndpoint, quint8 writeEndpoint, quint16 zeroMask,
                 const UsbDeviceInfo& info);

    libusb_context* ctx;
    libusb_device_handle* handle;
    int interfaceNumber;
    quint8 readEndpoint;
    quint8 writeEndpoint;
    quint16 zeroMask;
    UsbDeviceInfo info;
    QAtomicInt closed;
};

#endif // USBTRANSPORT_H
