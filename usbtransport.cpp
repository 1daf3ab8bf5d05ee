#include "usbtransport.h"
#include "adberror.h"
#include "adblogging.h"
#include <QElapsedTimer>
#include <libusb.h>

const UsbInterfaceMatch UsbInterfaceMatch::AdbInterface = { 0xff, 0x42, 0x01 };
const UsbInterfaceMatch UsbInterfaceMatch::FastbootInterface = { 0xff, 0x42, 0x03 };

struct ContextDeleter {
    void operator()(libusb_context* ctx) { libusb_exit(ctx); }
};
typedef std::unique_ptr<libusb_context, ContextDeleter> unique_context;

struct ConfigDescriptorDeleter {
    void operator()(libusb_config_descriptor* desc) { libusb_free_config_descriptor(desc); }
};
typedef std::unique_ptr<libusb_config_descriptor, ConfigDescriptorDeleter> unique_config_descriptor;

struct DeviceHandleDeleter {
    void operator()(libusb_device_handle* h) { libusb_close(h); }
};
typedef std::unique_ptr<libusb_device_handle, DeviceHandleDeleter> unique_device_handle;

// Frees the list and drops the references libusb took on its entries.
class DeviceList
{
public:
    explicit DeviceList(libusb_context* ctx) : list(0)
    {
        count = libusb_get_device_list(ctx, &list);
        if (count < 0) {
            throw TransportError(QString("cannot list USB devices: %1").arg(libusb_error_name(count)));
        }
    }
    ~DeviceList() { libusb_free_device_list(list, 1); }

    ssize_t size() const { return count; }
    libusb_device* at(ssize_t i) const { return list[i]; }

private:
    libusb_device** list;
    ssize_t count;
};

struct UsbEndpoints
{
    int interfaceNumber;
    quint8 bulkIn;
    quint8 bulkOut;
    quint16 zeroMask;
};

static unique_context newContext()
{
    libusb_context* ctx = 0;
    int rc = libusb_init(&ctx);
    if (rc != 0) {
        throw TransportError(QString("libusb initialization failed: %1").arg(libusb_error_name(rc)));
    }
    return unique_context(ctx);
}

static QString portPathOf(libusb_device* device)
{
    uint8_t ports[7];
    int portCount = libusb_get_port_numbers(device, ports, 7);
    if (portCount <= 0) {
        return QString();
    }

    QString path = QString("%1-%2").arg(libusb_get_bus_number(device)).arg(ports[0]);
    for (int i = 1; i < portCount; i++) {
        path += QString(".%1").arg(ports[i]);
    }
    return path;
}

static bool endpointIsOutput(uint8_t endpoint)
{
    return (endpoint & LIBUSB_ENDPOINT_DIR_MASK) == LIBUSB_ENDPOINT_OUT;
}

static bool findInterface(libusb_device* device, const UsbInterfaceMatch& match, UsbEndpoints* out)
{
    libusb_config_descriptor* configRaw;
    int rc = libusb_get_active_config_descriptor(device, &configRaw);
    if (rc != 0) {
        qCDebug(lcAdbUsb) << "no active config descriptor at" << portPathOf(device) << libusb_error_name(rc);
        return false;
    }
    const unique_config_descriptor config(configRaw);

    for (int i = 0; i < config->bNumInterfaces; i++) {
        const libusb_interface& interface = config->interface[i];
        if (interface.num_altsetting == 0) {
            continue;
        }

        const libusb_interface_descriptor& desc = interface.altsetting[0];
        if (desc.bInterfaceClass != match.interfaceClass ||
            desc.bInterfaceSubClass != match.interfaceSubClass ||
            desc.bInterfaceProtocol != match.interfaceProtocol) {
            continue;
        }

        bool foundIn = false;
        bool foundOut = false;
        for (int e = 0; e < desc.bNumEndpoints; e++) {
            const libusb_endpoint_descriptor& ep = desc.endpoint[e];
            if ((ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK) != LIBUSB_TRANSFER_TYPE_BULK) {
                continue;
            }
            if (endpointIsOutput(ep.bEndpointAddress) && !foundOut) {
                foundOut = true;
                out->bulkOut = ep.bEndpointAddress;
                out->zeroMask = ep.wMaxPacketSize - 1;
            } else if (!endpointIsOutput(ep.bEndpointAddress) && !foundIn) {
                foundIn = true;
                out->bulkIn = ep.bEndpointAddress;
            }
        }

        if (foundIn && foundOut) {
            out->interfaceNumber = desc.bInterfaceNumber;
            return true;
        }
        qCWarning(lcAdbUsb) << "interface" << i << "at" << portPathOf(device) << "lacks bulk endpoints";
    }
    return false;
}

static QString serialOf(libusb_device_handle* handle, const libusb_device_descriptor& desc)
{
    if (desc.iSerialNumber == 0) {
        return QString();
    }
    unsigned char buf[256];
    int rc = libusb_get_string_descriptor_ascii(handle, desc.iSerialNumber, buf, sizeof buf);
    if (rc < 0) {
        qCDebug(lcAdbUsb) << "cannot read serial:" << libusb_error_name(rc);
        return QString();
    }
    return QString::fromLatin1(reinterpret_cast<const char*>(buf), rc);
}

static bool describe(libusb_device* device, libusb_device_handle* handle, UsbDeviceInfo* info)
{
    libusb_device_descriptor desc;
    if (libusb_get_device_descriptor(device, &desc) != 0) {
        return false;
    }
    info->vendorId = desc.idVendor;
    info->productId = desc.idProduct;
    info->portPath = portPathOf(device);
    info->serial = serialOf(handle, desc);
    return true;
}

QList<UsbDeviceInfo> UsbTransport::findDevices(const UsbInterfaceMatch& match)
{
    unique_context ctx = newContext();
    DeviceList devices(ctx.get());

    QList<UsbDeviceInfo> found;
    for (ssize_t i = 0; i < devices.size(); i++) {
        libusb_device* device = devices.at(i);
        UsbEndpoints endpoints;
        if (!findInterface(device, match, &endpoints)) {
            continue;
        }

        libusb_device_handle* raw = 0;
        int rc = libusb_open(device, &raw);
        if (rc != 0) {
            qCWarning(lcAdbUsb) << "cannot open device at" << portPathOf(device) << libusb_error_name(rc);
            continue;
        }
        unique_device_handle handle(raw);

        UsbDeviceInfo info;
        if (describe(device, handle.get(), &info)) {
            found << info;
        }
    }
    return found;
}

std::unique_ptr<UsbTransport> UsbTransport::open(const UsbInterfaceMatch& match,
                                                 const QString& serial,
                                                 const QString& portPath,
                                                 int timeoutMs)
{
    unique_context ctx = newContext();
    DeviceList devices(ctx.get());

    for (ssize_t i = 0; i < devices.size(); i++) {
        libusb_device* device = devices.at(i);
        if (!portPath.isEmpty() && portPathOf(device) != portPath) {
            continue;
        }

        UsbEndpoints endpoints;
        if (!findInterface(device, match, &endpoints)) {
            continue;
        }

        libusb_device_handle* raw = 0;
        int rc = libusb_open(device, &raw);
        if (rc != 0) {
            qCWarning(lcAdbUsb) << "cannot open device at" << portPathOf(device) << libusb_error_name(rc);
            continue;
        }
        unique_device_handle handle(raw);

        UsbDeviceInfo info;
        if (!describe(device, handle.get(), &info)) {
            continue;
        }
        if (!serial.isEmpty() && info.serial != serial) {
            continue;
        }

        libusb_set_auto_detach_kernel_driver(handle.get(), 1);
        rc = libusb_claim_interface(handle.get(), endpoints.interfaceNumber);
        if (rc != 0) {
            throw TransportError(QString("failed to claim interface %1 of %2: %3")
                                     .arg(endpoints.interfaceNumber)
                                     .arg(info.serial.isEmpty() ? info.portPath : info.serial)
                                     .arg(libusb_error_name(rc)));
        }

        // Stale data toggles from a previous session make the first transfer hang.
        libusb_clear_halt(handle.get(), endpoints.bulkIn);
        libusb_clear_halt(handle.get(), endpoints.bulkOut);

        qCDebug(lcAdbUsb) << "opened" << info.serial << "at" << info.portPath
                          << "interface" << endpoints.interfaceNumber;

        std::unique_ptr<UsbTransport> transport(
            new UsbTransport(ctx.release(), handle.release(), endpoints.interfaceNumber,
                             endpoints.bulkIn, endpoints.bulkOut, endpoints.zeroMask, info));
        transport->setTimeout(timeoutMs);
        return transport;
    }

    QString filter;
    if (!serial.isEmpty()) {
        filter += " with serial " + serial;
    }
    if (!portPath.isEmpty()) {
        filter += " at port " + portPath;
    }
    throw TransportError("no USB device found" + filter);
}

UsbTransport::UsbTransport(libusb_context* ctx, libusb_device_handle* handle, int interfaceNumber,
                           quint8 readEndpoint, quint8 writeEndpoint, quint16 zeroMask,
                           const UsbDeviceInfo& info)
    : ctx(ctx), handle(handle), interfaceNumber(interfaceNumber),
      readEndpoint(readEndpoint), writeEndpoint(writeEndpoint), zeroMask(zeroMask),
      info(info), closed(0)
{
}

UsbTransport::~UsbTransport()
{
    close();
    libusb_release_interface(handle, interfaceNumber);
    libusb_close(handle);
    libusb_exit(ctx);
}

QString UsbTransport::description() const
{
    return info.serial.isEmpty() ? "usb:" + info.portPath : info.serial;
}

QByteArray UsbTransport::read(int maxBytes, int timeoutMs)
{
    if (closed.loadAcquire()) {
        throw ConnectionClosedError(QString("connection to %1 closed").arg(description()));
    }

    QByteArray buf(maxBytes, '\0');
    int transferred = 0;
    int rc = libusb_bulk_transfer(handle, readEndpoint, reinterpret_cast<unsigned char*>(buf.data()),
                                  maxBytes, &transferred, timeoutMs);

    if (closed.loadAcquire()) {
        throw ConnectionClosedError(QString("connection to %1 closed").arg(description()));
    }
    if (rc == LIBUSB_ERROR_TIMEOUT && transferred == 0) {
        return QByteArray();
    }
    if (rc == LIBUSB_ERROR_NO_DEVICE) {
        closed.storeRelease(1);
        throw ConnectionClosedError(QString("%1 was disconnected").arg(description()));
    }
    if (rc != 0 && rc != LIBUSB_ERROR_TIMEOUT) {
        throw TransportError(QString("bulk read from %1 failed: %2").arg(description()).arg(libusb_error_name(rc)));
    }
    buf.resize(transferred);
    return buf;
}

void UsbTransport::write(const QByteArray& data, int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();

    int done = 0;
    while (done < data.size()) {
        if (closed.loadAcquire()) {
            throw ConnectionClosedError(QString("connection to %1 closed").arg(description()));
        }
        int remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0) {
            throw TimeoutError(QString("writing to %1 timed out after %2ms").arg(description()).arg(timeoutMs));
        }

        int transferred = 0;
        unsigned char* p = reinterpret_cast<unsigned char*>(const_cast<char*>(data.constData())) + done;
        int rc = libusb_bulk_transfer(handle, writeEndpoint, p, data.size() - done, &transferred, remaining);
        done += transferred;
        if (rc == LIBUSB_ERROR_TIMEOUT) {
            continue;
        }
        if (rc == LIBUSB_ERROR_NO_DEVICE) {
            closed.storeRelease(1);
            throw ConnectionClosedError(QString("%1 was disconnected").arg(description()));
        }
        if (rc != 0) {
            throw TransportError(QString("bulk write to %1 failed: %2").arg(description()).arg(libusb_error_name(rc)));
        }
    }

    // A transfer that is an exact multiple of the packet size needs a
    // zero-length packet so the device sees where it ends.
    if (data.size() != 0 && zeroMask != 0 && (data.size() & zeroMask) == 0) {
        int transferred = 0;
        int rc = libusb_bulk_transfer(handle, writeEndpoint, 0, 0, &transferred, timeoutMs);
        if (rc != 0) {
            throw TransportError(QString("zero-length write to %1 failed: %2").arg(description()).arg(libusb_error_name(rc)));
        }
    }
}

void UsbTransport::close()
{
    if (closed.testAndSetOrdered(0, 1)) {
        qCDebug(lcAdbUsb) << "closing" << description();
    }
}

bool UsbTransport::isOpen() const
{
    return !closed.loadAcquire();
}
