// -*- mode: c++ -*-
#ifndef ADBERROR_H
#define ADBERROR_H
#include <QString>
#include <stdexcept>

/** Base class of everything the protocol engine throws.
Carries a human readable message; what() returns its UTF-8 form. */
class AdbError : public std::runtime_error
{
public:
    explicit AdbError(const QString& message);

    QString message() const { return msg; }

private:
    QString msg;
};

/** Device not found, USB claim failure, socket or bulk I/O failure. */
class TransportError : public AdbError
{
public:
    explicit TransportError(const QString& message) : AdbError(message) {}
};

/** A blocking read, open or handshake round-trip ran out of time. */
class TimeoutError : public TransportError
{
public:
    explicit TimeoutError(const QString& message) : TransportError(message) {}
};

/** The transport was closed, locally or by the device. */
class ConnectionClosedError : public TransportError
{
public:
    explicit ConnectionClosedError(const QString& message) : TransportError(message) {}
};

class ProtocolError : public AdbError
{
public:
    enum Reason {
        MalformedHeader,
        ChecksumMismatch,
        UnexpectedCommand,
        UnsupportedVersion,
        OversizedPayload,
        InvalidResponse
    };

    ProtocolError(Reason reason, const QString& message);

    Reason reason() const { return why; }

    static const char* reasonName(Reason reason);

private:
    Reason why;
};

class AuthRejectedError : public AdbError
{
public:
    explicit AuthRejectedError(const QString& message) : AdbError(message) {}
};

class StreamRejectedError : public AdbError
{
public:
    explicit StreamRejectedError(const QString& message) : AdbError(message) {}
};

class StreamClosedError : public AdbError
{
public:
    explicit StreamClosedError(const QString& message) : AdbError(message) {}
};

/** FAIL reported by the device (FileSync or Fastboot). message() is the device's text, verbatim. */
class RemoteApplicationError : public AdbError
{
public:
    explicit RemoteApplicationError(const QString& message) : AdbError(message) {}
};

class RemoteNotFoundError : public RemoteApplicationError
{
public:
    explicit RemoteNotFoundError(const QString& path);

    QString path() const { return remotePath; }

private:
    QString remotePath;
};

#endif // ADBERROR_H
