#include "adberror.h"

AdbError::AdbError(const QString& message)
    : std::runtime_error(message.toStdString()), msg(message)
{
}

ProtocolError::ProtocolError(Reason reason, const QString& message)
    : AdbError(QString("protocol fault (%1): %2").arg(reasonName(reason)).arg(message)),
      why(reason)
{
}

const char* ProtocolError::reasonName(Reason reason)
{
    switch (reason) {
    case MalformedHeader:
        return "malformed header";
    case ChecksumMismatch:
        return "checksum mismatch";
    case UnexpectedCommand:
        return "unexpected command";
    case UnsupportedVersion:
        return "unsupported version";
    case OversizedPayload:
        return "oversized payload";
    case InvalidResponse:
        return "invalid response";
    }
    return "unknown";
}

RemoteNotFoundError::RemoteNotFoundError(const QString& path)
    : RemoteApplicationError(QString("remote object '%1' does not exist").arg(path)),
      remotePath(path)
{
}
