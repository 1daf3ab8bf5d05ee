// -*- mode: c++ -*-
#ifndef SYNCRECORDS_H
#define SYNCRECORDS_H
#include "filesync.h"
#include <QByteArray>
#include <QtEndian>

// Device side sync: records, little-endian as adbd sends them.

inline QByteArray le32(quint32 value)
{
    QByteArray raw(4, '\0');
    qToLittleEndian<quint32>(value, reinterpret_cast<uchar*>(raw.data()));
    return raw;
}

inline quint32 readLe32(const QByteArray& raw, int offset = 0)
{
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(raw.constData()) + offset);
}

inline QByteArray record(quint32 id, quint32 value)
{
    return le32(id) + le32(value);
}

inline QByteArray failRecord(const QByteArray& message)
{
    return record(ID_FAIL, message.size()) + message;
}

inline QByteArray statRecord(quint32 mode, quint32 size, quint32 time)
{
    return le32(ID_STAT) + le32(mode) + le32(size) + le32(time);
}

inline QByteArray dentRecord(quint32 mode, quint32 size, quint32 time, const QByteArray& name)
{
    return le32(ID_DENT) + le32(mode) + le32(size) + le32(time) + le32(name.size()) + name;
}

inline QByteArray doneRecord()
{
    return le32(ID_DONE) + QByteArray(16, '\0');
}

#endif // SYNCRECORDS_H
