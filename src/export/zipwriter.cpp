/*
 * zipwriter.cpp — Minimal ZIP archive writer
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "zipwriter.h"

#include <QIODevice>
#include <QtEndian>

#include <zlib.h>

namespace {

constexpr quint32 kLocalHeaderSignature = 0x04034b50;
constexpr quint32 kCentralHeaderSignature = 0x02014b50;
constexpr quint32 kEndOfCentralDirSignature = 0x06054b50;
constexpr quint16 kVersionNeeded = 20;     // 2.0: deflate
constexpr quint16 kFlagUtf8Names = 0x0800; // general purpose bit 11
constexpr quint16 kMethodStored = 0;
constexpr quint16 kMethodDeflated = 8;

template <typename T>
void putLE(QByteArray &out, T value)
{
    const T le = qToLittleEndian(value);
    out.append(reinterpret_cast<const char *>(&le), sizeof(T));
}

} // anonymous namespace

ZipWriter::ZipWriter(QIODevice *device)
    : m_device(device)
    , m_timestamp(QDateTime::currentDateTime())
{
}

quint32 ZipWriter::crc32(const QByteArray &data)
{
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef *>(data.constData()),
                  static_cast<uInt>(data.size()));
    return static_cast<quint32>(crc);
}

bool ZipWriter::deflateRaw(const QByteArray &data, QByteArray *out)
{
    z_stream stream = {};
    // Negative window bits: raw deflate without zlib header, as ZIP expects
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
        return false;

    QByteArray buffer;
    buffer.resize(static_cast<qsizetype>(deflateBound(&stream, static_cast<uLong>(data.size()))));

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.constData()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef *>(buffer.data());
    stream.avail_out = static_cast<uInt>(buffer.size());

    const int zret = ::deflate(&stream, Z_FINISH);
    const uLong produced = stream.total_out;
    deflateEnd(&stream);

    if (zret != Z_STREAM_END)
        return false;

    buffer.resize(static_cast<qsizetype>(produced));
    *out = buffer;
    return true;
}

quint16 ZipWriter::dosTime() const
{
    const QTime t = m_timestamp.time();
    return static_cast<quint16>((t.hour() << 11) | (t.minute() << 5) | (t.second() / 2));
}

quint16 ZipWriter::dosDate() const
{
    const QDate d = m_timestamp.date();
    const int year = qMax(0, d.year() - 1980);
    return static_cast<quint16>((year << 9) | (d.month() << 5) | d.day());
}

bool ZipWriter::write(const QByteArray &bytes)
{
    if (m_device->write(bytes) != bytes.size()) {
        m_errorString = m_device->errorString();
        return false;
    }
    m_offset += static_cast<quint32>(bytes.size());
    return true;
}

bool ZipWriter::addFile(const QString &name, const QByteArray &data, Method method)
{
    if (m_finished) {
        m_errorString = QStringLiteral("Archive already finished");
        return false;
    }
    if (!m_device || !m_device->isWritable()) {
        m_errorString = QStringLiteral("Device not open for writing");
        return false;
    }

    Entry entry;
    entry.name = name.toUtf8();
    if (entry.name.isEmpty() || m_names.contains(entry.name)) {
        m_errorString = QStringLiteral("Invalid or duplicate entry name: %1").arg(name);
        return false;
    }

    QByteArray payload = data;
    entry.method = kMethodStored;
    if (method == Method::Deflated) {
        QByteArray deflated;
        if (!deflateRaw(data, &deflated)) {
            m_errorString = QStringLiteral("Compression failed for %1").arg(name);
            return false;
        }
        payload = deflated;
        entry.method = kMethodDeflated;
    }

    entry.crc = crc32(data);
    entry.compressedSize = static_cast<quint32>(payload.size());
    entry.uncompressedSize = static_cast<quint32>(data.size());
    entry.offset = m_offset;

    QByteArray header;
    putLE<quint32>(header, kLocalHeaderSignature);
    putLE<quint16>(header, kVersionNeeded);
    putLE<quint16>(header, kFlagUtf8Names);
    putLE<quint16>(header, entry.method);
    putLE<quint16>(header, dosTime());
    putLE<quint16>(header, dosDate());
    putLE<quint32>(header, entry.crc);
    putLE<quint32>(header, entry.compressedSize);
    putLE<quint32>(header, entry.uncompressedSize);
    putLE<quint16>(header, static_cast<quint16>(entry.name.size()));
    putLE<quint16>(header, 0); // extra field length
    header.append(entry.name);

    if (!write(header) || !write(payload))
        return false;

    m_names.insert(entry.name);
    m_entries.append(entry);
    return true;
}

bool ZipWriter::finish()
{
    if (m_finished)
        return true;

    const quint32 directoryOffset = m_offset;

    QByteArray directory;
    for (const Entry &entry : std::as_const(m_entries)) {
        putLE<quint32>(directory, kCentralHeaderSignature);
        putLE<quint16>(directory, kVersionNeeded); // version made by
        putLE<quint16>(directory, kVersionNeeded);
        putLE<quint16>(directory, kFlagUtf8Names);
        putLE<quint16>(directory, entry.method);
        putLE<quint16>(directory, dosTime());
        putLE<quint16>(directory, dosDate());
        putLE<quint32>(directory, entry.crc);
        putLE<quint32>(directory, entry.compressedSize);
        putLE<quint32>(directory, entry.uncompressedSize);
        putLE<quint16>(directory, static_cast<quint16>(entry.name.size()));
        putLE<quint16>(directory, 0); // extra field length
        putLE<quint16>(directory, 0); // comment length
        putLE<quint16>(directory, 0); // disk number start
        putLE<quint16>(directory, 0); // internal attributes
        putLE<quint32>(directory, 0); // external attributes
        putLE<quint32>(directory, entry.offset);
        directory.append(entry.name);
    }

    QByteArray end;
    putLE<quint32>(end, kEndOfCentralDirSignature);
    putLE<quint16>(end, 0); // this disk
    putLE<quint16>(end, 0); // disk with central directory
    putLE<quint16>(end, static_cast<quint16>(m_entries.size()));
    putLE<quint16>(end, static_cast<quint16>(m_entries.size()));
    putLE<quint32>(end, static_cast<quint32>(directory.size()));
    putLE<quint32>(end, directoryOffset);
    putLE<quint16>(end, 0); // comment length

    if (!write(directory) || !write(end))
        return false;

    m_finished = true;
    return true;
}
