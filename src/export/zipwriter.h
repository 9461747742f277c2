/*
 * zipwriter.h — Minimal ZIP archive writer
 *
 * Writes local file headers, a central directory and the end record
 * (PKWARE APPNOTE 4.3) to any sequential QIODevice. Entries are stored
 * or raw-deflated with zlib; names are flagged as UTF-8. No ZIP64, no
 * encryption, no data descriptors.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TEIPRESS_ZIPWRITER_H
#define TEIPRESS_ZIPWRITER_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QSet>
#include <QString>

class QIODevice;

class ZipWriter
{
public:
    enum class Method {
        Stored,
        Deflated,
    };

    // The device must already be open for writing; it is not owned.
    explicit ZipWriter(QIODevice *device);

    // Modification time recorded for every entry (default: now)
    void setTimestamp(const QDateTime &timestamp) { m_timestamp = timestamp; }

    bool addFile(const QString &name, const QByteArray &data,
                 Method method = Method::Deflated);

    // Write the central directory. No entries may be added afterwards.
    bool finish();

    int entryCount() const { return static_cast<int>(m_entries.size()); }
    QString errorString() const { return m_errorString; }

    // zlib helpers
    static quint32 crc32(const QByteArray &data);
    static bool deflateRaw(const QByteArray &data, QByteArray *out);

private:
    struct Entry {
        QByteArray name;
        quint16 method = 0;
        quint32 crc = 0;
        quint32 compressedSize = 0;
        quint32 uncompressedSize = 0;
        quint32 offset = 0;
    };

    bool write(const QByteArray &bytes);
    quint16 dosTime() const;
    quint16 dosDate() const;

    QIODevice *m_device;
    QDateTime m_timestamp;
    QList<Entry> m_entries;
    QSet<QByteArray> m_names;
    quint32 m_offset = 0;
    bool m_finished = false;
    QString m_errorString;
};

#endif // TEIPRESS_ZIPWRITER_H
