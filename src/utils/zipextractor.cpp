#include "zipextractor.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QtEndian>

#include <zlib.h>

#include "utils/logging.h"

namespace {

quint16 readU16(const QByteArray &data, qint64 offset)
{
    return qFromLittleEndian<quint16>(data.constData() + offset);
}

quint32 readU32(const QByteArray &data, qint64 offset)
{
    return qFromLittleEndian<quint32>(data.constData() + offset);
}

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

ZipExtractor::Result ZipExtractor::extract(const QString &archivePath, const QString &destinationDir)
{
    QFile file(archivePath);
    if (!file.open(QIODevice::ReadOnly)) {
        Result result;
        result.errorMessage = QString("Cannot open archive %1: %2").arg(archivePath, file.errorString());
        return result;
    }
    return extractData(file.readAll(), destinationDir);
}

ZipExtractor::Result ZipExtractor::extractData(const QByteArray &archive, const QString &destinationDir)
{
    Result result;

    QString error;
    const std::optional<QList<Entry>> entries = readEntries(archive, &error);
    if (!entries) {
        result.errorMessage = error;
        return result;
    }

    if (!QDir().mkpath(destinationDir)) {
        result.errorMessage = QString("Cannot create directory %1").arg(destinationDir);
        return result;
    }

    for (const Entry &entry : *entries) {
        const std::optional<QString> target = safeTargetPath(destinationDir, entry.name);
        if (!target) {
            result.errorMessage = QString("Refusing to extract unsafe entry \"%1\"").arg(entry.name);
            return result;
        }

        if (entry.isDirectory()) {
            if (!QDir().mkpath(*target)) {
                result.errorMessage = QString("Cannot create directory %1").arg(*target);
                return result;
            }
            continue;
        }

        const std::optional<QByteArray> content = entryData(archive, entry, &error);
        if (!content) {
            result.errorMessage = error;
            return result;
        }

        if (!QDir().mkpath(QFileInfo(*target).absolutePath())) {
            result.errorMessage = QString("Cannot create directory for %1").arg(*target);
            return result;
        }

        QFile out(*target);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            result.errorMessage = QString("Cannot write %1: %2").arg(*target, out.errorString());
            return result;
        }
        if (out.write(*content) != content->size()) {
            result.errorMessage = QString("Short write to %1: %2").arg(*target, out.errorString());
            return result;
        }
        out.close();

        LOG_VERBOSE() << "Zip: extracted" << entry.name << content->size() << "bytes";
        result.extractedFiles.append(*target);
    }

    result.success = true;
    return result;
}

std::optional<QList<ZipExtractor::Entry>> ZipExtractor::readEntries(const QByteArray &data,
                                                                    QString *error)
{
    const qint64 size = data.size();
    if (size < END_OF_CENTRAL_DIR_SIZE) {
        setError(error, QStringLiteral("Archive is too small"));
        return std::nullopt;
    }

    // The end record sits before an optional trailing comment
    qint64 eocd = -1;
    const qint64 lowest = qMax<qint64>(0, size - END_OF_CENTRAL_DIR_SIZE - MAX_COMMENT_SIZE);
    for (qint64 pos = size - END_OF_CENTRAL_DIR_SIZE; pos >= lowest; --pos) {
        if (readU32(data, pos) == END_OF_CENTRAL_DIR_SIGNATURE) {
            eocd = pos;
            break;
        }
    }
    if (eocd < 0) {
        setError(error, QStringLiteral("End of central directory not found"));
        return std::nullopt;
    }

    const quint16 entryCount = readU16(data, eocd + 10);
    const quint32 directorySize = readU32(data, eocd + 12);
    const quint32 directoryOffset = readU32(data, eocd + 16);

    if (directoryOffset == 0xFFFFFFFFu || entryCount == 0xFFFFu) {
        setError(error, QStringLiteral("Zip64 archives are not supported"));
        return std::nullopt;
    }
    if (qint64(directoryOffset) + directorySize > eocd) {
        setError(error, QStringLiteral("Central directory is out of bounds"));
        return std::nullopt;
    }

    QList<Entry> entries;
    entries.reserve(entryCount);

    qint64 pos = directoryOffset;
    for (int i = 0; i < entryCount; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > eocd || readU32(data, pos) != CENTRAL_HEADER_SIGNATURE) {
            setError(error, QString("Corrupt central directory entry %1").arg(i));
            return std::nullopt;
        }

        const quint16 flags = readU16(data, pos + 8);
        const quint16 nameLength = readU16(data, pos + 28);
        const quint16 extraLength = readU16(data, pos + 30);
        const quint16 commentLength = readU16(data, pos + 32);

        if (pos + CENTRAL_HEADER_SIZE + nameLength > eocd) {
            setError(error, QString("Corrupt central directory entry %1").arg(i));
            return std::nullopt;
        }
        if (flags & 0x0001) {
            setError(error, QStringLiteral("Encrypted entries are not supported"));
            return std::nullopt;
        }

        Entry entry;
        entry.method = readU16(data, pos + 10);
        entry.crc32 = readU32(data, pos + 16);
        entry.compressedSize = readU32(data, pos + 20);
        entry.uncompressedSize = readU32(data, pos + 24);
        entry.localHeaderOffset = readU32(data, pos + 42);

        const QByteArray rawName = data.mid(pos + CENTRAL_HEADER_SIZE, nameLength);
        // Bit 11 marks UTF-8 names; older tools write CP437, which is ASCII for our exports
        entry.name = (flags & 0x0800) ? QString::fromUtf8(rawName) : QString::fromLatin1(rawName);

        entries.append(entry);
        pos += CENTRAL_HEADER_SIZE + nameLength + extraLength + commentLength;
    }

    return entries;
}

std::optional<QByteArray> ZipExtractor::inflateRaw(const QByteArray &compressed, qint64 expectedSize)
{
    z_stream stream = {};
    // Negative window bits select a raw deflate stream
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return std::nullopt;
    }

    QByteArray output;
    if (expectedSize > 0) {
        output.reserve(expectedSize);
    }

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.constData()));
    stream.avail_in = static_cast<uInt>(compressed.size());

    char buffer[65536];
    int status = Z_OK;
    while (status != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef *>(buffer);
        stream.avail_out = sizeof(buffer);

        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }

        const qint64 produced = qint64(sizeof(buffer)) - stream.avail_out;
        output.append(buffer, produced);

        // Input exhausted without reaching the end marker
        if (status == Z_OK && stream.avail_in == 0 && produced == 0) {
            inflateEnd(&stream);
            return std::nullopt;
        }
    }

    inflateEnd(&stream);
    return output;
}

std::optional<QByteArray> ZipExtractor::entryData(const QByteArray &archive, const Entry &entry,
                                                  QString *error)
{
    const qint64 headerPos = entry.localHeaderOffset;
    if (headerPos + LOCAL_HEADER_SIZE > archive.size()
            || readU32(archive, headerPos) != LOCAL_HEADER_SIGNATURE) {
        setError(error, QString("Corrupt local header for \"%1\"").arg(entry.name));
        return std::nullopt;
    }

    const quint16 nameLength = readU16(archive, headerPos + 26);
    const quint16 extraLength = readU16(archive, headerPos + 28);
    const qint64 dataPos = headerPos + LOCAL_HEADER_SIZE + nameLength + extraLength;

    if (dataPos + entry.compressedSize > archive.size()) {
        setError(error, QString("Truncated data for \"%1\"").arg(entry.name));
        return std::nullopt;
    }

    const QByteArray raw = archive.mid(dataPos, entry.compressedSize);

    std::optional<QByteArray> content;
    switch (entry.method) {
    case METHOD_STORED:
        content = raw;
        break;
    case METHOD_DEFLATED:
        content = inflateRaw(raw, entry.uncompressedSize);
        if (!content) {
            setError(error, QString("Corrupt deflate stream in \"%1\"").arg(entry.name));
            return std::nullopt;
        }
        break;
    default:
        setError(error, QString("Unsupported compression method %1 for \"%2\"")
                            .arg(entry.method).arg(entry.name));
        return std::nullopt;
    }

    if (content->size() != qint64(entry.uncompressedSize)) {
        setError(error, QString("Size mismatch for \"%1\"").arg(entry.name));
        return std::nullopt;
    }

    const uLong crc = ::crc32(::crc32(0L, Z_NULL, 0),
                              reinterpret_cast<const Bytef *>(content->constData()),
                              static_cast<uInt>(content->size()));
    if (crc != entry.crc32) {
        setError(error, QString("CRC mismatch for \"%1\"").arg(entry.name));
        return std::nullopt;
    }

    return content;
}

std::optional<QString> ZipExtractor::safeTargetPath(const QString &destinationDir,
                                                    const QString &entryName)
{
    QString name = entryName;
    name.replace('\\', '/');
    if (name.isEmpty() || name.startsWith('/') || QDir::isAbsolutePath(name)) {
        return std::nullopt;
    }

    const QString root = QDir::cleanPath(QDir(destinationDir).absolutePath());
    const QString target = QDir::cleanPath(root + '/' + name);
    if (target != root && !target.startsWith(root + '/')) {
        return std::nullopt;
    }
    return target;
}
