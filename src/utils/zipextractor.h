/**
 * @file zipextractor.h
 * @brief Extraction of zip archives exported by the reconstruction node.
 */

#ifndef ZIPEXTRACTOR_H
#define ZIPEXTRACTOR_H

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @brief Minimal zip reader supporting stored and deflated entries.
 *
 * Entries are located through the central directory and inflated with zlib.
 * Each entry's CRC-32 is verified. Entry names that are absolute or escape
 * the destination directory are rejected. Zip64 archives, encryption and
 * multi-disk archives are not supported.
 *
 * @par Example usage:
 * @code
 * ZipExtractor::Result result = ZipExtractor::extract(zipPath, modelDir);
 * if (!result.success) {
 *     qWarning() << "Unzip failed:" << result.errorMessage;
 * }
 * @endcode
 */
class ZipExtractor
{
public:
    struct Entry {
        QString name;                 // Path inside the archive, '/' separated
        quint16 method = 0;           // 0 = stored, 8 = deflated
        quint32 crc32 = 0;
        quint32 compressedSize = 0;
        quint32 uncompressedSize = 0;
        quint32 localHeaderOffset = 0;

        [[nodiscard]] bool isDirectory() const { return name.endsWith('/'); }
    };

    struct Result {
        bool success = false;
        QString errorMessage;
        QStringList extractedFiles;   // Absolute paths of written files
    };

    /**
     * @brief Extracts an archive file into a directory (created if needed).
     */
    [[nodiscard]] static Result extract(const QString &archivePath, const QString &destinationDir);

    /**
     * @brief Extracts an in-memory archive into a directory.
     */
    [[nodiscard]] static Result extractData(const QByteArray &archive, const QString &destinationDir);

    /**
     * @brief Lists the entries of an archive.
     * @param data Whole archive.
     * @param error Receives a description on failure (may be null).
     * @return Entries in central directory order, or std::nullopt.
     */
    [[nodiscard]] static std::optional<QList<Entry>> readEntries(const QByteArray &data,
                                                                 QString *error = nullptr);

    /**
     * @brief Inflates a raw deflate stream (no zlib or gzip wrapper).
     * @return The inflated bytes, or std::nullopt if the stream is corrupt.
     */
    [[nodiscard]] static std::optional<QByteArray> inflateRaw(const QByteArray &compressed,
                                                              qint64 expectedSize = -1);

private:
    [[nodiscard]] static std::optional<QByteArray> entryData(const QByteArray &archive,
                                                             const Entry &entry,
                                                             QString *error);
    [[nodiscard]] static std::optional<QString> safeTargetPath(const QString &destinationDir,
                                                               const QString &entryName);

    static constexpr quint32 LOCAL_HEADER_SIGNATURE = 0x04034b50;
    static constexpr quint32 CENTRAL_HEADER_SIGNATURE = 0x02014b50;
    static constexpr quint32 END_OF_CENTRAL_DIR_SIGNATURE = 0x06054b50;

    static constexpr int LOCAL_HEADER_SIZE = 30;
    static constexpr int CENTRAL_HEADER_SIZE = 46;
    static constexpr int END_OF_CENTRAL_DIR_SIZE = 22;
    static constexpr int MAX_COMMENT_SIZE = 0xFFFF;

    static constexpr quint16 METHOD_STORED = 0;
    static constexpr quint16 METHOD_DEFLATED = 8;
};

#endif // ZIPEXTRACTOR_H
