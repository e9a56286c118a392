/**
 * @file test_zipextractor.cpp
 * @brief Unit tests for ZipExtractor.
 *
 * Tests verify:
 * - Central directory parsing
 * - Extraction of stored and deflated entries into subdirectories
 * - CRC and truncation detection
 * - Rejection of entries escaping the destination
 */

#include <QtTest/QtTest>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "mocks/testzipbuilder.h"
#include "utils/zipextractor.h"

namespace {

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

} // namespace

class TestZipExtractor : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Directory parsing
    void testReadEntries();
    void testRejectsNonArchive();

    // Extraction
    void testExtractStoredAndDeflated();
    void testExtractFromFile();
    void testMissingArchiveFails();

    // Integrity
    void testCrcMismatchFails();
    void testTruncatedDataFails();
    void testInflateRawRejectsGarbage();

    // Safety
    void testParentTraversalRejected();
    void testAbsolutePathRejected();

private:
    QTemporaryDir *dir_ = nullptr;
};

void TestZipExtractor::init()
{
    dir_ = new QTemporaryDir();
    QVERIFY(dir_->isValid());
}

void TestZipExtractor::cleanup()
{
    delete dir_;
    dir_ = nullptr;
}

void TestZipExtractor::testReadEntries()
{
    TestZipBuilder builder;
    builder.add("model.obj", "v 0 0 0\n", false);
    builder.add("textures/", QByteArray(), false);
    builder.add("textures/model_u1_v1.png", QByteArray(2000, 'p'), true);

    QString error;
    const std::optional<QList<ZipExtractor::Entry>> entries =
        ZipExtractor::readEntries(builder.build(), &error);

    QVERIFY2(entries.has_value(), qPrintable(error));
    QCOMPARE(entries->size(), 3);
    QCOMPARE(entries->at(0).name, QStringLiteral("model.obj"));
    QCOMPARE(entries->at(0).method, quint16(0));
    QVERIFY(entries->at(1).isDirectory());
    QCOMPARE(entries->at(2).method, quint16(8));
    QCOMPARE(entries->at(2).uncompressedSize, quint32(2000));
    QVERIFY(entries->at(2).compressedSize < 2000);
}

void TestZipExtractor::testRejectsNonArchive()
{
    QString error;
    QVERIFY(!ZipExtractor::readEntries(QByteArray("short"), &error).has_value());
    QVERIFY(!error.isEmpty());

    QVERIFY(!ZipExtractor::readEntries(QByteArray(200, 'x'), &error).has_value());
    QCOMPARE(error, QStringLiteral("End of central directory not found"));
}

void TestZipExtractor::testExtractStoredAndDeflated()
{
    const QByteArray obj = "mtllib model.mtl\nv 1.0 2.0 3.0\nf 1 1 1\n";
    const QByteArray texture(5000, 't');

    TestZipBuilder builder;
    builder.add("model.obj", obj, false);
    builder.add("textures/model.png", texture, true);

    const QString target = dir_->filePath(QStringLiteral("Model"));
    const ZipExtractor::Result result = ZipExtractor::extractData(builder.build(), target);

    QVERIFY2(result.success, qPrintable(result.errorMessage));
    QCOMPARE(result.extractedFiles.size(), 2);
    QCOMPARE(readFile(QDir(target).filePath(QStringLiteral("model.obj"))), obj);
    QCOMPARE(readFile(QDir(target).filePath(QStringLiteral("textures/model.png"))), texture);
}

void TestZipExtractor::testExtractFromFile()
{
    TestZipBuilder builder;
    builder.add("model.obj", "v 0 0 0\n", true);

    const QString zipPath = dir_->filePath(QStringLiteral("Preview.zip"));
    QFile zip(zipPath);
    QVERIFY(zip.open(QIODevice::WriteOnly));
    zip.write(builder.build());
    zip.close();

    const QString target = dir_->filePath(QStringLiteral("Preview"));
    const ZipExtractor::Result result = ZipExtractor::extract(zipPath, target);

    QVERIFY2(result.success, qPrintable(result.errorMessage));
    QCOMPARE(readFile(QDir(target).filePath(QStringLiteral("model.obj"))), QByteArray("v 0 0 0\n"));
}

void TestZipExtractor::testMissingArchiveFails()
{
    const ZipExtractor::Result result =
        ZipExtractor::extract(dir_->filePath(QStringLiteral("absent.zip")), dir_->path());

    QVERIFY(!result.success);
    QVERIFY(result.errorMessage.startsWith(QStringLiteral("Cannot open archive")));
}

void TestZipExtractor::testCrcMismatchFails()
{
    TestZipBuilder builder;
    builder.add("model.obj", "v 0 0 0\n", false, 0xDEADBEEF);

    const ZipExtractor::Result result =
        ZipExtractor::extractData(builder.build(), dir_->filePath(QStringLiteral("Bad")));

    QVERIFY(!result.success);
    QCOMPARE(result.errorMessage, QStringLiteral("CRC mismatch for \"model.obj\""));
}

void TestZipExtractor::testTruncatedDataFails()
{
    TestZipBuilder builder;
    builder.add("model.obj", QByteArray(100, 'v'), false);
    QByteArray archive = builder.build();

    // Claim a larger compressed size in the central directory entry
    const int central = archive.indexOf(QByteArray::fromHex("504b0102"));
    QVERIFY(central > 0);
    QByteArray patched = archive;
    QByteArray size;
    TestZipBuilder::appendU32(size, 100000);
    patched.replace(central + 20, 4, size);

    const ZipExtractor::Result result =
        ZipExtractor::extractData(patched, dir_->filePath(QStringLiteral("Truncated")));

    QVERIFY(!result.success);
    QCOMPARE(result.errorMessage, QStringLiteral("Truncated data for \"model.obj\""));
}

void TestZipExtractor::testInflateRawRejectsGarbage()
{
    const QByteArray content(3000, 'q');
    const std::optional<QByteArray> inflated = ZipExtractor::inflateRaw(TestZipBuilder::deflateRaw(content));
    QVERIFY(inflated.has_value());
    QCOMPARE(*inflated, content);

    QVERIFY(!ZipExtractor::inflateRaw(QByteArray::fromHex("ffffffffffff")).has_value());
}

void TestZipExtractor::testParentTraversalRejected()
{
    TestZipBuilder builder;
    builder.add("../escape.txt", "gotcha", false);

    const QString target = dir_->filePath(QStringLiteral("Inner"));
    const ZipExtractor::Result result = ZipExtractor::extractData(builder.build(), target);

    QVERIFY(!result.success);
    QVERIFY(result.errorMessage.contains(QStringLiteral("unsafe")));
    QVERIFY(!QFile::exists(dir_->filePath(QStringLiteral("escape.txt"))));
}

void TestZipExtractor::testAbsolutePathRejected()
{
    TestZipBuilder builder;
    builder.add("/tmp/escape.txt", "gotcha", false);

    const ZipExtractor::Result result =
        ZipExtractor::extractData(builder.build(), dir_->filePath(QStringLiteral("Inner")));

    QVERIFY(!result.success);
    QVERIFY(result.errorMessage.contains(QStringLiteral("unsafe")));
}

QTEST_MAIN(TestZipExtractor)
#include "test_zipextractor.moc"
