#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/MetadataReader.h"
#include "../../src/Logic/PlanEngine.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
class TiffBuilder
{
public:
    explicit TiffBuilder(bool littleEndian) : m_littleEndian(littleEndian) {}

    std::optional<std::string> dateTime;         // IFD0 0x0132
    std::optional<std::string> dateTimeOriginal; // Exif IFD 0x9003

    std::vector<std::uint8_t> Build() const
    {
        const std::uint32_t ifd0Count = (dateTime ? 1 : 0) + (dateTimeOriginal ? 1 : 0);
        const std::uint32_t exifCount = dateTimeOriginal ? 1 : 0;
        const std::uint32_t ifd0Offset = 8;
        const std::uint32_t exifOffset = ifd0Offset + 2 + 12 * ifd0Count + 4;
        std::uint32_t dataOffset = exifOffset + (exifCount ? 2 + 12 * exifCount + 4 : 0);

        std::vector<std::uint8_t> out;
        out.push_back(m_littleEndian ? 'I' : 'M');
        out.push_back(m_littleEndian ? 'I' : 'M');
        Put16(out, 42);
        Put32(out, ifd0Offset);

        std::vector<std::string> strings;
        Put16(out, static_cast<std::uint16_t>(ifd0Count));
        if (dateTime)
        {
            PutAsciiEntry(out, 0x0132, *dateTime, dataOffset, strings);
        }
        if (dateTimeOriginal)
        {
            Put16(out, 0x8769);
            Put16(out, 4); // LONG
            Put32(out, 1);
            Put32(out, exifOffset);
        }
        Put32(out, 0); // No next IFD

        if (exifCount)
        {
            Put16(out, static_cast<std::uint16_t>(exifCount));
            PutAsciiEntry(out, 0x9003, *dateTimeOriginal, dataOffset, strings);
            Put32(out, 0);
        }

        for (const auto &text : strings)
        {
            out.insert(out.end(), text.begin(), text.end());
            out.push_back(0);
        }
        return out;
    }

private:
    void Put16(std::vector<std::uint8_t> &out, std::uint16_t value) const
    {
        if (m_littleEndian)
        {
            out.push_back(value & 0xFF);
            out.push_back(value >> 8);
        }
        else
        {
            out.push_back(value >> 8);
            out.push_back(value & 0xFF);
        }
    }

    void Put32(std::vector<std::uint8_t> &out, std::uint32_t value) const
    {
        if (m_littleEndian)
        {
            Put16(out, value & 0xFFFF);
            Put16(out, value >> 16);
        }
        else
        {
            Put16(out, value >> 16);
            Put16(out, value & 0xFFFF);
        }
    }

    // Strings are always longer than four bytes here, so the value field holds an offset
    void PutAsciiEntry(std::vector<std::uint8_t> &out, std::uint16_t tag, const std::string &text, std::uint32_t &dataOffset,
                       std::vector<std::string> &strings) const
    {
        Put16(out, tag);
        Put16(out, 2); // ASCII
        Put32(out, static_cast<std::uint32_t>(text.size() + 1));
        Put32(out, dataOffset);
        dataOffset += static_cast<std::uint32_t>(text.size() + 1);
        strings.push_back(text);
    }

    bool m_littleEndian;
};

void AppendBigEndian32(std::string &out, std::uint32_t value)
{
    out.push_back(static_cast<char>(value >> 24));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

std::string WrapInJpeg(const std::vector<std::uint8_t> &tiff)
{
    std::string jpeg = "\xFF\xD8";
    // APP0 JFIF segment first, as cameras write it
    jpeg += std::string("\xFF\xE0\x00\x10" "JFIF\0\x01\x01\x00\x00\x01\x00\x01\x00\x00", 18);

    const std::size_t app1Length = 2 + 6 + tiff.size();
    jpeg += "\xFF\xE1";
    jpeg.push_back(static_cast<char>(app1Length >> 8));
    jpeg.push_back(static_cast<char>(app1Length & 0xFF));
    jpeg += std::string("Exif\0\0", 6);
    jpeg.append(tiff.begin(), tiff.end());

    jpeg += std::string("\xFF\xDA\x00\x02", 4);
    jpeg += std::string("\x12\x34\xFF\xD9", 4);
    return jpeg;
}

std::string WrapInPng(const std::vector<std::uint8_t> &tiff)
{
    std::string png("\x89PNG\r\n\x1A\n", 8);

    AppendBigEndian32(png, 13);
    png += "IHDR";
    png += std::string(13, '\x01');
    AppendBigEndian32(png, 0); // CRC is not checked

    AppendBigEndian32(png, static_cast<std::uint32_t>(tiff.size()));
    png += "eXIf";
    png.append(tiff.begin(), tiff.end());
    AppendBigEndian32(png, 0);

    AppendBigEndian32(png, 0);
    png += "IEND";
    AppendBigEndian32(png, 0);
    return png;
}

void ExpectTime(const std::optional<std::tm> &time, int year, int month, int day, int hour, int minute, int second)
{
    ASSERT_TRUE(time.has_value());
    EXPECT_EQ(time->tm_year, year - 1900);
    EXPECT_EQ(time->tm_mon, month - 1);
    EXPECT_EQ(time->tm_mday, day);
    EXPECT_EQ(time->tm_hour, hour);
    EXPECT_EQ(time->tm_min, minute);
    EXPECT_EQ(time->tm_sec, second);
}
} // namespace

TEST(ExifMetadataReaderParse, ParsesExifDateTime)
{
    ExpectTime(ExifMetadataReader::ParseExifDateTime("2021:06:15 10:20:30"), 2021, 6, 15, 10, 20, 30);
    EXPECT_FALSE(ExifMetadataReader::ParseExifDateTime("2021:13:01 00:00:00").has_value());
    EXPECT_FALSE(ExifMetadataReader::ParseExifDateTime("0000:00:00 00:00:00").has_value());
    EXPECT_FALSE(ExifMetadataReader::ParseExifDateTime("    :  :     :  :  ").has_value());
    EXPECT_FALSE(ExifMetadataReader::ParseExifDateTime("2021:06:15").has_value());
    EXPECT_FALSE(ExifMetadataReader::ParseExifDateTime("").has_value());
}

TEST(ExifMetadataReaderParse, ReadsTiffBlockInBothByteOrders)
{
    for (bool littleEndian : {true, false})
    {
        TiffBuilder builder(littleEndian);
        builder.dateTimeOriginal = "2019:01:02 03:04:05";
        ExpectTime(ExifMetadataReader::ReadFromTiffBlock(builder.Build()), 2019, 1, 2, 3, 4, 5);
    }
}

TEST(ExifMetadataReaderParse, PrefersDateTimeOriginalOverDateTime)
{
    TiffBuilder builder(true);
    builder.dateTime = "2020:02:02 02:02:02";
    builder.dateTimeOriginal = "2019:01:01 01:01:01";
    ExpectTime(ExifMetadataReader::ReadFromTiffBlock(builder.Build()), 2019, 1, 1, 1, 1, 1);

    TiffBuilder onlyDateTime(false);
    onlyDateTime.dateTime = "2020:02:02 02:02:02";
    ExpectTime(ExifMetadataReader::ReadFromTiffBlock(onlyDateTime.Build()), 2020, 2, 2, 2, 2, 2);

    TiffBuilder invalidOriginal(true);
    invalidOriginal.dateTime = "2020:02:02 02:02:02";
    invalidOriginal.dateTimeOriginal = "0000:00:00 00:00:00";
    ExpectTime(ExifMetadataReader::ReadFromTiffBlock(invalidOriginal.Build()), 2020, 2, 2, 2, 2, 2);
}

TEST(ExifMetadataReaderParse, RejectsBrokenTiffBlocks)
{
    EXPECT_FALSE(ExifMetadataReader::ReadFromTiffBlock({}).has_value());
    EXPECT_FALSE(ExifMetadataReader::ReadFromTiffBlock({'I', 'I', 42, 0}).has_value());
    EXPECT_FALSE(ExifMetadataReader::ReadFromTiffBlock({'X', 'X', 42, 0, 8, 0, 0, 0}).has_value());
    EXPECT_FALSE(ExifMetadataReader::ReadFromTiffBlock({'I', 'I', 42, 0, 0xFF, 0xFF, 0, 0}).has_value());

    TiffBuilder builder(true);
    builder.dateTimeOriginal = "2019:01:02 03:04:05";
    std::vector<std::uint8_t> truncated = builder.Build();
    truncated.resize(truncated.size() - 10);
    EXPECT_FALSE(ExifMetadataReader::ReadFromTiffBlock(truncated).has_value());
}

TEST_F(PlanEngineFilesystemTest, ExifMetadataReader_ReadsJpegPngAndTiffFiles)
{
    TiffBuilder builder(true);
    builder.dateTimeOriginal = "2021:06:15 10:20:30";
    const std::vector<std::uint8_t> tiff = builder.Build();

    CreateDummyFile(tempTestDir / "a.jpg", WrapInJpeg(tiff));
    CreateDummyFile(tempTestDir / "b.png", WrapInPng(tiff));
    CreateDummyFile(tempTestDir / "c.tif", std::string(tiff.begin(), tiff.end()));

    ExifMetadataReader reader;
    ExpectTime(reader.ReadCaptureTime(tempTestDir / "a.jpg"), 2021, 6, 15, 10, 20, 30);
    ExpectTime(reader.ReadCaptureTime(tempTestDir / "b.png"), 2021, 6, 15, 10, 20, 30);
    ExpectTime(reader.ReadCaptureTime(tempTestDir / "c.tif"), 2021, 6, 15, 10, 20, 30);
}

TEST_F(PlanEngineFilesystemTest, ExifMetadataReader_NoMetadataIsNullopt)
{
    CreateDummyFile(tempTestDir / "text.jpg", "definitely not a jpeg");
    CreateDummyFile(tempTestDir / "bare.jpg", std::string("\xFF\xD8\xFF\xDA\x00\x02\xFF\xD9", 8));
    CreateDummyFile(tempTestDir / "empty.png", "");

    ExifMetadataReader reader;
    EXPECT_FALSE(reader.ReadCaptureTime(tempTestDir / "text.jpg").has_value());
    EXPECT_FALSE(reader.ReadCaptureTime(tempTestDir / "bare.jpg").has_value());
    EXPECT_FALSE(reader.ReadCaptureTime(tempTestDir / "empty.png").has_value());
    EXPECT_FALSE(reader.ReadCaptureTime(tempTestDir / "missing.jpg").has_value());
}

TEST_F(PlanEngineFilesystemTest, ExifMetadataReader_DrivesMetadataPlan)
{
    TiffBuilder builder(false);
    builder.dateTimeOriginal = "2021:06:15 10:20:30";
    CreateDummyFile(tempTestDir / "DSC 0001.JPG", WrapInJpeg(builder.Build()));

    RenameConfig config;
    config.rootDirectory = tempTestDir;
    config.strategy = MetadataStrategy{"shot_"};

    ExifMetadataReader reader;
    PlanResult results = PlanEngine::calculateRenamePlan(config, &reader);

    ASSERT_TRUE(results.success);
    EXPECT_EQ(TargetNames(results), (std::vector<std::string>{"shot_2021-06-15_10-20-30.jpg"}));
}
