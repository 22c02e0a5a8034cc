#ifndef METADATAREADER_H
#define METADATAREADER_H

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Source of embedded capture timestamps for the metadata naming mode
class MetadataReader
{
public:
	virtual ~MetadataReader() = default;

	// Local capture time recorded inside the file, or nullopt when there is none or it cannot be read
	virtual std::optional<std::tm> ReadCaptureTime(const fs::path &path) const = 0;
};

// Reads EXIF capture dates from JPEG (APP1), TIFF and PNG (eXIf chunk) files
class ExifMetadataReader : public MetadataReader
{
public:
	std::optional<std::tm> ReadCaptureTime(const fs::path &path) const override;

	static std::optional<std::tm> ReadFromTiffBlock(const std::vector<std::uint8_t> &tiff);
	static std::optional<std::tm> ParseExifDateTime(const std::string &value);

	static constexpr std::size_t MaxTiffFileBytes = 64u * 1024u * 1024u;
	static constexpr std::size_t MaxExifChunkBytes = 16u * 1024u * 1024u;

private:
	static std::optional<std::vector<std::uint8_t>> ExtractJpegExif(std::istream &in);
	static std::optional<std::vector<std::uint8_t>> ExtractPngExif(std::istream &in);
	static std::optional<std::vector<std::uint8_t>> ReadTiffFile(std::istream &in);
};

#endif // METADATAREADER_H
