#include "MetadataReader.h"

#include <wx/log.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace
{
constexpr std::uint16_t TagDateTime = 0x0132;
constexpr std::uint16_t TagExifIfdPointer = 0x8769;
constexpr std::uint16_t TagDateTimeOriginal = 0x9003;
constexpr std::uint16_t TagDateTimeDigitized = 0x9004;

constexpr std::uint16_t TypeAscii = 2;
constexpr std::uint16_t TypeLong = 4;

constexpr std::uint16_t MaxIfdEntries = 1024;

const std::array<std::uint8_t, 8> PngSignature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

struct IfdEntry
{
	std::uint16_t type = 0;
	std::uint32_t count = 0;
	std::size_t valueFieldOffset = 0; // Offset of the 4-byte value/offset field
};

// Bounds-checked reader over a TIFF block in either byte order
class TiffView
{
public:
	TiffView(const std::vector<std::uint8_t> &data, bool littleEndian)
		: m_data(data), m_littleEndian(littleEndian)
	{
	}

	bool Has(std::size_t offset, std::size_t length) const
	{
		return offset <= m_data.size() && length <= m_data.size() - offset;
	}

	std::uint16_t U16(std::size_t offset) const
	{
		const std::uint16_t b0 = m_data[offset], b1 = m_data[offset + 1];
		return m_littleEndian ? static_cast<std::uint16_t>(b0 | (b1 << 8)) : static_cast<std::uint16_t>((b0 << 8) | b1);
	}

	std::uint32_t U32(std::size_t offset) const
	{
		const std::uint32_t b0 = m_data[offset], b1 = m_data[offset + 1], b2 = m_data[offset + 2], b3 = m_data[offset + 3];
		return m_littleEndian ? (b0 | (b1 << 8) | (b2 << 16) | (b3 << 24)) : ((b0 << 24) | (b1 << 16) | (b2 << 8) | b3);
	}

	const std::uint8_t *At(std::size_t offset) const { return m_data.data() + offset; }

private:
	const std::vector<std::uint8_t> &m_data;
	bool m_littleEndian;
};

std::map<std::uint16_t, IfdEntry> ReadIfd(const TiffView &view, std::uint32_t offset)
{
	std::map<std::uint16_t, IfdEntry> entries;
	if (!view.Has(offset, 2))
	{
		return entries;
	}
	const std::uint16_t count = view.U16(offset);
	if (count > MaxIfdEntries)
	{
		return entries;
	}
	for (std::uint16_t i = 0; i < count; ++i)
	{
		const std::size_t entryOffset = offset + 2 + static_cast<std::size_t>(i) * 12;
		if (!view.Has(entryOffset, 12))
		{
			break;
		}
		IfdEntry entry;
		entry.type = view.U16(entryOffset + 2);
		entry.count = view.U32(entryOffset + 4);
		entry.valueFieldOffset = entryOffset + 8;
		entries.emplace(view.U16(entryOffset), entry);
	}
	return entries;
}

std::optional<std::string> ReadAscii(const TiffView &view, const std::map<std::uint16_t, IfdEntry> &ifd, std::uint16_t tag)
{
	const auto it = ifd.find(tag);
	if (it == ifd.end() || it->second.type != TypeAscii || it->second.count == 0)
	{
		return std::nullopt;
	}
	const IfdEntry &entry = it->second;
	const std::size_t dataOffset = (entry.count <= 4) ? entry.valueFieldOffset : view.U32(entry.valueFieldOffset);
	if (!view.Has(dataOffset, entry.count))
	{
		return std::nullopt;
	}
	std::string value(reinterpret_cast<const char *>(view.At(dataOffset)), entry.count);
	const std::size_t nul = value.find('\0');
	if (nul != std::string::npos)
	{
		value.resize(nul);
	}
	return value;
}

std::uint32_t ReadBigEndian32(const std::uint8_t *bytes)
{
	return (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
		   (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
}
} // namespace

// "YYYY:MM:DD HH:MM:SS" -> broken-down local time
std::optional<std::tm> ExifMetadataReader::ParseExifDateTime(const std::string &value)
{
	int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
	if (value.size() < 19 ||
		std::sscanf(value.c_str(), "%4d:%2d:%2d %2d:%2d:%2d", &year, &month, &day, &hour, &minute, &second) != 6)
	{
		return std::nullopt;
	}
	if (year < 1 || month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 ||
		minute > 59 || second < 0 || second > 60)
	{
		return std::nullopt;
	}
	std::tm result = {};
	result.tm_year = year - 1900;
	result.tm_mon = month - 1;
	result.tm_mday = day;
	result.tm_hour = hour;
	result.tm_min = minute;
	result.tm_sec = second;
	result.tm_isdst = -1;
	return result;
}

// Looks for DateTimeOriginal, then DateTimeDigitized, then the IFD0 DateTime
std::optional<std::tm> ExifMetadataReader::ReadFromTiffBlock(const std::vector<std::uint8_t> &tiff)
{
	if (tiff.size() < 8)
	{
		return std::nullopt;
	}
	bool littleEndian;
	if (tiff[0] == 'I' && tiff[1] == 'I')
		littleEndian = true;
	else if (tiff[0] == 'M' && tiff[1] == 'M')
		littleEndian = false;
	else
		return std::nullopt;

	const TiffView view(tiff, littleEndian);
	if (view.U16(2) != 42)
	{
		return std::nullopt;
	}

	const auto ifd0 = ReadIfd(view, view.U32(4));
	std::map<std::uint16_t, IfdEntry> exifIfd;
	const auto pointer = ifd0.find(TagExifIfdPointer);
	if (pointer != ifd0.end() && pointer->second.type == TypeLong && pointer->second.count == 1)
	{
		exifIfd = ReadIfd(view, view.U32(pointer->second.valueFieldOffset));
	}

	for (std::uint16_t tag : {TagDateTimeOriginal, TagDateTimeDigitized})
	{
		if (auto text = ReadAscii(view, exifIfd, tag))
		{
			if (auto parsed = ParseExifDateTime(*text))
			{
				return parsed;
			}
		}
	}
	if (auto text = ReadAscii(view, ifd0, TagDateTime))
	{
		return ParseExifDateTime(*text);
	}
	return std::nullopt;
}

std::optional<std::vector<std::uint8_t>> ExifMetadataReader::ExtractJpegExif(std::istream &in)
{
	static const char exifHeader[6] = {'E', 'x', 'i', 'f', '\0', '\0'};

	while (in)
	{
		int byte = in.get();
		if (byte != 0xFF)
		{
			return std::nullopt; // Lost marker sync
		}
		int marker = in.get();
		while (marker == 0xFF)
		{
			marker = in.get(); // Fill bytes
		}
		if (marker == EOF || marker == 0xD9 || marker == 0xDA)
		{
			return std::nullopt; // End of image or start of scan: no more metadata segments
		}
		if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01)
		{
			continue; // Standalone markers carry no length
		}

		const int hi = in.get();
		const int lo = in.get();
		if (hi == EOF || lo == EOF)
		{
			return std::nullopt;
		}
		const std::size_t length = (static_cast<std::size_t>(hi) << 8) | static_cast<std::size_t>(lo);
		if (length < 2)
		{
			return std::nullopt;
		}
		const std::size_t payload = length - 2;

		if (marker == 0xE1 && payload > sizeof(exifHeader))
		{
			std::vector<std::uint8_t> segment(payload);
			if (!in.read(reinterpret_cast<char *>(segment.data()), static_cast<std::streamsize>(payload)))
			{
				return std::nullopt;
			}
			if (std::memcmp(segment.data(), exifHeader, sizeof(exifHeader)) == 0)
			{
				return std::vector<std::uint8_t>(segment.begin() + sizeof(exifHeader), segment.end());
			}
			continue; // XMP or another APP1 payload
		}
		in.seekg(static_cast<std::streamoff>(payload), std::ios::cur);
	}
	return std::nullopt;
}

std::optional<std::vector<std::uint8_t>> ExifMetadataReader::ExtractPngExif(std::istream &in)
{
	std::array<std::uint8_t, 8> header{};
	if (!in.read(reinterpret_cast<char *>(header.data()), header.size()) || header != PngSignature)
	{
		return std::nullopt;
	}

	std::array<std::uint8_t, 8> chunkHeader{};
	while (in.read(reinterpret_cast<char *>(chunkHeader.data()), chunkHeader.size()))
	{
		const std::uint32_t length = ReadBigEndian32(chunkHeader.data());
		const std::string type(reinterpret_cast<const char *>(chunkHeader.data() + 4), 4);
		if (type == "IEND")
		{
			break;
		}
		if (type == "eXIf")
		{
			if (length > MaxExifChunkBytes)
			{
				return std::nullopt;
			}
			std::vector<std::uint8_t> data(length);
			if (!in.read(reinterpret_cast<char *>(data.data()), static_cast<std::streamsize>(length)))
			{
				return std::nullopt;
			}
			return data;
		}
		in.seekg(static_cast<std::streamoff>(length) + 4, std::ios::cur); // Payload plus CRC
	}
	return std::nullopt;
}

std::optional<std::vector<std::uint8_t>> ExifMetadataReader::ReadTiffFile(std::istream &in)
{
	std::vector<std::uint8_t> data;
	std::array<char, 64 * 1024> buffer{};
	while (data.size() < MaxTiffFileBytes && in.read(buffer.data(), buffer.size()).gcount() > 0)
	{
		data.insert(data.end(), buffer.begin(), buffer.begin() + in.gcount());
	}
	if (data.empty())
	{
		return std::nullopt;
	}
	return data;
}

std::optional<std::tm> ExifMetadataReader::ReadCaptureTime(const fs::path &path) const
{
	std::ifstream in(path, std::ios::binary);
	if (!in)
	{
		wxLogDebug("Cannot open '%s' for metadata", path.string().c_str());
		return std::nullopt;
	}

	std::array<std::uint8_t, 4> magic{};
	if (!in.read(reinterpret_cast<char *>(magic.data()), magic.size()))
	{
		return std::nullopt;
	}
	in.seekg(0, std::ios::beg);

	std::optional<std::vector<std::uint8_t>> tiff;
	if (magic[0] == 0xFF && magic[1] == 0xD8)
	{
		in.seekg(2, std::ios::beg);
		tiff = ExtractJpegExif(in);
	}
	else if (magic[0] == 0x89 && magic[1] == 'P' && magic[2] == 'N' && magic[3] == 'G')
	{
		tiff = ExtractPngExif(in);
	}
	else if ((magic[0] == 'I' && magic[1] == 'I') || (magic[0] == 'M' && magic[1] == 'M'))
	{
		tiff = ReadTiffFile(in);
	}

	if (!tiff)
	{
		return std::nullopt;
	}
	return ReadFromTiffBlock(*tiff);
}
