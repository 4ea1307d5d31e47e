#include "geowkb/common.hpp"
#include "geowkb/core/io/wkb_file.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"
#include "geowkb/core/geometry/wkb_writer.hpp"

namespace geowkb {

namespace core {

void WKBFile::Dump(const Geometry &geometry, FileHandle &handle, const WKBWriterOptions &options) {
	auto data = WKBWriter::Dumps(geometry, options);
	auto written = handle.Write(const_cast<char *>(data.data()), data.size());
	if (written < 0 || static_cast<idx_t>(written) != data.size()) {
		throw IOException("Could not write WKB to \"%s\": wrote %d of %d bytes", handle.GetPath(), written,
		                  data.size());
	}
}

static string ReadRemaining(FileHandle &handle) {
	auto position = handle.SeekPosition();
	auto file_size = handle.GetFileSize();
	idx_t size = file_size > position ? file_size - position : 0;

	string buffer;
	buffer.resize(size);
	idx_t total = 0;
	while (total < size) {
		auto bytes_read = handle.Read(&buffer[total], size - total);
		if (bytes_read <= 0) {
			break;
		}
		total += static_cast<idx_t>(bytes_read);
	}
	buffer.resize(total);
	return buffer;
}

Geometry WKBFile::Load(FileHandle &handle, ArenaAllocator &arena, bool hex) {
	auto content = ReadRemaining(handle);
	WKBReader reader(arena);
	if (!hex) {
		return reader.Deserialize(content);
	}
	// Only whitespace may follow the hex digits, NUL or non-ASCII padding is left for the decoder to reject
	while (!content.empty() && StringUtil::CharacterIsSpace(content.back())) {
		content.pop_back();
	}
	return reader.DeserializeHex(content);
}

} // namespace core

} // namespace geowkb
