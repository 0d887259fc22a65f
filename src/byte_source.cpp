#include <vexel/byte_source.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace vexel {

// ============================================================================
// Memory Source
// ============================================================================

memory_source::memory_source(std::vector<std::uint8_t> data)
    : data_(std::move(data)) {}

memory_source::memory_source(std::span<const std::uint8_t> data)
    : data_(data.begin(), data.end()) {}

result<std::size_t> memory_source::read(std::span<std::uint8_t> buffer) {
    const std::size_t available = data_.size() - pos_;
    const std::size_t count = std::min(available, buffer.size());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + pos_, count);
        pos_ += count;
    }
    return count;
}

status memory_source::seek(std::uint64_t position) {
    if (position > data_.size()) {
        return failure(decode_error::io_error,
            "seek to " + std::to_string(position) + " past end of stream (size " +
            std::to_string(data_.size()) + ")");
    }
    pos_ = static_cast<std::size_t>(position);
    return {};
}

// ============================================================================
// File Source
// ============================================================================

file_source::file_source(std::ifstream stream, std::uint64_t size)
    : stream_(std::move(stream)), size_(size) {}

result<std::unique_ptr<file_source>> file_source::open(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return failure(decode_error::io_error, "cannot open " + path.string());
    }

    stream.seekg(0, std::ios::end);
    const auto end = stream.tellg();
    if (end < 0) {
        return failure(decode_error::io_error, "cannot determine size of " + path.string());
    }
    stream.seekg(0, std::ios::beg);

    return std::unique_ptr<file_source>(
        new file_source(std::move(stream), static_cast<std::uint64_t>(end)));
}

result<std::size_t> file_source::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty() || pos_ >= size_) {
        return std::size_t{0};
    }

    stream_.read(reinterpret_cast<char*>(buffer.data()),
                 static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<std::size_t>(stream_.gcount());
    if (stream_.bad()) {
        return failure(decode_error::io_error, "read failed at offset " + std::to_string(pos_));
    }
    // A short read sets eof/fail; clear so later seeks still work
    stream_.clear();
    pos_ += count;
    return count;
}

status file_source::seek(std::uint64_t position) {
    if (position > size_) {
        return failure(decode_error::io_error,
            "seek to " + std::to_string(position) + " past end of file (size " +
            std::to_string(size_) + ")");
    }
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(position), std::ios::beg);
    if (!stream_) {
        return failure(decode_error::io_error, "seek failed");
    }
    pos_ = position;
    return {};
}

} // namespace vexel
