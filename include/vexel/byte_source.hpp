#ifndef VEXEL_BYTE_SOURCE_HPP_
#define VEXEL_BYTE_SOURCE_HPP_

#include <vexel/vexel_export.h>
#include <vexel/types.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <vector>

namespace vexel {

// ============================================================================
// Byte Source Interface
// ============================================================================

/**
 * Abstract seekable byte source.
 * Every decoder owns exactly one source for the duration of a decode.
 */
class VEXEL_EXPORT byte_source {
public:
    virtual ~byte_source() = default;

    /**
     * Read up to buffer.size() bytes at the current position.
     * @return Number of bytes read; 0 at end of stream
     */
    [[nodiscard]] virtual result<std::size_t> read(std::span<std::uint8_t> buffer) = 0;

    /**
     * Move the cursor to an absolute position (may equal size()).
     */
    [[nodiscard]] virtual status seek(std::uint64_t position) = 0;

    [[nodiscard]] virtual std::uint64_t position() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;
};

// ============================================================================
// Memory Source
// ============================================================================

class VEXEL_EXPORT memory_source : public byte_source {
public:
    memory_source() = default;
    explicit memory_source(std::vector<std::uint8_t> data);
    explicit memory_source(std::span<const std::uint8_t> data);

    [[nodiscard]] result<std::size_t> read(std::span<std::uint8_t> buffer) override;
    [[nodiscard]] status seek(std::uint64_t position) override;

    [[nodiscard]] std::uint64_t position() const noexcept override { return pos_; }
    [[nodiscard]] std::uint64_t size() const noexcept override { return data_.size(); }

    [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return data_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// File Source
// ============================================================================

class VEXEL_EXPORT file_source : public byte_source {
public:
    /**
     * Open a file for reading.
     * @return Source, or io_error if the file cannot be opened
     */
    [[nodiscard]] static result<std::unique_ptr<file_source>> open(const std::filesystem::path& path);

    [[nodiscard]] result<std::size_t> read(std::span<std::uint8_t> buffer) override;
    [[nodiscard]] status seek(std::uint64_t position) override;

    [[nodiscard]] std::uint64_t position() const noexcept override { return pos_; }
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }

private:
    file_source(std::ifstream stream, std::uint64_t size);

    std::ifstream stream_;
    std::uint64_t size_ = 0;
    std::uint64_t pos_ = 0;
};

} // namespace vexel

#endif // VEXEL_BYTE_SOURCE_HPP_
