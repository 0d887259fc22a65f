#ifndef VEXEL_CODEC_HPP_
#define VEXEL_CODEC_HPP_

#include <vexel/vexel_export.h>
#include <vexel/byte_source.hpp>
#include <vexel/decoder.hpp>
#include <vexel/image.hpp>
#include <vexel/info.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vexel {

// ============================================================================
// Codec Interface
// ============================================================================

/**
 * Abstract description of one image format.
 * Used by the codec registry to detect formats and create decoders.
 */
class VEXEL_EXPORT codec {
public:
    virtual ~codec() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual image_format format() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;

    /**
     * Bind a new decoder to a source. No pixels are decoded yet.
     */
    [[nodiscard]] virtual std::unique_ptr<image_decoder> create(std::unique_ptr<byte_source> source,
                                                                const decode_options& options) const = 0;
};

// ============================================================================
// Codec Registry
// ============================================================================

/**
 * Registry of image codecs.
 * Built-in codecs are registered by default.
 * User code can add new codecs at runtime.
 */
class VEXEL_EXPORT codec_registry {
public:
    /**
     * Get the global codec registry instance.
     */
    [[nodiscard]] static codec_registry& instance();

    /**
     * Register a codec.
     * @param c Unique pointer to codec (ownership transferred)
     */
    void register_codec(std::unique_ptr<codec> c);

    /**
     * Find codec by sniffing data.
     * @param data Leading bytes of the file
     * @return Pointer to codec if found, nullptr otherwise
     */
    [[nodiscard]] const codec* find_codec(std::span<const std::uint8_t> data) const;

    /**
     * Find codec by name.
     * @param name Codec name (e.g., "png")
     * @return Pointer to codec if found, nullptr otherwise
     */
    [[nodiscard]] const codec* find_codec(std::string_view name) const;

    [[nodiscard]] std::size_t codec_count() const noexcept {
        return codecs_.size();
    }

    [[nodiscard]] const codec* codec_at(std::size_t index) const noexcept {
        return index < codecs_.size() ? codecs_[index].get() : nullptr;
    }

private:
    codec_registry();
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    void register_builtin_codecs();

    std::vector<std::unique_ptr<codec>> codecs_;
};

// ============================================================================
// Dispatcher
// ============================================================================

/**
 * Identify a format from the leading bytes of a file.
 * @return image_format::unknown when no codec recognizes the data
 */
[[nodiscard]] VEXEL_EXPORT image_format detect_format(std::span<const std::uint8_t> data);

/**
 * Open a decoder for a source, detecting the format from its content.
 * Fails with unsupported_format when no codec recognizes the data.
 */
[[nodiscard]] VEXEL_EXPORT result<std::unique_ptr<image_decoder>> open(std::unique_ptr<byte_source> source,
                                                                        const decode_options& options = {});

/**
 * Open a decoder for a file. Fails with io_error if the file cannot be opened.
 */
[[nodiscard]] VEXEL_EXPORT result<std::unique_ptr<image_decoder>> open(const std::filesystem::path& path,
                                                                        const decode_options& options = {});

/**
 * Open a decoder over an in-memory copy of the data.
 */
[[nodiscard]] VEXEL_EXPORT result<std::unique_ptr<image_decoder>> open(std::vector<std::uint8_t> data,
                                                                        const decode_options& options = {});

/**
 * Decode image data (auto-detect format).
 */
[[nodiscard]] VEXEL_EXPORT result<image> decode(std::span<const std::uint8_t> data,
                                                const decode_options& options = {});

/**
 * Decode image data (explicit codec).
 * @param codec_name Name of codec to use
 */
[[nodiscard]] VEXEL_EXPORT result<image> decode(std::span<const std::uint8_t> data,
                                                std::string_view codec_name,
                                                const decode_options& options = {});

/**
 * Parse headers only (auto-detect format).
 */
[[nodiscard]] VEXEL_EXPORT result<image_info> get_image_info(std::span<const std::uint8_t> data);

} // namespace vexel

#endif // VEXEL_CODEC_HPP_
