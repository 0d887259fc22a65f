#include <vexel/codecs/stub.hpp>
#include <vexel/info.hpp>
#include <vexel/log.hpp>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

namespace vexel {

namespace {

// Reads the leading bytes of the source and rewinds it.
std::vector<std::uint8_t> peek_prefix(bit_reader& reader, std::size_t count) {
    auto rewind = reader.reset();
    if (!rewind) {
        log_warn(rewind.message());
        return {};
    }
    const auto available = static_cast<std::size_t>(std::min<std::uint64_t>(count, reader.size()));
    auto bytes = reader.peek_bytes(available);
    if (!bytes) {
        log_warn(bytes.message());
        return {};
    }
    return std::move(bytes.value());
}

} // namespace

// ============================================================================
// WebP
// ============================================================================

bool webp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    return data.size() >= 12 &&
           std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WEBP", 4) == 0;
}

webp_decoder::webp_decoder(std::unique_ptr<byte_source> source, const decode_options&)
    : reader_(std::move(source)) {}

result<image> webp_decoder::decode() {
    return failure(decode_error::not_implemented, "WebP decoding is not implemented");
}

image_info webp_decoder::get_image_info() {
    stub_info info;
    info.format = image_format::webp;
    info.container = "RIFF";
    info.file_size = reader_.size();

    const auto prefix = peek_prefix(reader_, 16);
    if (prefix.size() >= 16) {
        info.brand.assign(prefix.begin() + 12, prefix.begin() + 16);
    }
    return image_info{info};
}

// ============================================================================
// AVIF
// ============================================================================

bool avif_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 12 || std::memcmp(data.data() + 4, "ftyp", 4) != 0) {
        return false;
    }
    return std::memcmp(data.data() + 8, "avif", 4) == 0 || std::memcmp(data.data() + 8, "avis", 4) == 0;
}

avif_decoder::avif_decoder(std::unique_ptr<byte_source> source, const decode_options&)
    : reader_(std::move(source)) {}

result<image> avif_decoder::decode() {
    return failure(decode_error::not_implemented, "AVIF decoding is not implemented");
}

image_info avif_decoder::get_image_info() {
    stub_info info;
    info.format = image_format::avif;
    info.container = "ISOBMFF";
    info.file_size = reader_.size();

    const auto prefix = peek_prefix(reader_, 12);
    if (prefix.size() >= 12) {
        info.brand.assign(prefix.begin() + 8, prefix.begin() + 12);
    }
    return image_info{info};
}

} // namespace vexel
