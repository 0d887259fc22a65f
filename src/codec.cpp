#include <vexel/codec.hpp>
#include <vexel/codecs/bmp.hpp>
#include <vexel/codecs/gif.hpp>
#include <vexel/codecs/jpeg.hpp>
#include <vexel/codecs/netpbm.hpp>
#include <vexel/codecs/png.hpp>
#include <vexel/codecs/stub.hpp>
#include <vexel/log.hpp>

#include <algorithm>

namespace vexel {

// ============================================================================
// Codec Wrappers
// ============================================================================

namespace {

// Leading bytes needed by the longest signature check (AVIF ftyp brand)
constexpr std::size_t SNIFF_SIZE = 32;

template <typename Decoder, image_format Format>
class builtin_codec : public codec {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Decoder::name;
    }

    [[nodiscard]] image_format format() const noexcept override {
        return Format;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Decoder::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return Decoder::sniff(data);
    }

    [[nodiscard]] std::unique_ptr<image_decoder> create(std::unique_ptr<byte_source> source,
                                                        const decode_options& options) const override {
        return std::make_unique<Decoder>(std::move(source), options);
    }
};

using jpeg_codec = builtin_codec<jpeg_decoder, image_format::jpeg>;
using png_codec = builtin_codec<png_decoder, image_format::png>;
using gif_codec = builtin_codec<gif_decoder, image_format::gif>;
using bmp_codec = builtin_codec<bmp_decoder, image_format::bmp>;
using netpbm_codec = builtin_codec<netpbm_decoder, image_format::netpbm>;
using webp_codec = builtin_codec<webp_decoder, image_format::webp>;
using avif_codec = builtin_codec<avif_decoder, image_format::avif>;

result<std::vector<std::uint8_t>> read_prefix(byte_source& source) {
    std::vector<std::uint8_t> prefix(SNIFF_SIZE);
    auto seek = source.seek(0);
    if (!seek) {
        return seek.error_info();
    }
    std::size_t filled = 0;
    while (filled < prefix.size()) {
        auto n = source.read(std::span<std::uint8_t>(prefix).subspan(filled));
        if (!n) {
            return n.error_info();
        }
        if (n.value() == 0) {
            break;
        }
        filled += n.value();
    }
    prefix.resize(filled);
    seek = source.seek(0);
    if (!seek) {
        return seek.error_info();
    }
    return prefix;
}

} // namespace

// ============================================================================
// Codec Registry Implementation
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::codec_registry() {
    register_builtin_codecs();
}

codec_registry::~codec_registry() = default;

void codec_registry::register_builtin_codecs() {
    codecs_.push_back(std::make_unique<jpeg_codec>());
    codecs_.push_back(std::make_unique<png_codec>());
    codecs_.push_back(std::make_unique<gif_codec>());
    codecs_.push_back(std::make_unique<bmp_codec>());
    codecs_.push_back(std::make_unique<netpbm_codec>());
    codecs_.push_back(std::make_unique<webp_codec>());
    codecs_.push_back(std::make_unique<avif_codec>());
}

void codec_registry::register_codec(std::unique_ptr<codec> c) {
    if (c) {
        codecs_.push_back(std::move(c));
    }
}

const codec* codec_registry::find_codec(std::span<const std::uint8_t> data) const {
    for (const auto& c : codecs_) {
        if (c->sniff(data)) {
            return c.get();
        }
    }
    return nullptr;
}

const codec* codec_registry::find_codec(std::string_view name) const {
    for (const auto& c : codecs_) {
        if (c->name() == name) {
            return c.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Dispatcher
// ============================================================================

image_format detect_format(std::span<const std::uint8_t> data) {
    const auto* c = codec_registry::instance().find_codec(data);
    return c ? c->format() : image_format::unknown;
}

result<std::unique_ptr<image_decoder>> open(std::unique_ptr<byte_source> source,
                                            const decode_options& options) {
    if (!source) {
        return failure(decode_error::internal_error, "null byte source");
    }
    auto prefix = read_prefix(*source);
    if (!prefix) {
        return prefix.error_info();
    }
    const auto* c = codec_registry::instance().find_codec(prefix.value());
    if (!c) {
        return failure(decode_error::unsupported_format, "unrecognized image format");
    }
    log_debug(std::string("detected ") + to_string(c->format()));
    return c->create(std::move(source), options);
}

result<std::unique_ptr<image_decoder>> open(const std::filesystem::path& path,
                                            const decode_options& options) {
    auto file = file_source::open(path);
    if (!file) {
        return file.error_info();
    }
    return open(std::unique_ptr<byte_source>(std::move(file.value())), options);
}

result<std::unique_ptr<image_decoder>> open(std::vector<std::uint8_t> data,
                                            const decode_options& options) {
    return open(std::unique_ptr<byte_source>(std::make_unique<memory_source>(std::move(data))), options);
}

result<image> decode(std::span<const std::uint8_t> data,
                     const decode_options& options) {
    auto dec = open(std::vector<std::uint8_t>(data.begin(), data.end()), options);
    if (!dec) {
        return dec.error_info();
    }
    return dec.value()->decode();
}

result<image> decode(std::span<const std::uint8_t> data,
                     std::string_view codec_name,
                     const decode_options& options) {
    const auto* c = codec_registry::instance().find_codec(codec_name);
    if (!c) {
        return failure(decode_error::unsupported_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    auto dec = c->create(std::make_unique<memory_source>(data), options);
    return dec->decode();
}

result<image_info> get_image_info(std::span<const std::uint8_t> data) {
    auto dec = open(std::vector<std::uint8_t>(data.begin(), data.end()));
    if (!dec) {
        return dec.error_info();
    }
    return dec.value()->get_image_info();
}

} // namespace vexel
