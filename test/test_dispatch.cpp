#include <doctest/doctest.h>
#include <vexel/vexel.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> pgm_file() {
    auto out = bytes_of("P5\n2 2\n255\n");
    out.insert(out.end(), {0, 64, 128, 255});
    return out;
}

std::vector<std::uint8_t> ppm_file() {
    auto out = bytes_of("P6\n1 1\n255\n");
    out.insert(out.end(), {10, 20, 30});
    return out;
}

// 1x1 24-bit BI_RGB bitmap
std::vector<std::uint8_t> bmp_file() {
    return {
        'B', 'M', 58, 0, 0, 0, 0, 0, 0, 0, 54, 0, 0, 0,
        40, 0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 1, 0, 24, 0,
        0, 0, 0, 0, 4, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0,
        0, 0, 0, 0, 0, 0, 0, 0,
        0, 0, 255, 0
    };
}

std::vector<std::uint8_t> webp_file() {
    auto out = bytes_of("RIFF");
    out.insert(out.end(), {20, 0, 0, 0});
    const auto rest = bytes_of("WEBPVP8L");
    out.insert(out.end(), rest.begin(), rest.end());
    out.resize(28, 0);
    return out;
}

std::vector<std::uint8_t> avif_file() {
    std::vector<std::uint8_t> out = {0, 0, 0, 24};
    const auto rest = bytes_of("ftypavif");
    out.insert(out.end(), rest.begin(), rest.end());
    out.resize(24, 0);
    return out;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

// Scratch directory removed when the test ends
class temp_dir {
public:
    explicit temp_dir(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~temp_dir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_dir(const temp_dir&) = delete;
    temp_dir& operator=(const temp_dir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// Collects error log lines for the duration of a scope
class captured_errors {
public:
    captured_errors() {
        vexel::set_log_handler([this](vexel::log_level level, std::string_view msg) {
            if (level == vexel::log_level::error) {
                lines.emplace_back(msg);
            }
        });
    }

    ~captured_errors() { vexel::set_log_handler({}); }

    captured_errors(const captured_errors&) = delete;
    captured_errors& operator=(const captured_errors&) = delete;

    std::vector<std::string> lines;
};

} // namespace

// ============================================================================
// Format detection
// ============================================================================

TEST_CASE("dispatch: detect_format by content") {
    const std::vector<std::uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xE0};
    const std::vector<std::uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    const auto gif = bytes_of("GIF89a");

    CHECK(vexel::detect_format(jpeg) == vexel::image_format::jpeg);
    CHECK(vexel::detect_format(png) == vexel::image_format::png);
    CHECK(vexel::detect_format(gif) == vexel::image_format::gif);
    CHECK(vexel::detect_format(bmp_file()) == vexel::image_format::bmp);
    CHECK(vexel::detect_format(pgm_file()) == vexel::image_format::netpbm);
    CHECK(vexel::detect_format(webp_file()) == vexel::image_format::webp);
    CHECK(vexel::detect_format(avif_file()) == vexel::image_format::avif);
    CHECK(vexel::detect_format(bytes_of("hello world")) == vexel::image_format::unknown);
    CHECK(vexel::detect_format(std::vector<std::uint8_t>{}) == vexel::image_format::unknown);
}

TEST_CASE("dispatch: registry lists every built-in codec") {
    const auto& registry = vexel::codec_registry::instance();
    CHECK(registry.codec_count() >= 7);
    for (std::string_view name : {"jpeg", "png", "gif", "bmp", "netpbm", "webp", "avif"}) {
        const auto* c = registry.find_codec(name);
        REQUIRE_MESSAGE(c != nullptr, std::string(name));
        CHECK_FALSE(c->extensions().empty());
    }
    CHECK(registry.find_codec("tiff") == nullptr);
}

// ============================================================================
// open / decode
// ============================================================================

TEST_CASE("dispatch: unknown content is unsupported") {
    auto dec = vexel::open(bytes_of("not an image at all"));
    REQUIRE(dec.is_error());
    CHECK(dec.code() == vexel::decode_error::unsupported_format);
}

TEST_CASE("dispatch: missing file is an io error") {
    auto dec = vexel::open(std::filesystem::path("/nonexistent/vexel/none.png"));
    REQUIRE(dec.is_error());
    CHECK(dec.code() == vexel::decode_error::io_error);
}

TEST_CASE("dispatch: WebP and AVIF are recognized but not decoded") {
    SUBCASE("webp") {
        auto dec = vexel::open(webp_file());
        REQUIRE(dec);
        CHECK(dec.value()->format() == vexel::image_format::webp);
        auto img = dec.value()->decode();
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::not_implemented);

        const auto info = dec.value()->get_image_info();
        const auto* stub = std::get_if<vexel::stub_info>(&info.details);
        REQUIRE(stub != nullptr);
        CHECK(stub->container == "RIFF");
        CHECK(stub->brand == "VP8L");
    }

    SUBCASE("avif") {
        auto img = vexel::decode(avif_file());
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::not_implemented);

        auto info = vexel::get_image_info(avif_file());
        REQUIRE(info);
        CHECK(info.value().format() == vexel::image_format::avif);
        const auto* stub = std::get_if<vexel::stub_info>(&info.value().details);
        REQUIRE(stub != nullptr);
        CHECK(stub->brand == "avif");
    }
}

TEST_CASE("dispatch: decode by content and by codec name") {
    auto img = vexel::decode(ppm_file());
    REQUIRE(img);
    CHECK(img.value().format() == vexel::pixel_format::rgb8);

    auto named = vexel::decode(ppm_file(), "netpbm");
    REQUIRE(named);
    CHECK(named.value().width() == 1);

    auto unknown = vexel::decode(ppm_file(), "tiff");
    REQUIRE(unknown.is_error());
    CHECK(unknown.code() == vexel::decode_error::unsupported_format);
}

TEST_CASE("dispatch: get_image_info reports dimensions") {
    auto info = vexel::get_image_info(pgm_file());
    REQUIRE(info);
    CHECK(info.value().format() == vexel::image_format::netpbm);
    CHECK(info.value().dimensions() == std::pair<std::uint32_t, std::uint32_t>{2, 2});

    const std::string text = vexel::format_info(info.value());
    CHECK(text.find("netpbm") != std::string::npos);
}

TEST_CASE("dispatch: dimension limits from options") {
    vexel::decode_options options;
    options.max_width = 1;
    auto img = vexel::decode(pgm_file(), options);
    REQUIRE(img.is_error());
    CHECK(img.code() == vexel::decode_error::dimensions_exceeded);
}

// ============================================================================
// Batch
// ============================================================================

TEST_CASE("batch: expand_inputs lists directories one level deep") {
    temp_dir dir("vexel_expand_test");
    write_file(dir.path() / "b.ppm", ppm_file());
    write_file(dir.path() / "a.pgm", pgm_file());
    std::filesystem::create_directories(dir.path() / "nested");
    write_file(dir.path() / "nested" / "c.pgm", pgm_file());

    const auto loose = std::filesystem::path("/nonexistent/x.bmp");
    const auto files = vexel::expand_inputs({dir.path(), loose});
    REQUIRE(files.size() == 3);
    CHECK(files[0].filename() == "a.pgm");
    CHECK(files[1].filename() == "b.ppm");
    CHECK(files[2] == loose);
}

TEST_CASE("batch: one corrupt file does not stop the others") {
    temp_dir dir("vexel_batch_test");
    write_file(dir.path() / "1.pgm", pgm_file());
    write_file(dir.path() / "2.bmp", bmp_file());
    auto truncated = ppm_file();
    truncated.resize(truncated.size() - 2);
    write_file(dir.path() / "3.ppm", truncated);
    write_file(dir.path() / "4.ppm", ppm_file());

    captured_errors errors;
    std::vector<std::string> decoded;
    const auto summary = vexel::decode_batch({dir.path()}, {},
        [&](const std::filesystem::path& path, vexel::image_decoder&, const vexel::image& img) {
            decoded.push_back(path.filename().string());
            CHECK(img.width() > 0);
            return vexel::status::success();
        });

    CHECK(summary.succeeded == 3);
    REQUIRE(summary.failed() == 1);
    CHECK(summary.failures[0].path.filename() == "3.ppm");
    CHECK(summary.failures[0].reason.code == vexel::decode_error::unexpected_eof);
    CHECK(decoded == std::vector<std::string>{"1.pgm", "2.bmp", "4.ppm"});

    REQUIRE(errors.lines.size() == 1);
    CHECK(errors.lines[0].find("3.ppm") != std::string::npos);
}

TEST_CASE("batch: failing callback and unopenable inputs count as failures") {
    temp_dir dir("vexel_batch_callback_test");
    write_file(dir.path() / "a.pgm", pgm_file());
    write_file(dir.path() / "b.txt", bytes_of("plain text"));

    captured_errors errors;
    const auto summary = vexel::decode_batch(
        {dir.path() / "a.pgm", dir.path() / "b.txt", dir.path() / "missing.pgm"}, {},
        [](const std::filesystem::path&, vexel::image_decoder&, const vexel::image&) {
            return vexel::status(vexel::failure(vexel::decode_error::io_error, "disk full"));
        });

    CHECK(summary.succeeded == 0);
    REQUIRE(summary.failed() == 3);
    CHECK(summary.failures[0].reason.code == vexel::decode_error::io_error);
    CHECK(summary.failures[0].reason.message == "disk full");
    CHECK(summary.failures[1].reason.code == vexel::decode_error::unsupported_format);
    CHECK(summary.failures[2].reason.code == vexel::decode_error::io_error);
    CHECK(errors.lines.size() == 3);
}

TEST_CASE("batch: inspect_batch reads headers of stub formats") {
    temp_dir dir("vexel_inspect_test");
    write_file(dir.path() / "a.webp", webp_file());
    write_file(dir.path() / "b.pgm", pgm_file());

    std::vector<vexel::image_format> formats;
    const auto summary = vexel::inspect_batch({dir.path()},
        [&](const std::filesystem::path&, const vexel::image_info& info) {
            formats.push_back(info.format());
            return vexel::status::success();
        });

    CHECK(summary.succeeded == 2);
    CHECK(summary.failed() == 0);
    CHECK(formats == std::vector<vexel::image_format>{vexel::image_format::webp,
                                                      vexel::image_format::netpbm});
}
