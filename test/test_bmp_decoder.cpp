#include <doctest/doctest.h>
#include <vexel/vexel.hpp>

#include <stb_image.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <variant>
#include <vector>

namespace {

void push16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

void push32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF));
    }
}

struct bmp_layout {
    std::int32_t width = 0;
    std::int32_t height = 0;
    std::uint16_t bpp = 24;
    std::uint32_t compression = 0;
    std::uint32_t header_size = 40;
    std::vector<std::uint32_t> masks;         // written after a 40-byte header or inside V4
    std::vector<std::uint8_t> palette;        // BGRX entries
    std::vector<std::uint8_t> pixels;         // as stored
};

std::vector<std::uint8_t> build_bmp(const bmp_layout& s) {
    const bool masks_after_header = s.header_size == 40 && !s.masks.empty();
    const std::uint32_t offset = 14 + s.header_size +
        (masks_after_header ? static_cast<std::uint32_t>(s.masks.size() * 4) : 0) +
        static_cast<std::uint32_t>(s.palette.size());

    std::vector<std::uint8_t> out = {'B', 'M'};
    push32(out, offset + static_cast<std::uint32_t>(s.pixels.size()));
    push32(out, 0);
    push32(out, offset);

    const std::size_t header_start = out.size();
    push32(out, s.header_size);
    push32(out, static_cast<std::uint32_t>(s.width));
    push32(out, static_cast<std::uint32_t>(s.height));
    push16(out, 1);
    push16(out, s.bpp);
    push32(out, s.compression);
    push32(out, static_cast<std::uint32_t>(s.pixels.size()));
    push32(out, 2835);
    push32(out, 2835);
    push32(out, static_cast<std::uint32_t>(s.palette.size() / 4));
    push32(out, 0);
    if (s.header_size > 40) {
        for (std::size_t i = 0; i < 4; ++i) {
            push32(out, i < s.masks.size() ? s.masks[i] : 0);
        }
        out.resize(header_start + s.header_size, 0);
    } else {
        for (auto m : s.masks) {
            push32(out, m);
        }
    }
    out.insert(out.end(), s.palette.begin(), s.palette.end());
    out.insert(out.end(), s.pixels.begin(), s.pixels.end());
    return out;
}

vexel::result<vexel::image> decode_bmp(const std::vector<std::uint8_t>& data) {
    vexel::bmp_decoder dec(std::make_unique<vexel::memory_source>(data));
    return dec.decode();
}

std::array<std::uint8_t, 3> rgb_at(const vexel::image& img, std::uint32_t x, std::uint32_t y) {
    const auto px = img.pixels8();
    const std::size_t ch = vexel::channel_count(img.format());
    const std::size_t i = (static_cast<std::size_t>(y) * img.width() + x) * ch;
    return {px[i], px[i + 1], px[i + 2]};
}

// 4-entry palette: black, red, green, blue (BGRX)
const std::vector<std::uint8_t> palette4 = {
    0, 0, 0, 0,
    0, 0, 255, 0,
    0, 255, 0, 0,
    255, 0, 0, 0
};

} // namespace

TEST_CASE("bmp: 24-bit bottom-up") {
    // 3x2, rows padded to 12 bytes; bottom row first
    bmp_layout s;
    s.width = 3;
    s.height = 2;
    s.pixels = {
        // y = 1 (bottom): white, gray, black
        255, 255, 255,  128, 128, 128,  0, 0, 0,  0, 0, 0,
        // y = 0 (top): red, green, blue in BGR
        0, 0, 255,  0, 255, 0,  255, 0, 0,  0, 0, 0
    };
    const auto file = build_bmp(s);

    auto img = decode_bmp(file);
    REQUIRE(img);
    CHECK(img.value().format() == vexel::pixel_format::rgb8);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
    CHECK(rgb_at(img.value(), 2, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
    CHECK(rgb_at(img.value(), 1, 1) == std::array<std::uint8_t, 3>{128, 128, 128});

    int w = 0;
    int h = 0;
    int n = 0;
    stbi_uc* ref = stbi_load_from_memory(file.data(), static_cast<int>(file.size()), &w, &h, &n, 3);
    REQUIRE(ref != nullptr);
    CHECK(w == 3);
    CHECK(h == 2);
    const auto px = img.value().pixels8();
    CHECK(std::equal(px.begin(), px.end(), ref));
    stbi_image_free(ref);
}

TEST_CASE("bmp: top-down rows") {
    bmp_layout s;
    s.width = 1;
    s.height = -2;
    s.pixels = {0, 0, 255, 0,  255, 0, 0, 0};
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(img.value().height() == 2);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 0, 1) == std::array<std::uint8_t, 3>{0, 0, 255});
}

TEST_CASE("bmp: palette depths") {
    SUBCASE("1-bit") {
        bmp_layout s;
        s.width = 8;
        s.height = 1;
        s.bpp = 1;
        s.palette = {0, 0, 0, 0, 255, 255, 255, 0};
        s.pixels = {0xA5, 0, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        const std::array<int, 8> bits = {1, 0, 1, 0, 0, 1, 0, 1};
        for (std::uint32_t x = 0; x < 8; ++x) {
            const std::uint8_t v = bits[x] ? 255 : 0;
            CHECK(rgb_at(img.value(), x, 0) == std::array<std::uint8_t, 3>{v, v, v});
        }
    }

    SUBCASE("4-bit") {
        bmp_layout s;
        s.width = 3;
        s.height = 1;
        s.bpp = 4;
        s.palette = palette4;
        s.pixels = {0x12, 0x30, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
        CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
        CHECK(rgb_at(img.value(), 2, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
    }

    SUBCASE("8-bit with an index beyond the table") {
        bmp_layout s;
        s.width = 2;
        s.height = 1;
        s.bpp = 8;
        s.palette = palette4;
        s.pixels = {3, 9, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
        CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 0, 0});
    }
}

TEST_CASE("bmp: 16-bit default 5-5-5") {
    bmp_layout s;
    s.width = 2;
    s.height = 1;
    s.bpp = 16;
    s.pixels = {0x00, 0x7C,  0x10, 0x00};  // pure red, blue = 16
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 0, 132});
}

TEST_CASE("bmp: bitfields") {
    SUBCASE("16-bit 5-6-5") {
        bmp_layout s;
        s.width = 1;
        s.height = 1;
        s.bpp = 16;
        s.compression = 3;
        s.masks = {0xF800, 0x07E0, 0x001F};
        s.pixels = {0xE0, 0x07, 0, 0};  // green only
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(img.value().format() == vexel::pixel_format::rgb8);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
    }

    SUBCASE("32-bit V4 with alpha") {
        bmp_layout s;
        s.width = 1;
        s.height = 1;
        s.bpp = 32;
        s.compression = 3;
        s.header_size = 108;
        s.masks = {0x00FF0000, 0x0000FF00, 0x000000FF, 0xFF000000};
        s.pixels = {0x30, 0x20, 0x10, 0x80};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(img.value().format() == vexel::pixel_format::rgba8);
        const auto px = img.value().pixels8();
        CHECK(px[0] == 0x10);
        CHECK(px[1] == 0x20);
        CHECK(px[2] == 0x30);
        CHECK(px[3] == 0x80);
    }
}

TEST_CASE("bmp: 32-bit BI_RGB ignores the fourth byte") {
    bmp_layout s;
    s.width = 1;
    s.height = 1;
    s.bpp = 32;
    s.pixels = {0x30, 0x20, 0x10, 0x00};
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(img.value().format() == vexel::pixel_format::rgb8);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{0x10, 0x20, 0x30});
}

TEST_CASE("bmp: RLE8") {
    bmp_layout s;
    s.width = 4;
    s.height = 2;
    s.bpp = 8;
    s.compression = 1;
    s.palette = palette4;
    s.pixels = {
        4, 1,          // bottom row: 4 x red
        0, 0,          // end of line
        0, 4, 0, 1, 2, 3,  // top row absolute: black red green blue
        0, 1           // end of bitmap
    };
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{0, 0, 0});
    CHECK(rgb_at(img.value(), 3, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
    for (std::uint32_t x = 0; x < 4; ++x) {
        CHECK(rgb_at(img.value(), x, 1) == std::array<std::uint8_t, 3>{255, 0, 0});
    }
}

TEST_CASE("bmp: RLE4") {
    bmp_layout s;
    s.width = 4;
    s.height = 1;
    s.bpp = 4;
    s.compression = 2;
    s.palette = palette4;
    s.pixels = {4, 0x12, 0, 1};  // red green red green
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
    CHECK(rgb_at(img.value(), 2, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 3, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
}

TEST_CASE("bmp: invalid files") {
    SUBCASE("truncated pixel data") {
        bmp_layout s;
        s.width = 4;
        s.height = 4;
        s.pixels = {1, 2, 3};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::unexpected_eof);
    }

    SUBCASE("zero width") {
        bmp_layout s;
        s.width = 0;
        s.height = 1;
        s.pixels = {0, 0, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::invalid_dimensions);
    }

    SUBCASE("unsupported depth") {
        bmp_layout s;
        s.width = 1;
        s.height = 1;
        s.bpp = 7;
        s.pixels = {0, 0, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::unsupported_format);
    }

    SUBCASE("top-down RLE") {
        bmp_layout s;
        s.width = 1;
        s.height = -1;
        s.bpp = 8;
        s.compression = 1;
        s.palette = palette4;
        s.pixels = {1, 0, 0, 1};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::invalid_data);
    }

    SUBCASE("bad DIB header size") {
        bmp_layout s;
        s.width = 1;
        s.height = 1;
        s.header_size = 41;
        s.pixels = {0, 0, 0, 0};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img.is_error());
        CHECK(img.code() == vexel::decode_error::invalid_format);
    }
}

TEST_CASE("bmp: header info") {
    bmp_layout s;
    s.width = 2;
    s.height = -3;
    s.bpp = 8;
    s.palette = palette4;
    s.pixels.assign(12, 1);
    vexel::bmp_decoder dec(std::make_unique<vexel::memory_source>(build_bmp(s)));
    const auto info = dec.get_image_info();
    const auto* bmp = std::get_if<vexel::bmp_info>(&info.details);
    REQUIRE(bmp != nullptr);
    CHECK(bmp->signature == "BM");
    CHECK(bmp->width == 2);
    CHECK(bmp->height == -3);
    CHECK(bmp->top_down());
    CHECK(bmp->bits_per_pixel == 8);
    CHECK(bmp->color_table.size() == 4);
    CHECK(bmp->x_pixels_per_meter == 2835);

    auto img = dec.decode();
    REQUIRE(img);
    CHECK(rgb_at(img.value(), 1, 2) == std::array<std::uint8_t, 3>{255, 0, 0});
}

TEST_CASE("bmp: header variants") {
    SUBCASE("OS/2 core header with 3-byte palette entries") {
        std::vector<std::uint8_t> file = {'B', 'M'};
        push32(file, 14 + 12 + 6 + 4);
        push32(file, 0);
        push32(file, 14 + 12 + 6);
        push32(file, 12);
        push16(file, 2);
        push16(file, 1);
        push16(file, 1);
        push16(file, 1);
        file.insert(file.end(), {0, 0, 255,  255, 0, 0});  // red, blue (BGR)
        file.insert(file.end(), {0x40, 0, 0, 0});          // pixel 0 = 0, pixel 1 = 1

        vexel::bmp_decoder dec(std::make_unique<vexel::memory_source>(file));
        auto img = dec.decode();
        REQUIRE(img);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
        CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
        CHECK(dec.info().header_size == 12);
        CHECK(dec.info().planes == 1);
        CHECK(dec.info().color_table.size() == 2);
    }

    SUBCASE("V5 header fields") {
        bmp_layout s;
        s.width = 1;
        s.height = 1;
        s.bpp = 32;
        s.compression = 3;
        s.header_size = 124;
        s.masks = {0x00FF0000, 0x0000FF00, 0x000000FF, 0};
        s.pixels = {0x03, 0x02, 0x01, 0x00};
        vexel::bmp_decoder dec(std::make_unique<vexel::memory_source>(build_bmp(s)));
        auto img = dec.decode();
        REQUIRE(img);
        CHECK(img.value().format() == vexel::pixel_format::rgb8);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{1, 2, 3});

        const auto& info = dec.info();
        CHECK(info.header_size == 124);
        CHECK(info.planes == 1);
        CHECK(info.compression == vexel::bmp_compression::bitfields);
        CHECK(info.image_size == 4);
        CHECK(info.y_pixels_per_meter == 2835);
        CHECK(info.red_mask == 0x00FF0000);
        CHECK(info.blue_mask == 0x000000FF);
    }
}

TEST_CASE("bmp: masks as wide as the pixel") {
    bmp_layout s;
    s.width = 2;
    s.height = 1;
    s.bpp = 32;
    s.compression = 3;
    s.header_size = 108;
    s.masks = {0xFFFFFFFF, 0, 0, 0};
    s.pixels = {0xFF, 0xFF, 0xFF, 0xFF,  0x00, 0x00, 0x00, 0x80};
    auto img = decode_bmp(build_bmp(s));
    REQUIRE(img);
    CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
    CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{128, 0, 0});
}

TEST_CASE("bmp: RLE absolute runs cut short by the end of data") {
    SUBCASE("RLE8 odd run without padding byte") {
        bmp_layout s;
        s.width = 4;
        s.height = 1;
        s.bpp = 8;
        s.compression = 1;
        s.palette = palette4;
        s.pixels = {0, 3, 1, 2, 3};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
        CHECK(rgb_at(img.value(), 2, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
        CHECK(rgb_at(img.value(), 3, 0) == std::array<std::uint8_t, 3>{0, 0, 0});
    }

    SUBCASE("RLE4 run longer than the data") {
        bmp_layout s;
        s.width = 5;
        s.height = 1;
        s.bpp = 4;
        s.compression = 2;
        s.palette = palette4;
        s.pixels = {0, 5, 0x12, 0x30};
        auto img = decode_bmp(build_bmp(s));
        REQUIRE(img);
        CHECK(rgb_at(img.value(), 0, 0) == std::array<std::uint8_t, 3>{255, 0, 0});
        CHECK(rgb_at(img.value(), 1, 0) == std::array<std::uint8_t, 3>{0, 255, 0});
        CHECK(rgb_at(img.value(), 2, 0) == std::array<std::uint8_t, 3>{0, 0, 255});
        CHECK(rgb_at(img.value(), 4, 0) == std::array<std::uint8_t, 3>{0, 0, 0});
    }
}
