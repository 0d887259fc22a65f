#include <doctest/doctest.h>
#include <vexel/vexel.hpp>

#include "codecs/decode_helpers.hpp"
#include "codecs/jpeg_internal.hpp"

#include <stb_image.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace {

// ============================================================================
// Stream builder
// ============================================================================

// Entropy-coded segment writer with 0xFF stuffing; pads with 1 bits.
class bit_writer {
public:
    void put(std::uint32_t value, unsigned n) {
        for (unsigned i = n; i-- > 0;) {
            acc_ = static_cast<std::uint8_t>((acc_ << 1) | ((value >> i) & 1u));
            if (++bits_ == 8) {
                emit();
            }
        }
    }

    void flush() {
        while (bits_ != 0) {
            put(1, 1);
        }
    }

    std::vector<std::uint8_t>& bytes() { return bytes_; }

private:
    void emit() {
        bytes_.push_back(acc_);
        if (acc_ == 0xFF) {
            bytes_.push_back(0x00);
        }
        acc_ = 0;
        bits_ = 0;
    }

    std::vector<std::uint8_t> bytes_;
    std::uint8_t acc_ = 0;
    unsigned bits_ = 0;
};

unsigned category(std::int32_t v) {
    unsigned s = 0;
    for (std::uint32_t m = static_cast<std::uint32_t>(std::abs(v)); m != 0; m >>= 1) {
        ++s;
    }
    return s;
}

// DC table 0: symbols 0..11, all 4-bit codes, so the code of category s is s.
// AC table 0: EOB only, code "0".
void put_magnitude(bit_writer& w, std::int32_t v, unsigned s) {
    if (s > 0) {
        const std::int32_t bits = v > 0 ? v : v + (1 << s) - 1;
        w.put(static_cast<std::uint32_t>(bits), s);
    }
}

void put_dc(bit_writer& w, std::int32_t diff) {
    const unsigned s = category(diff);
    w.put(s, 4);
    put_magnitude(w, diff, s);
}

void put_eob(bit_writer& w) {
    w.put(0, 1);
}

struct component_def {
    std::uint8_t id;
    std::uint8_t h;
    std::uint8_t v;
};

class jpeg_builder {
public:
    jpeg_builder() {
        bytes_ = {0xFF, 0xD8};
    }

    jpeg_builder& dqt() {
        segment(0xDB, [](std::vector<std::uint8_t>& p) {
            p.push_back(0x00);
            p.insert(p.end(), 64, 1);
        });
        return *this;
    }

    jpeg_builder& sof(std::uint8_t marker, std::uint8_t precision, std::uint16_t width, std::uint16_t height,
                      const std::vector<component_def>& comps) {
        segment(marker, [&](std::vector<std::uint8_t>& p) {
            p.push_back(precision);
            push16(p, height);
            push16(p, width);
            p.push_back(static_cast<std::uint8_t>(comps.size()));
            for (const auto& c : comps) {
                p.push_back(c.id);
                p.push_back(static_cast<std::uint8_t>((c.h << 4) | c.v));
                p.push_back(0);
            }
        });
        return *this;
    }

    // With ac_symbols given, AC table 0 holds them as 8-bit codes equal to
    // their position in the list instead of the lone EOB.
    jpeg_builder& dht(const std::vector<std::uint8_t>& ac_symbols = {}) {
        segment(0xC4, [&](std::vector<std::uint8_t>& p) {
            p.push_back(0x00);  // DC 0
            for (int len = 1; len <= 16; ++len) {
                p.push_back(len == 4 ? 12 : 0);
            }
            for (std::uint8_t s = 0; s < 12; ++s) {
                p.push_back(s);
            }
            p.push_back(0x10);  // AC 0
            for (int len = 1; len <= 16; ++len) {
                if (ac_symbols.empty()) {
                    p.push_back(len == 1 ? 1 : 0);
                } else {
                    p.push_back(len == 8 ? static_cast<std::uint8_t>(ac_symbols.size()) : 0);
                }
            }
            if (ac_symbols.empty()) {
                p.push_back(0x00);
            } else {
                p.insert(p.end(), ac_symbols.begin(), ac_symbols.end());
            }
        });
        return *this;
    }

    jpeg_builder& dri(std::uint16_t interval) {
        segment(0xDD, [&](std::vector<std::uint8_t>& p) { push16(p, interval); });
        return *this;
    }

    jpeg_builder& sos(const std::vector<std::uint8_t>& ids, std::uint8_t ss, std::uint8_t se,
                      std::uint8_t ah, std::uint8_t al, const std::vector<std::uint8_t>& data) {
        segment(0xDA, [&](std::vector<std::uint8_t>& p) {
            p.push_back(static_cast<std::uint8_t>(ids.size()));
            for (auto id : ids) {
                p.push_back(id);
                p.push_back(0x00);
            }
            p.push_back(ss);
            p.push_back(se);
            p.push_back(static_cast<std::uint8_t>((ah << 4) | al));
        });
        bytes_.insert(bytes_.end(), data.begin(), data.end());
        return *this;
    }

    std::vector<std::uint8_t> finish(bool eoi = true) {
        if (eoi) {
            bytes_.push_back(0xFF);
            bytes_.push_back(0xD9);
        }
        return bytes_;
    }

private:
    static void push16(std::vector<std::uint8_t>& p, std::uint16_t v) {
        p.push_back(static_cast<std::uint8_t>(v >> 8));
        p.push_back(static_cast<std::uint8_t>(v & 0xFF));
    }

    template <typename Fill>
    void segment(std::uint8_t marker, Fill&& fill) {
        std::vector<std::uint8_t> payload;
        fill(payload);
        bytes_.push_back(0xFF);
        bytes_.push_back(marker);
        push16(bytes_, static_cast<std::uint16_t>(payload.size() + 2));
        bytes_.insert(bytes_.end(), payload.begin(), payload.end());
    }

    std::vector<std::uint8_t> bytes_;
};

// 16x16 grayscale, one flat 8x8 block per quadrant (raster block order)
constexpr std::array<std::int32_t, 4> quadrant_dc = {-512, 0, 256, 640};

int flat_level(std::int32_t dc, int precision = 8) {
    return static_cast<int>(std::lround(dc / 8.0)) + (1 << (precision - 1));
}

std::vector<std::uint8_t> baseline_gray_stream() {
    bit_writer w;
    std::int32_t pred = 0;
    for (auto dc : quadrant_dc) {
        put_dc(w, dc - pred);
        put_eob(w);
        pred = dc;
    }
    w.flush();
    return jpeg_builder().dqt().sof(0xC0, 8, 16, 16, {{1, 1, 1}}).dht()
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish();
}

void check_quadrants(const vexel::image& img, std::span<const std::int32_t> dcs, int tolerance = 1) {
    REQUIRE(img.format() == vexel::pixel_format::l8);
    const auto px = img.pixels8();
    for (std::uint32_t y = 0; y < 16; ++y) {
        for (std::uint32_t x = 0; x < 16; ++x) {
            const int expected = flat_level(dcs[(y / 8) * 2 + x / 8]);
            CHECK(std::abs(static_cast<int>(px[y * 16 + x]) - expected) <= tolerance);
        }
    }
}

struct stb_pixels {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> data;
};

stb_pixels stb_decode(const std::vector<std::uint8_t>& file, int channels) {
    stb_pixels out;
    int n = 0;
    stbi_uc* px = stbi_load_from_memory(file.data(), static_cast<int>(file.size()),
                                        &out.width, &out.height, &n, channels);
    if (px != nullptr) {
        out.data.assign(px, px + static_cast<std::size_t>(out.width) * out.height * channels);
        stbi_image_free(px);
    }
    return out;
}

void check_against_stb(const std::vector<std::uint8_t>& file, const vexel::image& img, int tolerance) {
    const int channels = static_cast<int>(img.channels());
    auto ref = stb_decode(file, channels);
    REQUIRE(!ref.data.empty());
    REQUIRE(static_cast<std::uint32_t>(ref.width) == img.width());
    REQUIRE(static_cast<std::uint32_t>(ref.height) == img.height());

    const auto px = img.pixels8();
    REQUIRE(px.size() == ref.data.size());
    int worst = 0;
    for (std::size_t i = 0; i < px.size(); ++i) {
        worst = std::max(worst, std::abs(static_cast<int>(px[i]) - static_cast<int>(ref.data[i])));
    }
    CHECK(worst <= tolerance);
}

vexel::result<vexel::image> decode_jpeg(const std::vector<std::uint8_t>& data, vexel::jpeg_info* info = nullptr) {
    vexel::jpeg_decoder dec(std::make_unique<vexel::memory_source>(data));
    auto img = dec.decode();
    if (info != nullptr) {
        *info = dec.info();
    }
    return img;
}

} // namespace

// ============================================================================
// Sequential Huffman
// ============================================================================

TEST_CASE("jpeg: baseline grayscale") {
    const auto file = baseline_gray_stream();
    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);

    CHECK(img.value().width() == 16);
    CHECK(img.value().height() == 16);
    check_quadrants(img.value(), quadrant_dc);
    check_against_stb(file, img.value(), 1);

    CHECK(info.mode == vexel::jpeg_mode::baseline);
    CHECK(info.coding == vexel::jpeg_coding::huffman);
    REQUIRE(info.frame_marker.has_value());
    CHECK(*info.frame_marker == vexel::jpeg_marker::sof0);
    CHECK(info.precision == 8);
    CHECK(info.components.size() == 1);
    CHECK(info.quantization_tables.size() == 1);
    CHECK(info.huffman_tables.size() == 2);
    CHECK(info.scans.size() == 1);
}

TEST_CASE("jpeg: restart intervals reset the DC predictor") {
    bit_writer w;
    std::vector<std::uint8_t> data;
    for (std::size_t i = 0; i < quadrant_dc.size(); ++i) {
        put_dc(w, quadrant_dc[i]);
        put_eob(w);
        w.flush();
        if (i + 1 < quadrant_dc.size()) {
            w.bytes().push_back(0xFF);
            w.bytes().push_back(static_cast<std::uint8_t>(0xD0 + i % 8));
        }
    }
    const auto file = jpeg_builder().dqt().sof(0xC0, 8, 16, 16, {{1, 1, 1}}).dht().dri(1)
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish();

    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);
    check_quadrants(img.value(), quadrant_dc);
    check_against_stb(file, img.value(), 1);

    CHECK(info.restart_interval == 1);
    REQUIRE(info.scans.size() == 1);
    CHECK(info.scans[0].segments == 4);
}

TEST_CASE("jpeg: 4:2:0 color with interleaved MCU") {
    constexpr std::int32_t cb_dc = 80;
    constexpr std::int32_t cr_dc = -40;

    bit_writer w;
    std::int32_t pred = 0;
    for (auto dc : quadrant_dc) {
        put_dc(w, dc - pred);
        put_eob(w);
        pred = dc;
    }
    put_dc(w, cb_dc);
    put_eob(w);
    put_dc(w, cr_dc);
    put_eob(w);
    w.flush();

    const auto file = jpeg_builder().dqt()
        .sof(0xC0, 8, 16, 16, {{1, 2, 2}, {2, 1, 1}, {3, 1, 1}}).dht()
        .sos({1, 2, 3}, 0, 63, 0, 0, w.bytes()).finish();

    auto img = decode_jpeg(file);
    REQUIRE(img);
    REQUIRE(img.value().format() == vexel::pixel_format::rgb8);

    const double cb = cb_dc / 8.0;
    const double cr = cr_dc / 8.0;
    const auto px = img.value().pixels8();
    for (std::uint32_t y = 0; y < 16; ++y) {
        for (std::uint32_t x = 0; x < 16; ++x) {
            const double luma = flat_level(quadrant_dc[(y / 8) * 2 + x / 8]);
            const std::size_t i = (y * 16 + x) * 3;
            CHECK(std::abs(px[i] - (luma + 1.402 * cr)) <= 1.5);
            CHECK(std::abs(px[i + 1] - (luma - 0.344136 * cb - 0.714136 * cr)) <= 1.5);
            CHECK(std::abs(px[i + 2] - (luma + 1.772 * cb)) <= 1.5);
        }
    }
    check_against_stb(file, img.value(), 2);
}

TEST_CASE("jpeg: 12-bit extended sequential decodes to 16-bit samples") {
    constexpr std::int32_t dc = 2000;
    bit_writer w;
    put_dc(w, dc);
    put_eob(w);
    w.flush();
    const auto file = jpeg_builder().dqt().sof(0xC1, 12, 8, 8, {{1, 1, 1}}).dht()
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish();

    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);
    CHECK(info.mode == vexel::jpeg_mode::extended_sequential);
    CHECK(info.precision == 12);
    REQUIRE(img.value().format() == vexel::pixel_format::l16);

    const auto expected = vexel::scale_to_16(static_cast<std::uint32_t>(flat_level(dc, 12)), 4095);
    for (auto v : img.value().pixels16()) {
        CHECK(std::abs(static_cast<int>(v) - static_cast<int>(expected)) <= 17);
    }
}

// ============================================================================
// Progressive Huffman
// ============================================================================

TEST_CASE("jpeg: progressive with DC successive approximation") {
    constexpr std::array<std::int32_t, 4> dcs = {-516, 4, 262, 646};
    constexpr std::uint8_t first_al = 2;

    jpeg_builder b;
    b.dqt().sof(0xC2, 8, 16, 16, {{1, 1, 1}}).dht();

    // DC first scan: differences of DC >> Al
    {
        bit_writer w;
        std::int32_t pred = 0;
        for (auto dc : dcs) {
            const std::int32_t v = dc >> first_al;
            put_dc(w, v - pred);
            pred = v;
        }
        w.flush();
        b.sos({1}, 0, 0, 0, first_al, w.bytes());
    }

    // DC refinement scans: one raw bit per block
    for (std::uint8_t al = first_al; al-- > 0;) {
        bit_writer w;
        for (auto dc : dcs) {
            w.put(static_cast<std::uint32_t>(dc >> al) & 1u, 1);
        }
        w.flush();
        b.sos({1}, 0, 0, static_cast<std::uint8_t>(al + 1), al, w.bytes());
    }

    // AC first scan: every block ends immediately
    {
        bit_writer w;
        for (std::size_t i = 0; i < dcs.size(); ++i) {
            put_eob(w);
        }
        w.flush();
        b.sos({1}, 1, 63, 0, 0, w.bytes());
    }
    const auto file = b.finish();

    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);
    CHECK(info.mode == vexel::jpeg_mode::progressive);
    CHECK(info.scans.size() == 4);
    check_quadrants(img.value(), dcs);
    check_against_stb(file, img.value(), 1);
}

// ============================================================================
// AC coefficients: sequential, progressive and arithmetic coding of one image
// ============================================================================

// Zigzag-ordered coefficients of one 8x8 block.
using coef_block = std::array<std::int32_t, 64>;

// 16x16 grayscale, raster block order. Block 0 has coefficients that are
// refined in the second AC pass and one that first appears there (z7).
std::vector<coef_block> ac_blocks() {
    std::vector<coef_block> blocks(4, coef_block{});
    blocks[0][0] = -515;
    blocks[0][1] = 5;
    blocks[0][2] = -3;
    blocks[0][5] = 2;
    blocks[0][7] = -1;
    blocks[1][0] = 3;
    blocks[2][0] = 258;
    blocks[3][0] = 641;
    blocks[3][3] = 7;
    blocks[3][10] = 1;
    return blocks;
}

const std::vector<std::uint8_t> ac_symbols = {0x00, 0x01, 0x02, 0x03, 0x10, 0x11,
                                              0x21, 0x22, 0x23, 0x31, 0x61, 0x81};

void put_ac(bit_writer& w, std::uint8_t symbol) {
    const auto it = std::find(ac_symbols.begin(), ac_symbols.end(), symbol);
    REQUIRE(it != ac_symbols.end());
    w.put(static_cast<std::uint32_t>(it - ac_symbols.begin()), 8);
}

std::vector<std::uint8_t> sequential_ac_stream() {
    bit_writer w;
    std::int32_t pred = 0;
    for (const auto& blk : ac_blocks()) {
        put_dc(w, blk[0] - pred);
        pred = blk[0];
        unsigned run = 0;
        for (unsigned k = 1; k < 64; ++k) {
            if (blk[k] == 0) {
                ++run;
                continue;
            }
            REQUIRE(run < 16);
            const unsigned s = category(blk[k]);
            put_ac(w, static_cast<std::uint8_t>((run << 4) | s));
            put_magnitude(w, blk[k], s);
            run = 0;
        }
        if (run > 0) {
            put_ac(w, 0x00);
        }
    }
    w.flush();
    return jpeg_builder().dqt().sof(0xC0, 8, 16, 16, {{1, 1, 1}}).dht(ac_symbols)
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish();
}

// QM encoder (T.81 D.1) writing a stuffed entropy-coded segment.
class qm_encoder {
public:
    void encode(vexel::jpeg_detail::qm_state& state, int value) {
        const int sv = state;
        const auto& entry = vexel::jpeg_detail::qm_estimate(state);
        const std::int64_t qe = entry.qe;

        a_ -= qe;
        if (value != (sv >> 7)) {
            if (a_ >= qe) {
                c_ += a_;
                a_ = qe;
            }
            state = static_cast<vexel::jpeg_detail::qm_state>((sv & 0x80) ^ (entry.next_lps | (entry.switch_mps << 7)));
        } else {
            if (a_ >= 0x8000) {
                return;
            }
            if (a_ < qe) {
                c_ += a_;
                a_ = qe;
            }
            state = static_cast<vexel::jpeg_detail::qm_state>((sv & 0x80) ^ entry.next_mps);
        }

        do {
            a_ <<= 1;
            c_ <<= 1;
            if (--ct_ == 0) {
                const std::int64_t temp = c_ >> 19;
                if (temp > 0xFF) {
                    carry();
                    buffer_ = static_cast<int>(temp & 0xFF);
                } else if (temp == 0xFF) {
                    ++sc_;
                } else {
                    settle();
                    buffer_ = static_cast<int>(temp);
                }
                c_ &= 0x7FFFF;
                ct_ += 8;
            }
        } while (a_ < 0x8000);
    }

    std::vector<std::uint8_t> finish() {
        // Pick the value in the final interval with the most trailing zeros
        const std::int64_t temp = (a_ - 1 + c_) & 0xFFFF0000;
        c_ = temp < c_ ? temp + 0x8000 : temp;
        c_ <<= ct_;
        if (c_ & 0xF8000000) {
            carry();
        } else {
            settle();
        }
        if (c_ & 0x7FFF800) {
            zeros();
            put(static_cast<std::uint8_t>(c_ >> 19));
            if (c_ & 0x7F800) {
                put(static_cast<std::uint8_t>(c_ >> 11));
            }
        }
        return out_;
    }

private:
    void put(std::uint8_t b) {
        out_.push_back(b);
        if (b == 0xFF) {
            out_.push_back(0x00);
        }
    }

    void zeros() {
        out_.insert(out_.end(), zc_, 0x00);
        zc_ = 0;
    }

    // The buffered byte absorbs a carry; stacked 0xFF bytes become zeros.
    void carry() {
        if (buffer_ >= 0) {
            zeros();
            put(static_cast<std::uint8_t>(buffer_ + 1));
        }
        zc_ += sc_;
        sc_ = 0;
    }

    // No carry can reach the buffered byte or the stacked 0xFF bytes any more.
    void settle() {
        if (buffer_ == 0) {
            ++zc_;
        } else if (buffer_ > 0) {
            zeros();
            put(static_cast<std::uint8_t>(buffer_));
        }
        if (sc_ > 0) {
            zeros();
            for (; sc_ > 0; --sc_) {
                out_.push_back(0xFF);
                out_.push_back(0x00);
            }
        }
    }

    std::vector<std::uint8_t> out_;
    std::int64_t c_ = 0;
    std::int64_t a_ = 0x10000;
    std::size_t sc_ = 0;
    std::size_t zc_ = 0;
    int ct_ = 11;
    int buffer_ = -1;
};

// Arithmetic statistical model for one single-component scan with the
// default conditioning (L = 0, U = 1, Kx = 5).
class arithmetic_scan_writer {
public:
    void dc(std::int32_t value) {
        std::size_t st = dc_context_;
        std::int32_t v = value - last_dc_;
        if (v == 0) {
            coder_.encode(dc_stats_[st], 0);
            dc_context_ = 0;
            return;
        }
        last_dc_ = value;
        coder_.encode(dc_stats_[st], 1);
        if (v > 0) {
            coder_.encode(dc_stats_[st + 1], 0);
            st += 2;
            dc_context_ = 4;
        } else {
            v = -v;
            coder_.encode(dc_stats_[st + 1], 1);
            st += 3;
            dc_context_ = 8;
        }

        int m = 0;
        if ((v -= 1) != 0) {
            coder_.encode(dc_stats_[st], 1);
            m = 1;
            std::int32_t v2 = v;
            st = 20;
            while ((v2 >>= 1) != 0) {
                coder_.encode(dc_stats_[st], 1);
                m <<= 1;
                ++st;
            }
        }
        coder_.encode(dc_stats_[st], 0);
        if (m > 1) {
            dc_context_ += 8;
        }
        st += 14;
        while ((m >>= 1) != 0) {
            coder_.encode(dc_stats_[st], (m & v) != 0 ? 1 : 0);
        }
    }

    void raw(int bit) { coder_.encode(fixed_, bit); }

    // Sequential AC or the first pass of a progressive band.
    void ac(const coef_block& blk, unsigned ss, unsigned se, unsigned al) {
        auto at = [&](unsigned k) { return std::abs(blk[k]) >> al; };
        unsigned ke = se;
        while (ke > 0 && at(ke) == 0) {
            --ke;
        }

        unsigned k = ss;
        for (; k <= ke; ++k) {
            std::size_t st = 3 * (k - 1);
            coder_.encode(ac_stats_[st], 0);
            while (at(k) == 0) {
                coder_.encode(ac_stats_[st + 1], 0);
                st += 3;
                ++k;
            }
            coder_.encode(ac_stats_[st + 1], 1);
            coder_.encode(fixed_, blk[k] < 0 ? 1 : 0);
            st += 2;

            const std::int32_t v = at(k) - 1;
            int m = 0;
            if (v != 0) {
                coder_.encode(ac_stats_[st], 1);
                m = 1;
                std::int32_t v2 = v >> 1;
                if (v2 != 0) {
                    coder_.encode(ac_stats_[st], 1);
                    m <<= 1;
                    st = k <= 5 ? 189 : 217;
                    while ((v2 >>= 1) != 0) {
                        coder_.encode(ac_stats_[st], 1);
                        m <<= 1;
                        ++st;
                    }
                }
            }
            coder_.encode(ac_stats_[st], 0);
            st += 14;
            while ((m >>= 1) != 0) {
                coder_.encode(ac_stats_[st], (m & v) != 0 ? 1 : 0);
            }
        }
        if (k <= se) {
            coder_.encode(ac_stats_[3 * (k - 1)], 1);
        }
    }

    // Successive approximation pass: bit al of every coefficient in the band.
    void ac_refine(const coef_block& blk, unsigned ss, unsigned se, unsigned al) {
        auto at = [&](unsigned k, unsigned shift) { return std::abs(blk[k]) >> shift; };
        unsigned ke = se;
        while (ke > 0 && at(ke, al) == 0) {
            --ke;
        }
        unsigned kex = ke;
        while (kex > 0 && at(kex, al + 1) == 0) {
            --kex;
        }

        unsigned k = ss;
        for (; k <= ke; ++k) {
            std::size_t st = 3 * (k - 1);
            if (k > kex) {
                coder_.encode(ac_stats_[st], 0);
            }
            for (;;) {
                const std::int32_t v = at(k, al);
                if (v != 0) {
                    if ((v >> 1) != 0) {
                        coder_.encode(ac_stats_[st + 2], v & 1);
                    } else {
                        coder_.encode(ac_stats_[st + 1], 1);
                        coder_.encode(fixed_, blk[k] < 0 ? 1 : 0);
                    }
                    break;
                }
                coder_.encode(ac_stats_[st + 1], 0);
                st += 3;
                ++k;
            }
        }
        if (k <= se) {
            coder_.encode(ac_stats_[3 * (k - 1)], 1);
        }
    }

    std::vector<std::uint8_t> finish() { return coder_.finish(); }

private:
    qm_encoder coder_;
    std::array<vexel::jpeg_detail::qm_state, 64> dc_stats_{};
    std::array<vexel::jpeg_detail::qm_state, 256> ac_stats_{};
    vexel::jpeg_detail::qm_state fixed_ = vexel::jpeg_detail::qm_fixed_state;
    std::int32_t last_dc_ = 0;
    std::size_t dc_context_ = 0;
};

void check_same_pixels(const vexel::image& a, const vexel::image& b) {
    REQUIRE(a.width() == b.width());
    REQUIRE(a.height() == b.height());
    const auto pa = a.pixels8();
    const auto pb = b.pixels8();
    REQUIRE(pa.size() == pb.size());
    std::size_t mismatches = 0;
    for (std::size_t i = 0; i < pa.size(); ++i) {
        mismatches += pa[i] != pb[i] ? 1 : 0;
    }
    CHECK(mismatches == 0);
}

TEST_CASE("jpeg: sequential AC coefficients agree with stb_image") {
    const auto file = sequential_ac_stream();
    auto img = decode_jpeg(file);
    REQUIRE(img);
    check_against_stb(file, img.value(), 2);

    // The AC terms must actually move pixels away from the flat DC level
    const auto px = img.value().pixels8();
    bool varies = false;
    for (std::uint32_t y = 0; y < 8; ++y) {
        for (std::uint32_t x = 0; x < 8; ++x) {
            varies = varies || px[y * 16 + x] != px[0];
        }
    }
    CHECK(varies);
}

TEST_CASE("jpeg: progressive AC bands with EOB runs and refinement") {
    const auto reference = decode_jpeg(sequential_ac_stream());
    REQUIRE(reference);
    const auto blocks = ac_blocks();

    jpeg_builder b;
    b.dqt().sof(0xC2, 8, 16, 16, {{1, 1, 1}}).dht(ac_symbols);

    // DC first scan at full precision
    {
        bit_writer w;
        std::int32_t pred = 0;
        for (const auto& blk : blocks) {
            put_dc(w, blk[0] - pred);
            pred = blk[0];
        }
        w.flush();
        b.sos({1}, 0, 0, 0, 0, w.bytes());
    }

    // AC first scan, Al = 1: block 0 holds z1 = 2, z2 = -1, z5 = 1 and ends
    // with an EOB run of 3 that also covers blocks 1 and 2; block 3 holds z3 = 3.
    {
        bit_writer w;
        put_ac(w, 0x02);
        w.put(0b10, 2);
        put_ac(w, 0x01);
        w.put(0, 1);
        put_ac(w, 0x21);
        w.put(1, 1);
        put_ac(w, 0x10);  // EOBRUN = 2 + 1
        w.put(1, 1);
        put_ac(w, 0x22);
        w.put(0b11, 2);
        put_ac(w, 0x00);
        w.flush();
        b.sos({1}, 1, 63, 0, 1, w.bytes());
    }

    // AC refinement, Ah = 1, Al = 0. Block 0 gains z7 = -1 after three zero
    // positions; the correction bits for z1, z2 and z5 follow its sign bit.
    // Block 3 gains z10 = +1 after eight zeros with the correction for z3.
    {
        bit_writer w;
        put_ac(w, 0x31);
        w.put(0, 1);
        w.put(0b110, 3);
        put_ac(w, 0x10);  // EOBRUN = 3 across blocks 0..2
        w.put(1, 1);
        put_ac(w, 0x81);
        w.put(1, 1);
        w.put(1, 1);
        put_ac(w, 0x00);
        w.flush();
        b.sos({1}, 1, 63, 1, 0, w.bytes());
    }
    const auto file = b.finish();

    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);
    CHECK(info.mode == vexel::jpeg_mode::progressive);
    CHECK(info.scans.size() == 3);
    check_same_pixels(img.value(), reference.value());
    check_against_stb(file, img.value(), 2);
}

TEST_CASE("jpeg: arithmetic coded frames match their Huffman twin") {
    // stb_image has no arithmetic decoder; the Huffman-coded stream of the
    // same coefficients, checked against stb above, is the reference.
    const auto reference = decode_jpeg(sequential_ac_stream());
    REQUIRE(reference);
    const auto blocks = ac_blocks();

    SUBCASE("SOF9 sequential") {
        arithmetic_scan_writer w;
        for (const auto& blk : blocks) {
            w.dc(blk[0]);
            w.ac(blk, 1, 63, 0);
        }
        const auto file = jpeg_builder().dqt().sof(0xC9, 8, 16, 16, {{1, 1, 1}})
            .sos({1}, 0, 63, 0, 0, w.finish()).finish();

        vexel::jpeg_info info;
        auto img = decode_jpeg(file, &info);
        REQUIRE(img);
        CHECK(info.coding == vexel::jpeg_coding::arithmetic);
        CHECK(info.mode == vexel::jpeg_mode::extended_sequential);
        check_same_pixels(img.value(), reference.value());
    }

    SUBCASE("SOF10 progressive with successive approximation") {
        jpeg_builder b;
        b.dqt().sof(0xCA, 8, 16, 16, {{1, 1, 1}});
        {
            arithmetic_scan_writer w;
            for (const auto& blk : blocks) {
                w.dc(blk[0] >> 1);
            }
            b.sos({1}, 0, 0, 0, 1, w.finish());
        }
        {
            arithmetic_scan_writer w;
            for (const auto& blk : blocks) {
                w.raw(blk[0] & 1);
            }
            b.sos({1}, 0, 0, 1, 0, w.finish());
        }
        {
            arithmetic_scan_writer w;
            for (const auto& blk : blocks) {
                w.ac(blk, 1, 63, 1);
            }
            b.sos({1}, 1, 63, 0, 1, w.finish());
        }
        {
            arithmetic_scan_writer w;
            for (const auto& blk : blocks) {
                w.ac_refine(blk, 1, 63, 0);
            }
            b.sos({1}, 1, 63, 1, 0, w.finish());
        }
        const auto file = b.finish();

        vexel::jpeg_info info;
        auto img = decode_jpeg(file, &info);
        REQUIRE(img);
        CHECK(info.coding == vexel::jpeg_coding::arithmetic);
        CHECK(info.mode == vexel::jpeg_mode::progressive);
        CHECK(info.scans.size() == 4);
        check_same_pixels(img.value(), reference.value());
    }
}

// ============================================================================
// Lossless
// ============================================================================

TEST_CASE("jpeg: lossless predictor 1") {
    // 4x2 samples; first row predicts from the left, first column from above
    const std::array<int, 8> samples = {130, 131, 131, 129,
                                        130, 130, 132, 132};
    const std::array<std::int32_t, 8> diffs = {2, 1, 0, -2,
                                               0, 0, 2, 0};
    bit_writer w;
    for (auto d : diffs) {
        put_dc(w, d);
    }
    w.flush();

    const auto file = jpeg_builder().sof(0xC3, 8, 4, 2, {{1, 1, 1}}).dht()
        .sos({1}, 1, 0, 0, 0, w.bytes()).finish();

    vexel::jpeg_info info;
    auto img = decode_jpeg(file, &info);
    REQUIRE(img);
    CHECK(info.mode == vexel::jpeg_mode::lossless);
    REQUIRE(img.value().format() == vexel::pixel_format::l8);
    const auto px = img.value().pixels8();
    REQUIRE(px.size() == samples.size());
    for (std::size_t i = 0; i < samples.size(); ++i) {
        CHECK(px[i] == samples[i]);
    }
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_CASE("jpeg: stream without EOI decodes as far as possible") {
    bit_writer w;
    put_dc(w, quadrant_dc[0]);
    put_eob(w);
    w.flush();
    const auto file = jpeg_builder().dqt().sof(0xC0, 8, 16, 16, {{1, 1, 1}}).dht()
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish(false);

    auto img = decode_jpeg(file);
    REQUIRE(img);
    CHECK(img.value().width() == 16);
    CHECK(img.value().height() == 16);

    const auto px = img.value().pixels8();
    CHECK(px[0] == flat_level(quadrant_dc[0]));
    CHECK(px[15 * 16 + 15] == 128);
}

TEST_CASE("jpeg: truncated inside the header") {
    auto file = baseline_gray_stream();
    file.resize(30);
    auto img = decode_jpeg(file);
    CHECK(img.is_error());
}

TEST_CASE("jpeg: missing quantization table is a structural error") {
    bit_writer w;
    put_dc(w, 0);
    put_eob(w);
    w.flush();
    const auto file = jpeg_builder().sof(0xC0, 8, 8, 8, {{1, 1, 1}}).dht()
        .sos({1}, 0, 63, 0, 0, w.bytes()).finish();

    auto img = decode_jpeg(file);
    REQUIRE(img.is_error());
    CHECK(img.code() == vexel::decode_error::invalid_data);
}

TEST_CASE("jpeg: hierarchical frames are unsupported") {
    const auto file = jpeg_builder().dqt().sof(0xC5, 8, 8, 8, {{1, 1, 1}}).finish();
    auto img = decode_jpeg(file);
    REQUIRE(img.is_error());
    CHECK(img.code() == vexel::decode_error::unsupported_format);
}

TEST_CASE("jpeg: zero dimensions are rejected") {
    const auto file = jpeg_builder().dqt().sof(0xC0, 8, 0, 8, {{1, 1, 1}}).finish();
    auto img = decode_jpeg(file);
    REQUIRE(img.is_error());
    CHECK(img.code() == vexel::decode_error::invalid_dimensions);
}

// ============================================================================
// Building blocks
// ============================================================================

TEST_CASE("jpeg: quantization round trip on one block") {
    std::array<std::uint16_t, 64> table{};
    for (std::size_t i = 0; i < 64; ++i) {
        table[i] = static_cast<std::uint16_t>(1 + (i * 7) % 31);
    }

    std::array<std::int32_t, 64> original{};
    for (std::size_t i = 0; i < 64; ++i) {
        const std::int32_t level = static_cast<std::int32_t>(i % 9) - 4;
        original[i] = level * table[i];
    }

    std::array<std::int32_t, 64> block{};
    for (std::size_t i = 0; i < 64; ++i) {
        block[i] = original[i] / static_cast<std::int32_t>(table[i]);
    }
    vexel::jpeg_detail::dequantize_block(block.data(), table);
    CHECK(block == original);
}

TEST_CASE("jpeg: EXTEND sign extension") {
    using vexel::jpeg_detail::extend;
    CHECK(extend(0, 0) == 0);
    CHECK(extend(1, 1) == 1);
    CHECK(extend(0, 1) == -1);
    CHECK(extend(2, 2) == 2);
    CHECK(extend(1, 2) == -2);
    CHECK(extend(0, 11) == -2047);
    CHECK(extend(2047, 11) == 2047);
}

TEST_CASE("jpeg: canonical Huffman codes") {
    vexel::jpeg_huffman_table table;
    table.counts[1] = 2;  // two 2-bit codes
    table.counts[2] = 3;  // three 3-bit codes
    table.symbols = {0x01, 0x02, 0x03, 0x11, 0x00};
    REQUIRE(vexel::jpeg_detail::assign_canonical_codes(table));
    CHECK(table.codes == std::vector<std::uint16_t>{0b00, 0b01, 0b100, 0b101, 0b110});

    vexel::jpeg_huffman_table bad;
    bad.counts[0] = 3;  // three 1-bit codes cannot exist
    bad.symbols = {1, 2, 3};
    CHECK(vexel::jpeg_detail::assign_canonical_codes(bad).code() == vexel::decode_error::invalid_data);
}

TEST_CASE("jpeg: QM decoder reproduces the T.81 test sequence") {
    // Encoder output of the arithmetic coding test in T.81 Annex K.4, with
    // the stuffed zero after 0xFF removed and the trailing marker dropped.
    const std::vector<std::uint8_t> coded = {
        0x65, 0x5B, 0x51, 0x44, 0xF7, 0x96, 0x9D, 0x51, 0x78, 0x55, 0xBF, 0xFF,
        0xFC, 0x51, 0x84, 0xC7, 0xCE, 0xF9, 0x39, 0x00, 0x28, 0x7D, 0x46, 0x70,
        0x8E, 0xCB, 0xC0, 0xF6
    };
    const std::vector<std::uint8_t> expected = {
        0x00, 0x02, 0x00, 0x51, 0x00, 0x00, 0x00, 0xC0, 0x03, 0x52, 0x87, 0x2A,
        0xAA, 0xAA, 0xAA, 0xAA, 0x82, 0xC0, 0x20, 0x00, 0xFC, 0xD7, 0x9E, 0xF6,
        0x74, 0xEA, 0xAB, 0xF7, 0x69, 0x7E, 0xE7, 0x4C
    };

    vexel::jpeg_detail::qm_decoder decoder(coded);
    vexel::jpeg_detail::qm_state state = 0;
    std::vector<std::uint8_t> decoded;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        std::uint8_t byte = 0;
        for (int bit = 0; bit < 8; ++bit) {
            byte = static_cast<std::uint8_t>((byte << 1) | decoder.decode(state));
        }
        decoded.push_back(byte);
    }
    CHECK(decoded == expected);
}

// ============================================================================
// Header-only parsing
// ============================================================================

TEST_CASE("jpeg: get_image_info before decode parses headers and rewinds") {
    const auto file = baseline_gray_stream();
    vexel::jpeg_decoder dec(std::make_unique<vexel::memory_source>(file));

    auto info = dec.get_image_info();
    CHECK(info.format() == vexel::image_format::jpeg);
    CHECK(info.dimensions() == std::pair<std::uint32_t, std::uint32_t>{16, 16});

    auto img = dec.decode();
    REQUIRE(img);
    check_quadrants(img.value(), quadrant_dc);
}

TEST_CASE("jpeg: marker table") {
    using vexel::jpeg_marker;
    CHECK(vexel::marker_from_u16<jpeg_marker>(0xFFC0) == jpeg_marker::sof0);
    CHECK(vexel::marker_from_u16<jpeg_marker>(0xFF01) == jpeg_marker::tem);
    CHECK(vexel::marker_from_u16<jpeg_marker>(0xFFFE) == jpeg_marker::com);
    CHECK_FALSE(vexel::marker_from_u16<jpeg_marker>(0xFF02).has_value());
    CHECK_FALSE(vexel::marker_from_u16<jpeg_marker>(0xFFFF).has_value());
    CHECK(vexel::marker_to_u16(jpeg_marker::dht) == 0xFFC4);
}
