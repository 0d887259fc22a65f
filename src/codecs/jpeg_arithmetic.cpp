#include "jpeg_internal.hpp"

#include <algorithm>
#include <string>

namespace vexel::jpeg_detail {

// ============================================================================
// QM decoder
// ============================================================================

namespace {

// T.81 Table D.2, plus entry 113: a non-adapting 0.5 estimate.
constexpr qe_entry qe_table[114] = {
    {0x5a1d,   1,   1, 1}, {0x2586,  14,   2, 0}, {0x1114,  16,   3, 0}, {0x080b,  18,   4, 0},
    {0x03d8,  20,   5, 0}, {0x01da,  23,   6, 0}, {0x00e5,  25,   7, 0}, {0x006f,  28,   8, 0},
    {0x0036,  30,   9, 0}, {0x001a,  33,  10, 0}, {0x000d,  35,  11, 0}, {0x0006,   9,  12, 0},
    {0x0003,  10,  13, 0}, {0x0001,  12,  13, 0}, {0x5a7f,  15,  15, 1}, {0x3f25,  36,  16, 0},
    {0x2cf2,  38,  17, 0}, {0x207c,  39,  18, 0}, {0x17b9,  40,  19, 0}, {0x1182,  42,  20, 0},
    {0x0cef,  43,  21, 0}, {0x09a1,  45,  22, 0}, {0x072f,  46,  23, 0}, {0x055c,  48,  24, 0},
    {0x0406,  49,  25, 0}, {0x0303,  51,  26, 0}, {0x0240,  52,  27, 0}, {0x01b1,  54,  28, 0},
    {0x0144,  56,  29, 0}, {0x00f5,  57,  30, 0}, {0x00b7,  59,  31, 0}, {0x008a,  60,  32, 0},
    {0x0068,  62,  33, 0}, {0x004e,  63,  34, 0}, {0x003b,  32,  35, 0}, {0x002c,  33,   9, 0},
    {0x5ae1,  37,  37, 1}, {0x484c,  64,  38, 0}, {0x3a0d,  65,  39, 0}, {0x2ef1,  67,  40, 0},
    {0x261f,  68,  41, 0}, {0x1f33,  69,  42, 0}, {0x19a8,  70,  43, 0}, {0x1518,  72,  44, 0},
    {0x1177,  73,  45, 0}, {0x0e74,  74,  46, 0}, {0x0bfb,  75,  47, 0}, {0x09f8,  77,  48, 0},
    {0x0861,  78,  49, 0}, {0x0706,  79,  50, 0}, {0x05cd,  48,  51, 0}, {0x04de,  50,  52, 0},
    {0x040f,  50,  53, 0}, {0x0363,  51,  54, 0}, {0x02d4,  52,  55, 0}, {0x025c,  53,  56, 0},
    {0x01f8,  54,  57, 0}, {0x01a4,  55,  58, 0}, {0x0160,  56,  59, 0}, {0x0125,  57,  60, 0},
    {0x00f6,  58,  61, 0}, {0x00cb,  59,  62, 0}, {0x00ab,  61,  63, 0}, {0x008f,  61,  32, 0},
    {0x5b12,  65,  65, 1}, {0x4d04,  80,  66, 0}, {0x412c,  81,  67, 0}, {0x37d8,  82,  68, 0},
    {0x2fe8,  83,  69, 0}, {0x293c,  84,  70, 0}, {0x2379,  86,  71, 0}, {0x1edf,  87,  72, 0},
    {0x1aa9,  87,  73, 0}, {0x174e,  72,  74, 0}, {0x1424,  72,  75, 0}, {0x119c,  74,  76, 0},
    {0x0f6b,  74,  77, 0}, {0x0d51,  75,  78, 0}, {0x0bb6,  77,  79, 0}, {0x0a40,  77,  48, 0},
    {0x5832,  80,  81, 1}, {0x4d1c,  88,  82, 0}, {0x438e,  89,  83, 0}, {0x3bdd,  90,  84, 0},
    {0x34ee,  91,  85, 0}, {0x2eae,  92,  86, 0}, {0x299a,  93,  87, 0}, {0x2516,  86,  71, 0},
    {0x5570,  88,  89, 1}, {0x4ca9,  95,  90, 0}, {0x44d9,  96,  91, 0}, {0x3e22,  97,  92, 0},
    {0x3824,  99,  93, 0}, {0x32b4,  99,  94, 0}, {0x2e17,  93,  86, 0}, {0x56a8,  95,  96, 1},
    {0x4f46, 101,  97, 0}, {0x47e5, 102,  98, 0}, {0x41cf, 103,  99, 0}, {0x3c3d, 104, 100, 0},
    {0x375e,  99,  93, 0}, {0x5231, 105, 102, 0}, {0x4c0f, 106, 103, 0}, {0x4639, 107, 104, 0},
    {0x415e, 103,  99, 0}, {0x5627, 105, 106, 1}, {0x50e7, 108, 107, 0}, {0x4b85, 109, 103, 0},
    {0x5597, 110, 109, 0}, {0x504f, 111, 107, 0}, {0x5a10, 110, 111, 1}, {0x5522, 112, 109, 0},
    {0x59eb, 112, 111, 1}, {0x5a1d, 113, 113, 0}
};

} // namespace

const qe_entry& qm_estimate(qm_state state) noexcept {
    return qe_table[state & 0x7F];
}

void qm_decoder::reset(std::span<const std::uint8_t> data) noexcept {
    data_ = data;
    pos_ = 0;
    c_ = 0;
    a_ = 0;
    ct_ = -16;
}

std::uint8_t qm_decoder::next_byte() noexcept {
    // Past the end of the segment the coder is fed zeros.
    if (pos_ >= data_.size()) {
        return 0;
    }
    return data_[pos_++];
}

int qm_decoder::decode(qm_state& state) noexcept {
    // Renormalization and byte input (D.2.6). The first two bytes prime C.
    while (a_ < 0x8000) {
        if (--ct_ < 0) {
            c_ = (c_ << 8) | next_byte();
            if ((ct_ += 8) < 0) {
                if (++ct_ == 0) {
                    a_ = 0x8000;
                }
            }
        }
        a_ <<= 1;
    }

    int sv = state;
    const qe_entry& entry = qm_estimate(static_cast<qm_state>(sv));
    const std::int32_t qe = entry.qe;
    const int next_lps = entry.next_lps | (entry.switch_mps << 7);
    const int next_mps = entry.next_mps;

    std::int32_t temp = a_ - qe;
    a_ = temp;
    temp <<= ct_;
    if (c_ >= temp) {
        c_ -= temp;
        // Conditional LPS exchange
        if (a_ < qe) {
            a_ = qe;
            state = static_cast<qm_state>((sv & 0x80) ^ next_mps);
        } else {
            a_ = qe;
            state = static_cast<qm_state>((sv & 0x80) ^ next_lps);
            sv ^= 0x80;
        }
    } else if (a_ < 0x8000) {
        // Conditional MPS exchange
        if (a_ < qe) {
            state = static_cast<qm_state>((sv & 0x80) ^ next_lps);
            sv ^= 0x80;
        } else {
            state = static_cast<qm_state>((sv & 0x80) ^ next_mps);
        }
    }
    return sv >> 7;
}

// ============================================================================
// Conditioning
// ============================================================================

arithmetic_conditioning make_conditioning(const jpeg_info& info) {
    arithmetic_conditioning cond;
    for (const auto& table : info.arithmetic_tables) {
        if (table.id >= 4) {
            continue;
        }
        if (table.table_class == 0) {
            cond.dc_l[table.id] = table.value & 0x0F;
            cond.dc_u[table.id] = table.value >> 4;
        } else {
            cond.ac_k[table.id] = table.value;
        }
    }
    return cond;
}

// ============================================================================
// Arithmetic entropy decoder (T.81 F.2.4 and G.2)
// ============================================================================

namespace {

constexpr std::size_t dc_stat_bins = 64;
constexpr std::size_t ac_stat_bins = 256;

class arithmetic_entropy_decoder final : public entropy_decoder {
public:
    arithmetic_entropy_decoder(const jpeg_scan_info& scan, bool progressive, scan_tables tables,
                               const arithmetic_conditioning& cond)
        : ss_(scan.spectral_start),
          se_(scan.spectral_end),
          ah_(scan.approx_high),
          al_(scan.approx_low),
          progressive_(progressive),
          tables_(std::move(tables)),
          cond_(cond),
          last_dc_(scan.components.size(), 0),
          dc_context_(scan.components.size(), 0) {}

    void start_segment(std::span<const std::uint8_t> data) override {
        coder_.reset(data);
        for (auto& stats : dc_stats_) {
            stats.fill(0);
        }
        for (auto& stats : ac_stats_) {
            stats.fill(0);
        }
        std::fill(last_dc_.begin(), last_dc_.end(), 0);
        std::fill(dc_context_.begin(), dc_context_.end(), 0);
        fixed_bin_ = qm_fixed_state;
    }

    status decode_mcu(std::span<const mcu_block> blocks) override {
        for (const auto& blk : blocks) {
            status st;
            if (!progressive_) {
                st = decode_dc(blk, 0);
                if (st && se_ > 0) {
                    st = decode_ac(blk, 1, 63, 0);
                }
            } else if (ss_ == 0) {
                if (ah_ == 0) {
                    st = decode_dc(blk, al_);
                } else if (coder_.decode(fixed_bin_)) {
                    blk.coef[0] |= (1 << al_);
                }
            } else {
                st = ah_ == 0 ? decode_ac(blk, ss_, se_, al_) : decode_ac_refine(blk);
            }
            if (!st) {
                return st;
            }
        }
        return {};
    }

private:
    int bit(qm_state& state) { return coder_.decode(state); }

    status decode_dc(const mcu_block& blk, unsigned shift) {
        const std::size_t ci = blk.scan_component;
        const std::uint8_t tbl = tables_.dc_ids[ci];
        auto& stats = dc_stats_[tbl];
        std::size_t st = dc_context_[ci];

        if (bit(stats[st]) == 0) {
            dc_context_[ci] = 0;
        } else {
            const int sign = bit(stats[st + 1]);
            st += 2 + static_cast<std::size_t>(sign);

            int m = bit(stats[st]);
            if (m != 0) {
                std::size_t x = 20;
                while (bit(stats[x])) {
                    if ((m <<= 1) == 0x8000) {
                        return failure(decode_error::invalid_data, "arithmetic DC magnitude overflow");
                    }
                    ++x;
                }
                st = x;
            }

            if (m < ((1 << cond_.dc_l[tbl]) >> 1)) {
                dc_context_[ci] = 0;
            } else if (m > ((1 << cond_.dc_u[tbl]) >> 1)) {
                dc_context_[ci] = 12 + static_cast<std::size_t>(sign) * 4;
            } else {
                dc_context_[ci] = 4 + static_cast<std::size_t>(sign) * 4;
            }

            std::int32_t v = m;
            st += 14;
            for (int mask = m >> 1; mask != 0; mask >>= 1) {
                if (bit(stats[st])) {
                    v |= mask;
                }
            }
            v += 1;
            if (sign) {
                v = -v;
            }
            last_dc_[ci] += v;
        }

        blk.coef[0] = static_cast<std::int32_t>(static_cast<std::uint32_t>(last_dc_[ci]) << shift);
        return {};
    }

    status decode_ac(const mcu_block& blk, unsigned start, unsigned end, unsigned shift) {
        const std::uint8_t tbl = tables_.ac_ids[blk.scan_component];
        auto& stats = ac_stats_[tbl];

        unsigned k = start - 1;
        do {
            std::size_t st = 3 * static_cast<std::size_t>(k);
            if (bit(stats[st])) {
                break;  // EOB
            }
            for (;;) {
                ++k;
                if (bit(stats[st + 1])) {
                    break;
                }
                st += 3;
                if (k >= end) {
                    return failure(decode_error::invalid_data, "arithmetic spectral overflow");
                }
            }

            const int sign = bit(fixed_bin_);
            st += 2;

            int m = bit(stats[st]);
            if (m != 0 && bit(stats[st]) != 0) {
                m <<= 1;
                st = k <= cond_.ac_k[tbl] ? 189 : 217;
                while (bit(stats[st])) {
                    if ((m <<= 1) == 0x8000) {
                        return failure(decode_error::invalid_data, "arithmetic AC magnitude overflow");
                    }
                    ++st;
                }
            }

            std::int32_t v = m;
            st += 14;
            for (int mask = m >> 1; mask != 0; mask >>= 1) {
                if (bit(stats[st])) {
                    v |= mask;
                }
            }
            v += 1;
            if (sign) {
                v = -v;
            }
            blk.coef[jpeg_zigzag[k]] = static_cast<std::int32_t>(static_cast<std::uint32_t>(v) << shift);
        } while (k < end);
        return {};
    }

    status decode_ac_refine(const mcu_block& blk) {
        const std::uint8_t tbl = tables_.ac_ids[blk.scan_component];
        auto& stats = ac_stats_[tbl];
        const std::int32_t p1 = 1 << al_;
        const std::int32_t m1 = -(1 << al_);
        std::int32_t* coef = blk.coef;

        // End of block as of the previous stage
        unsigned kex = se_;
        while (kex > 0 && coef[jpeg_zigzag[kex]] == 0) {
            --kex;
        }

        unsigned k = ss_ - 1;
        do {
            std::size_t st = 3 * static_cast<std::size_t>(k);
            if (k >= kex && bit(stats[st])) {
                break;  // EOB
            }
            for (;;) {
                std::int32_t& c = coef[jpeg_zigzag[++k]];
                if (c != 0) {
                    if (bit(stats[st + 2])) {
                        c += c < 0 ? m1 : p1;
                    }
                    break;
                }
                if (bit(stats[st + 1])) {
                    c = bit(fixed_bin_) ? m1 : p1;
                    break;
                }
                st += 3;
                if (k >= se_) {
                    return failure(decode_error::invalid_data, "arithmetic spectral overflow");
                }
            }
        } while (k < se_);
        return {};
    }

    unsigned ss_;
    unsigned se_;
    unsigned ah_;
    unsigned al_;
    bool progressive_;
    scan_tables tables_;
    arithmetic_conditioning cond_;
    qm_decoder coder_;
    std::array<std::array<qm_state, dc_stat_bins>, 4> dc_stats_{};
    std::array<std::array<qm_state, ac_stat_bins>, 4> ac_stats_{};
    qm_state fixed_bin_ = qm_fixed_state;
    std::vector<std::int32_t> last_dc_;
    std::vector<std::size_t> dc_context_;
};

} // namespace

std::unique_ptr<entropy_decoder> make_arithmetic_decoder(const jpeg_scan_info& scan,
                                                         bool progressive,
                                                         scan_tables tables,
                                                         const arithmetic_conditioning& cond) {
    return std::make_unique<arithmetic_entropy_decoder>(scan, progressive, std::move(tables), cond);
}

} // namespace vexel::jpeg_detail
