#pragma once

#include <vexel/codecs/jpeg.hpp>
#include <vexel/bit_reader.hpp>
#include <vexel/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace vexel::jpeg_detail {

// ============================================================================
// Huffman lookup
// ============================================================================

/// Derived decoding table per ITU-T T.81 F.2.2.3 (MINCODE/MAXCODE/VALPTR).
struct huffman_lookup {
    std::array<std::int32_t, 17> mincode{};
    std::array<std::int32_t, 18> maxcode{};
    std::array<std::int32_t, 17> valptr{};
    std::vector<std::uint8_t> symbols;
};

/**
 * Fill table.codes with the canonical code of each symbol and validate the
 * code-length counts (no over-subscribed code space).
 */
[[nodiscard]] status assign_canonical_codes(jpeg_huffman_table& table);

[[nodiscard]] huffman_lookup build_lookup(const jpeg_huffman_table& table);

/**
 * Decode one Huffman symbol bit by bit.
 */
[[nodiscard]] result<std::uint8_t> decode_symbol(bit_reader& reader, const huffman_lookup& lookup);

/**
 * Sign-extend an s-bit magnitude per T.81 F.2.2.1 (EXTEND).
 */
[[nodiscard]] constexpr std::int32_t extend(std::uint32_t value, unsigned s) noexcept {
    if (s == 0) {
        return 0;
    }
    return value < (1u << (s - 1)) ? static_cast<std::int32_t>(value) - static_cast<std::int32_t>((1u << s) - 1)
                                   : static_cast<std::int32_t>(value);
}

// ============================================================================
// QM arithmetic decoder (T.81 Annex D)
// ============================================================================

/// Adaptive probability state: bit 7 = MPS, bits 0..6 = Qe table index.
using qm_state = std::uint8_t;

/// Index of the fixed 0.5 probability state used for sign and refinement bits.
inline constexpr qm_state qm_fixed_state = 113;

/// One row of the probability estimation table (T.81 Table D.2).
struct qe_entry {
    std::uint16_t qe;
    std::uint8_t next_lps;
    std::uint8_t next_mps;
    std::uint8_t switch_mps;
};

/// Table row for the Qe index in bits 0..6 of a state.
[[nodiscard]] const qe_entry& qm_estimate(qm_state state) noexcept;

class qm_decoder {
public:
    qm_decoder() = default;
    explicit qm_decoder(std::span<const std::uint8_t> data) { reset(data); }

    /**
     * Start decoding a new entropy-coded segment.
     */
    void reset(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode one binary decision in the given context, updating its state.
     */
    [[nodiscard]] int decode(qm_state& state) noexcept;

private:
    [[nodiscard]] std::uint8_t next_byte() noexcept;

    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
    std::int32_t c_ = 0;
    std::int32_t a_ = 0;
    std::int32_t ct_ = -16;
};

// ============================================================================
// Coefficient planes
// ============================================================================

struct component_plane {
    std::size_t component = 0;       // index into jpeg_info::components
    std::size_t width = 0;           // samples, ceil(image_width * h / h_max)
    std::size_t height = 0;
    std::size_t blocks_per_line = 0; // allocated, padded to the MCU grid
    std::size_t block_lines = 0;
    std::vector<std::int32_t> coefficients;  // 64 per block, natural order

    [[nodiscard]] std::int32_t* block(std::size_t bx, std::size_t by) noexcept {
        return coefficients.data() + (by * blocks_per_line + bx) * 64;
    }
};

struct frame_layout {
    int h_max = 1;
    int v_max = 1;
    std::size_t mcus_x = 0;
    std::size_t mcus_y = 0;
    std::vector<component_plane> planes;
};

[[nodiscard]] frame_layout make_frame_layout(const jpeg_info& info);

// ============================================================================
// Entropy decoding
// ============================================================================

struct mcu_block {
    std::size_t scan_component = 0;  // index into jpeg_scan_info::components
    std::int32_t* coef = nullptr;
};

/**
 * Decodes MCUs of one scan. A new segment starts at the beginning of the
 * scan and after every restart marker; predictors reset with it.
 */
class entropy_decoder {
public:
    virtual ~entropy_decoder() = default;

    virtual void start_segment(std::span<const std::uint8_t> data) = 0;
    [[nodiscard]] virtual status decode_mcu(std::span<const mcu_block> blocks) = 0;
};

/// Tables resolved for each scan component.
struct scan_tables {
    std::vector<const huffman_lookup*> dc;
    std::vector<const huffman_lookup*> ac;
    std::vector<std::uint8_t> dc_ids;
    std::vector<std::uint8_t> ac_ids;
};

[[nodiscard]] std::unique_ptr<entropy_decoder> make_huffman_decoder(const jpeg_scan_info& scan,
                                                                    bool progressive,
                                                                    scan_tables tables);

/// Arithmetic conditioning per table id: L, U for DC and Kx for AC.
struct arithmetic_conditioning {
    std::array<std::uint8_t, 4> dc_l{0, 0, 0, 0};
    std::array<std::uint8_t, 4> dc_u{1, 1, 1, 1};
    std::array<std::uint8_t, 4> ac_k{5, 5, 5, 5};
};

[[nodiscard]] arithmetic_conditioning make_conditioning(const jpeg_info& info);

[[nodiscard]] std::unique_ptr<entropy_decoder> make_arithmetic_decoder(const jpeg_scan_info& scan,
                                                                       bool progressive,
                                                                       scan_tables tables,
                                                                       const arithmetic_conditioning& cond);

// ============================================================================
// Reconstruction
// ============================================================================

/**
 * Multiply each coefficient by its quantization step (both natural order).
 */
void dequantize_block(std::int32_t* block, const std::array<std::uint16_t, 64>& table) noexcept;

/**
 * 8x8 inverse DCT with level shift and clamping to [0, max_sample].
 * @param coef Dequantized coefficients, natural order
 * @param out Row-major samples, stride 'stride'
 */
void inverse_dct_block(const std::int32_t* coef, std::int32_t* out, std::size_t stride,
                       int precision) noexcept;

} // namespace vexel::jpeg_detail
