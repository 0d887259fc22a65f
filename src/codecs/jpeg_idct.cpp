#include "jpeg_internal.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace vexel::jpeg_detail {

namespace {

// cos_table[x][u] = C(u) * cos((2x + 1) * u * pi / 16), C(0) = 1/sqrt(2)
struct idct_table {
    float values[8][8];

    idct_table() {
        for (int x = 0; x < 8; ++x) {
            for (int u = 0; u < 8; ++u) {
                const double cu = u == 0 ? 1.0 / std::numbers::sqrt2 : 1.0;
                values[x][u] = static_cast<float>(
                    cu * std::cos(static_cast<double>((2 * x + 1) * u) * std::numbers::pi / 16.0));
            }
        }
    }
};

const idct_table& cos_table() {
    static const idct_table table;
    return table;
}

} // namespace

void dequantize_block(std::int32_t* block, const std::array<std::uint16_t, 64>& table) noexcept {
    for (std::size_t i = 0; i < 64; ++i) {
        block[i] *= static_cast<std::int32_t>(table[i]);
    }
}

void inverse_dct_block(const std::int32_t* coef, std::int32_t* out, std::size_t stride,
                       int precision) noexcept {
    const auto& c = cos_table().values;
    float tmp[64];

    // Rows: tmp[v][x] = 1/2 * sum_u F(v,u) * c[x][u]
    for (int v = 0; v < 8; ++v) {
        const std::int32_t* row = coef + v * 8;
        for (int x = 0; x < 8; ++x) {
            float sum = 0.0f;
            for (int u = 0; u < 8; ++u) {
                sum += static_cast<float>(row[u]) * c[x][u];
            }
            tmp[v * 8 + x] = sum * 0.5f;
        }
    }

    const std::int32_t shift = 1 << (precision - 1);
    const std::int32_t max_sample = (1 << precision) - 1;

    // Columns: f(y,x) = 1/2 * sum_v tmp[v][x] * c[y][v]
    for (int x = 0; x < 8; ++x) {
        for (int y = 0; y < 8; ++y) {
            float sum = 0.0f;
            for (int v = 0; v < 8; ++v) {
                sum += tmp[v * 8 + x] * c[y][v];
            }
            const auto value = static_cast<std::int32_t>(std::lround(sum * 0.5f)) + shift;
            out[static_cast<std::size_t>(y) * stride + static_cast<std::size_t>(x)] =
                std::clamp(value, 0, max_sample);
        }
    }
}

} // namespace vexel::jpeg_detail
