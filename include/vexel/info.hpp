#ifndef VEXEL_INFO_HPP_
#define VEXEL_INFO_HPP_

#include <vexel/vexel_export.h>
#include <vexel/codecs/bmp.hpp>
#include <vexel/codecs/gif.hpp>
#include <vexel/codecs/jpeg.hpp>
#include <vexel/codecs/netpbm.hpp>
#include <vexel/codecs/png.hpp>
#include <vexel/codecs/stub.hpp>
#include <vexel/types.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace vexel {

// ============================================================================
// Image Info
// ============================================================================

/**
 * Structural metadata of one file, whichever format it is.
 * Fields a decoder has not reached yet keep their defaults.
 */
struct image_info {
    std::variant<jpeg_info, png_info, gif_info, bmp_info, netpbm_info, stub_info> details;

    [[nodiscard]] VEXEL_EXPORT image_format format() const noexcept;

    /// Declared width and height; GIF reports the logical screen.
    [[nodiscard]] VEXEL_EXPORT std::pair<std::uint32_t, std::uint32_t> dimensions() const noexcept;
};

/**
 * Multi-line human-readable report of the metadata.
 */
[[nodiscard]] VEXEL_EXPORT std::string format_info(const image_info& info);

} // namespace vexel

#endif // VEXEL_INFO_HPP_
