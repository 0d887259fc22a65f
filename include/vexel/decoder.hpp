#ifndef VEXEL_DECODER_HPP_
#define VEXEL_DECODER_HPP_

#include <vexel/vexel_export.h>
#include <vexel/image.hpp>
#include <vexel/types.hpp>

namespace vexel {

struct image_info;

// ============================================================================
// Decoder Interface
// ============================================================================

/**
 * Abstract base class for format decoders.
 * A decoder owns its byte source; instances are never shared between
 * concurrent decodes.
 */
class VEXEL_EXPORT image_decoder {
public:
    virtual ~image_decoder() = default;

    [[nodiscard]] virtual image_format format() const noexcept = 0;

    /**
     * Parse the whole stream and reconstruct pixels.
     * Metadata is accumulated as a side effect; call once.
     */
    [[nodiscard]] virtual result<image> decode() = 0;

    /**
     * Snapshot of the metadata accumulated so far. Before decode() this
     * parses headers only and rewinds the source.
     */
    [[nodiscard]] virtual image_info get_image_info() = 0;
};

} // namespace vexel

#endif // VEXEL_DECODER_HPP_
