#ifndef VEXEL_VEXEL_HPP_
#define VEXEL_VEXEL_HPP_

#include <vexel/vexel_export.h>
#include <vexel/types.hpp>
#include <vexel/log.hpp>
#include <vexel/byte_source.hpp>
#include <vexel/bit_reader.hpp>
#include <vexel/marker.hpp>
#include <vexel/safe_access.hpp>
#include <vexel/image.hpp>
#include <vexel/decoder.hpp>
#include <vexel/info.hpp>
#include <vexel/codec.hpp>
#include <vexel/batch.hpp>
#include <vexel/codecs/jpeg.hpp>
#include <vexel/codecs/png.hpp>
#include <vexel/codecs/gif.hpp>
#include <vexel/codecs/bmp.hpp>
#include <vexel/codecs/netpbm.hpp>
#include <vexel/codecs/stub.hpp>

namespace vexel {

// All public API is included via the headers above.
// See:
//   - types.hpp:       image_format, decode_error, result, decode_options
//   - bit_reader.hpp:  bit_reader over a byte_source, marker search
//   - image.hpp:       image, pixel_format, image_frame
//   - codec.hpp:       codec_registry, open(), decode(), get_image_info()
//   - batch.hpp:       decode_batch(), inspect_batch()
//   - codecs/*.hpp:    Individual decoders and their info structs

} // namespace vexel

#endif // VEXEL_VEXEL_HPP_
