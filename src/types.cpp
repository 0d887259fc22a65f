#include <vexel/types.hpp>

namespace vexel {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                return "none";
        case decode_error::io_error:            return "io_error";
        case decode_error::unexpected_eof:      return "unexpected_eof";
        case decode_error::invalid_format:      return "invalid_format";
        case decode_error::unsupported_format:  return "unsupported_format";
        case decode_error::unknown_marker:      return "unknown_marker";
        case decode_error::out_of_bounds:       return "out_of_bounds";
        case decode_error::invalid_dimensions:  return "invalid_dimensions";
        case decode_error::dimensions_exceeded: return "dimensions_exceeded";
        case decode_error::invalid_data:        return "invalid_data";
        case decode_error::not_implemented:     return "not_implemented";
        case decode_error::internal_error:      return "internal_error";
    }
    return "unknown";
}

const char* to_string(image_format fmt) noexcept {
    switch (fmt) {
        case image_format::unknown: return "unknown";
        case image_format::jpeg:    return "jpeg";
        case image_format::png:     return "png";
        case image_format::gif:     return "gif";
        case image_format::bmp:     return "bmp";
        case image_format::netpbm:  return "netpbm";
        case image_format::webp:    return "webp";
        case image_format::avif:    return "avif";
    }
    return "unknown";
}

} // namespace vexel
