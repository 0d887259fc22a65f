#ifndef VEXEL_TYPES_HPP_
#define VEXEL_TYPES_HPP_

#include <vexel/vexel_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace vexel {

// ============================================================================
// Image Formats
// ============================================================================

enum class image_format {
    unknown,
    jpeg,
    png,
    gif,
    bmp,
    netpbm,
    webp,
    avif
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(image_format fmt) noexcept;

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    io_error,
    unexpected_eof,
    invalid_format,
    unsupported_format,
    unknown_marker,
    out_of_bounds,
    invalid_dimensions,
    dimensions_exceeded,
    invalid_data,
    not_implemented,
    internal_error
};

[[nodiscard]] VEXEL_EXPORT const char* to_string(decode_error err) noexcept;

struct error {
    decode_error code = decode_error::internal_error;
    std::string message;
};

/// Builds an error value; converts implicitly into any result<T>.
[[nodiscard]] inline error failure(decode_error code, std::string message = {}) {
    return error{code, std::move(message)};
}

// ============================================================================
// Result
// ============================================================================

/**
 * Value-or-error return type. Errors are returned, never thrown.
 */
template <typename T>
class [[nodiscard]] result {
public:
    result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::in_place_index<0>, std::move(value)) {}

    result(const T& value)
        : data_(std::in_place_index<0>, value) {}

    result(error&& err) noexcept
        : data_(std::in_place_index<1>, std::move(err)) {}

    result(const error& err)
        : data_(std::in_place_index<1>, err) {}

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const error& error_info() const { return std::get<1>(data_); }
    [[nodiscard]] decode_error code() const noexcept {
        return is_ok() ? decode_error::none : std::get<1>(data_).code;
    }
    [[nodiscard]] const std::string& message() const { return std::get<1>(data_).message; }

    template <typename U>
    [[nodiscard]] T value_or(U&& fallback) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(fallback));
    }

private:
    std::variant<T, error> data_;
};

template <>
class [[nodiscard]] result<void> {
public:
    result() noexcept : data_(std::in_place_index<0>) {}

    result(error&& err) noexcept
        : data_(std::in_place_index<1>, std::move(err)) {}

    result(const error& err)
        : data_(std::in_place_index<1>, err) {}

    [[nodiscard]] static result success() { return {}; }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] const error& error_info() const { return std::get<1>(data_); }
    [[nodiscard]] decode_error code() const noexcept {
        return is_ok() ? decode_error::none : std::get<1>(data_).code;
    }
    [[nodiscard]] const std::string& message() const { return std::get<1>(data_).message; }

private:
    std::variant<std::monostate, error> data_;
};

using status = result<void>;

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;

    // PNG: log CRC mismatches (decoding continues either way)
    bool verify_crc = true;

    // Extract GIF/APNG animation frames
    bool decode_frames = true;
    std::size_t max_frames = 4096;
};

} // namespace vexel

#endif // VEXEL_TYPES_HPP_
