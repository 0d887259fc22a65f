#ifndef VEXEL_BATCH_HPP_
#define VEXEL_BATCH_HPP_

#include <vexel/vexel_export.h>
#include <vexel/decoder.hpp>
#include <vexel/image.hpp>
#include <vexel/info.hpp>
#include <vexel/types.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace vexel {

// ============================================================================
// Batch Decoding
// ============================================================================

struct batch_failure {
    std::filesystem::path path;
    error reason;
};

struct batch_summary {
    std::size_t succeeded = 0;
    std::vector<batch_failure> failures;

    [[nodiscard]] std::size_t failed() const noexcept { return failures.size(); }
};

/**
 * Called for every successfully decoded file. A failing status counts the
 * file as failed; the batch continues either way.
 */
using batch_callback = std::function<status(const std::filesystem::path& path,
                                            image_decoder& decoder,
                                            const image& img)>;

/**
 * Called for every file whose headers parse.
 */
using info_callback = std::function<status(const std::filesystem::path& path,
                                           const image_info& info)>;

/**
 * Replace every directory by the regular files directly inside it
 * (one level, sorted by name). Other paths are kept as given.
 */
[[nodiscard]] VEXEL_EXPORT std::vector<std::filesystem::path>
expand_inputs(const std::vector<std::filesystem::path>& inputs);

/**
 * Open and decode every input independently. Failures are logged and
 * recorded; no failure stops the batch.
 */
[[nodiscard]] VEXEL_EXPORT batch_summary decode_batch(const std::vector<std::filesystem::path>& inputs,
                                                      const decode_options& options = {},
                                                      const batch_callback& on_decoded = {});

/**
 * Parse headers of every input without decoding pixels. Same failure
 * policy as decode_batch().
 */
[[nodiscard]] VEXEL_EXPORT batch_summary inspect_batch(const std::vector<std::filesystem::path>& inputs,
                                                       const info_callback& on_info,
                                                       const decode_options& options = {});

} // namespace vexel

#endif // VEXEL_BATCH_HPP_
