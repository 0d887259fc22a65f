#include <vexel/batch.hpp>
#include <vexel/codec.hpp>
#include <vexel/log.hpp>

#include <algorithm>
#include <string>
#include <system_error>

namespace vexel {

std::vector<std::filesystem::path> expand_inputs(const std::vector<std::filesystem::path>& inputs) {
    std::vector<std::filesystem::path> files;
    for (const auto& input : inputs) {
        std::error_code ec;
        if (!std::filesystem::is_directory(input, ec)) {
            files.push_back(input);
            continue;
        }

        std::vector<std::filesystem::path> entries;
        for (std::filesystem::directory_iterator it(input, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                entries.push_back(it->path());
            }
        }
        if (ec) {
            log_warn("cannot list " + input.string() + ": " + ec.message());
        }
        std::sort(entries.begin(), entries.end());
        files.insert(files.end(), entries.begin(), entries.end());
    }
    return files;
}

namespace {

template <typename Step>
batch_summary run_batch(const std::vector<std::filesystem::path>& inputs,
                        const decode_options& options,
                        Step&& step) {
    batch_summary summary;

    for (const auto& path : expand_inputs(inputs)) {
        log_info("decoding " + path.string());

        status outcome;
        auto dec = open(path, options);
        if (dec) {
            outcome = step(path, *dec.value());
        } else {
            outcome = dec.error_info();
        }

        if (!outcome) {
            const auto& err = outcome.error_info();
            log_error(path.string() + ": " + to_string(err.code) + ": " + err.message);
            summary.failures.push_back(batch_failure{path, err});
            continue;
        }
        summary.succeeded++;
    }

    log_info("batch finished: " + std::to_string(summary.succeeded) + " succeeded, " +
             std::to_string(summary.failed()) + " failed");
    return summary;
}

} // namespace

batch_summary decode_batch(const std::vector<std::filesystem::path>& inputs,
                           const decode_options& options,
                           const batch_callback& on_decoded) {
    return run_batch(inputs, options, [&](const std::filesystem::path& path, image_decoder& dec) -> status {
        auto img = dec.decode();
        if (!img) {
            return img.error_info();
        }
        log_debug(path.string() + ": " + std::to_string(img.value().width()) + "x" +
                  std::to_string(img.value().height()) + " " + to_string(img.value().format()));
        if (on_decoded) {
            return on_decoded(path, dec, img.value());
        }
        return status::success();
    });
}

batch_summary inspect_batch(const std::vector<std::filesystem::path>& inputs,
                            const info_callback& on_info,
                            const decode_options& options) {
    return run_batch(inputs, options, [&](const std::filesystem::path& path, image_decoder& dec) -> status {
        const auto info = dec.get_image_info();
        if (on_info) {
            return on_info(path, info);
        }
        return status::success();
    });
}

} // namespace vexel
