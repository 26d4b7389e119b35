/**
 * @file dcmtk_decoder.hpp
 * @brief Adapter turning DCMTK file contents into metaview datasets
 *
 * DCMTK does the byte-level work (transfer syntaxes, VR and length
 * parsing, item delimitation). This adapter copies the resulting element
 * tree into core::dicom_dataset, keeping bulk payloads out of memory.
 */

#pragma once

#include <metaview/core/dicom_dataset.hpp>
#include <metaview/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>

class DcmItem;
class DcmElement;

namespace metaview::integration {

/**
 * @struct decode_options
 * @brief Options for reading a DICOM file
 */
struct decode_options {
    /// Prepend the File Meta Information group (0002,xxxx) to the dataset
    bool include_meta_info{false};

    /// Values longer than this many bytes stay on disk until accessed
    std::uint32_t max_read_length{4096};

    /// Maximum sequence nesting accepted from the file; deeper files fail
    /// with depth_limit_exceeded
    std::size_t max_depth{256};
};

/**
 * @class dcmtk_decoder
 * @brief Reads DICOM Part 10 files through DCMTK
 *
 * Conversion rules:
 * - SQ elements become sequence values with one dataset per item
 * - String VRs become text, or one component per value when VM > 1
 * - US SS UL SL UV SV FL FD and AT become host-order packed values
 * - OB OD OF OL OV OW UN and pixel data become deferred payloads that
 *   record the declared length only
 *
 * @example
 * @code
 * dcmtk_decoder decoder;
 * auto result = decoder.decode_file("image.dcm");
 * if (result.is_err()) {
 *     std::cerr << "Error: " << result.error().message << "\n";
 * }
 * @endcode
 */
class dcmtk_decoder {
public:
    dcmtk_decoder() = default;

    explicit dcmtk_decoder(const decode_options& options);

    /**
     * @brief Decode a file into a dataset
     * @return The dataset, or file_not_found, file_read_error,
     *         invalid_dicom_file, decode_error or depth_limit_exceeded
     */
    [[nodiscard]] auto decode_file(const std::filesystem::path& path) const
        -> Result<core::dicom_dataset>;

    [[nodiscard]] auto options() const noexcept -> const decode_options& {
        return options_;
    }

private:
    [[nodiscard]] auto convert_item(DcmItem& item, std::size_t level,
                                    core::dicom_dataset& out) const -> VoidResult;

    [[nodiscard]] auto convert_element(DcmElement& element, std::size_t level) const
        -> Result<core::dicom_element>;

    decode_options options_;
};

/**
 * @brief Decode a file with a one-shot decoder
 */
[[nodiscard]] auto decode_file(const std::filesystem::path& path,
                               const decode_options& options = {})
    -> Result<core::dicom_dataset>;

}  // namespace metaview::integration
