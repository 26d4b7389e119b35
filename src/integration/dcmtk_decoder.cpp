/**
 * @file dcmtk_decoder.cpp
 * @brief Implementation of the DCMTK decoder adapter
 */

#include <metaview/integration/dcmtk_decoder.hpp>
#include <metaview/integration/logger_adapter.hpp>

#include <metaview/core/dicom_tag_constants.hpp>
#include <metaview/encoding/vr_type.hpp>

#include "dcmtk/config/osconfig.h"
#include "dcmtk/dcmdata/dcdatset.h"
#include "dcmtk/dcmdata/dcelem.h"
#include "dcmtk/dcmdata/dcfilefo.h"
#include "dcmtk/dcmdata/dcitem.h"
#include "dcmtk/dcmdata/dcmetinf.h"
#include "dcmtk/dcmdata/dcsequen.h"
#include "dcmtk/dcmdata/dcvr.h"

#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace metaview::integration {

namespace {

using encoding::vr_type;

auto to_tag(const DcmTagKey& key) -> core::dicom_tag {
    return core::dicom_tag{key.getGroup(), key.getElement()};
}

auto to_vr(DcmElement& element) -> vr_type {
    const DcmVR vr{element.ident()};
    return encoding::from_string(vr.getValidVRName()).value_or(vr_type::UN);
}

auto is_bulk(core::dicom_tag tag, vr_type vr) -> bool {
    return encoding::is_binary_vr(vr) || tag == core::tags::pixel_data ||
           tag == core::tags::float_pixel_data ||
           tag == core::tags::double_float_pixel_data ||
           tag == core::tags::waveform_data;
}

/**
 * @brief Read every value of a numeric element with a DCMTK getter
 * @return false if DCMTK rejects any position
 */
template <typename T, typename Getter>
auto read_values(DcmElement& element, Getter getter, std::vector<T>& values) -> bool {
    const unsigned long count = element.getVM();
    values.reserve(count);
    for (unsigned long i = 0; i < count; ++i) {
        T value{};
        if (getter(element, value, i).bad()) {
            return false;
        }
        values.push_back(value);
    }
    return true;
}

template <typename T, typename Getter>
auto packed_element(core::dicom_tag tag, vr_type vr, DcmElement& element,
                    Getter getter) -> Result<core::dicom_element> {
    std::vector<T> values;
    if (!read_values<T>(element, getter, values)) {
        return metaview_error<core::dicom_element>(
            error_codes::decode_error,
            "Cannot read " + std::string{encoding::to_string(vr)} + " value of " +
                tag.to_string());
    }
    return ok(core::dicom_element::from_numeric_list<T>(
        tag, vr, std::span<const T>{values}));
}

auto attribute_tag_element(core::dicom_tag tag, DcmElement& element)
    -> Result<core::dicom_element> {
    std::vector<uint16_t> words;
    const unsigned long count = element.getVM();
    words.reserve(count * 2);
    for (unsigned long i = 0; i < count; ++i) {
        DcmTagKey key;
        if (element.getTagVal(key, i).bad()) {
            return metaview_error<core::dicom_element>(
                error_codes::decode_error,
                "Cannot read AT value of " + tag.to_string());
        }
        words.push_back(key.getGroup());
        words.push_back(key.getElement());
    }
    return ok(core::dicom_element::from_numeric_list<uint16_t>(
        tag, vr_type::AT, std::span<const uint16_t>{words}));
}

auto string_element(core::dicom_tag tag, vr_type vr, DcmElement& element)
    -> Result<core::dicom_element> {
    const unsigned long count = element.getVM();

    if (count > 1) {
        std::vector<std::string> components;
        components.reserve(count);
        for (unsigned long i = 0; i < count; ++i) {
            OFString component;
            if (element.getOFString(component, i).bad()) {
                return metaview_error<core::dicom_element>(
                    error_codes::decode_error,
                    "Cannot read value " + std::to_string(i) + " of " + tag.to_string());
            }
            components.emplace_back(component.c_str(), component.length());
        }
        return ok(core::dicom_element::from_strings(tag, vr, std::move(components)));
    }

    OFString text;
    if (count == 1 && element.getOFStringArray(text).bad()) {
        return metaview_error<core::dicom_element>(
            error_codes::decode_error, "Cannot read value of " + tag.to_string());
    }
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.c_str());
    return ok(core::dicom_element{
        tag, vr, std::span<const uint8_t>{bytes, text.length()}});
}

}  // namespace

dcmtk_decoder::dcmtk_decoder(const decode_options& options) : options_{options} {}

auto dcmtk_decoder::decode_file(const std::filesystem::path& path) const
    -> Result<core::dicom_dataset> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        logger_adapter::error("File not found: {}", path.string());
        return metaview_error<core::dicom_dataset>(
            error_codes::file_not_found, "File not found: " + path.string());
    }
    if (!std::ifstream{path, std::ios::binary}) {
        logger_adapter::error("Cannot open {}", path.string());
        return metaview_error<core::dicom_dataset>(
            error_codes::file_read_error, "Cannot open file: " + path.string());
    }

    auto file_format = std::make_unique<DcmFileFormat>();
    const OFCondition status = file_format->loadFile(
        path.string().c_str(), EXS_Unknown, EGL_noChange, options_.max_read_length);
    if (status.bad()) {
        logger_adapter::error("Failed to read DICOM file {}: {}", path.string(),
                              status.text());
        return metaview_error<core::dicom_dataset>(
            error_codes::invalid_dicom_file,
            "Failed to read DICOM file: " + path.string(), status.text());
    }

    core::dicom_dataset dataset;

    if (options_.include_meta_info && file_format->getMetaInfo() != nullptr) {
        if (auto meta = convert_item(*file_format->getMetaInfo(), 0, dataset);
            meta.is_err()) {
            return metaview_error<core::dicom_dataset>(meta.error().code,
                                                       meta.error().message);
        }
    }

    DcmDataset* root = file_format->getDataset();
    if (root == nullptr) {
        return metaview_error<core::dicom_dataset>(
            error_codes::invalid_dicom_file, "File has no dataset: " + path.string());
    }
    if (auto body = convert_item(*root, 0, dataset); body.is_err()) {
        logger_adapter::error("Failed to convert {}: {}", path.string(),
                              body.error().message);
        return metaview_error<core::dicom_dataset>(body.error().code,
                                                   body.error().message);
    }

    if (logger_adapter::is_level_enabled(log_level::debug)) {
        const auto summary = dataset.summarize();
        logger_adapter::debug(
            "Decoded {}: {} elements ({} top-level), {} sequences, {} items, "
            "{} bulk, {} nesting levels",
            path.string(), summary.elements, dataset.size(), summary.sequences,
            summary.items, summary.bulk, summary.levels);
    }
    return ok(std::move(dataset));
}

auto dcmtk_decoder::convert_item(DcmItem& item, std::size_t level,
                                 core::dicom_dataset& out) const -> VoidResult {
    if (level > options_.max_depth) {
        return metaview_void_error(
            error_codes::depth_limit_exceeded,
            "Sequence nesting exceeds " + std::to_string(options_.max_depth) + " levels");
    }

    for (unsigned long i = 0; i < item.card(); ++i) {
        DcmElement* element = item.getElement(i);
        if (element == nullptr) {
            continue;
        }

        auto converted = convert_element(*element, level);
        if (converted.is_ok()) {
            out.insert(std::move(converted.value()));
            continue;
        }

        if (converted.error().code != error_codes::decode_error ||
            element->ident() == EVR_SQ) {
            return VoidResult(converted.error());
        }

        // An unreadable value is kept as an unloaded payload so the walker
        // can still list the element
        logger_adapter::debug("{}", converted.error().message);
        const auto tag = to_tag(element->getTag());
        out.insert(core::dicom_element::deferred(tag, to_vr(*element),
                                                 element->getLength()));
    }
    return ok();
}

auto dcmtk_decoder::convert_element(DcmElement& element, std::size_t level) const
    -> Result<core::dicom_element> {
    const auto tag = to_tag(element.getTag());
    const auto vr = to_vr(element);

    if (element.ident() == EVR_SQ) {
        auto& sequence = dynamic_cast<DcmSequenceOfItems&>(element);
        std::vector<core::dicom_dataset> items;
        items.reserve(sequence.card());
        for (unsigned long i = 0; i < sequence.card(); ++i) {
            DcmItem* item = sequence.getItem(i);
            if (item == nullptr) {
                continue;
            }
            core::dicom_dataset nested;
            if (auto result = convert_item(*item, level + 1, nested); result.is_err()) {
                return Result<core::dicom_element>::err(result.error());
            }
            items.push_back(std::move(nested));
        }
        return ok(core::dicom_element::from_sequence(tag, std::move(items)));
    }

    if (is_bulk(tag, vr)) {
        return ok(core::dicom_element::deferred(tag, vr, element.getLength()));
    }

    switch (vr) {
        case vr_type::US:
            return packed_element<Uint16>(tag, vr, element,
                [](DcmElement& e, Uint16& v, unsigned long i) { return e.getUint16(v, i); });
        case vr_type::SS:
            return packed_element<Sint16>(tag, vr, element,
                [](DcmElement& e, Sint16& v, unsigned long i) { return e.getSint16(v, i); });
        case vr_type::UL:
            return packed_element<Uint32>(tag, vr, element,
                [](DcmElement& e, Uint32& v, unsigned long i) { return e.getUint32(v, i); });
        case vr_type::SL:
            return packed_element<Sint32>(tag, vr, element,
                [](DcmElement& e, Sint32& v, unsigned long i) { return e.getSint32(v, i); });
        case vr_type::UV:
            return packed_element<Uint64>(tag, vr, element,
                [](DcmElement& e, Uint64& v, unsigned long i) { return e.getUint64(v, i); });
        case vr_type::SV:
            return packed_element<Sint64>(tag, vr, element,
                [](DcmElement& e, Sint64& v, unsigned long i) { return e.getSint64(v, i); });
        case vr_type::FL:
            return packed_element<Float32>(tag, vr, element,
                [](DcmElement& e, Float32& v, unsigned long i) { return e.getFloat32(v, i); });
        case vr_type::FD:
            return packed_element<Float64>(tag, vr, element,
                [](DcmElement& e, Float64& v, unsigned long i) { return e.getFloat64(v, i); });
        case vr_type::AT:
            return attribute_tag_element(tag, element);
        default:
            break;
    }

    if (encoding::is_string_vr(vr)) {
        return string_element(tag, vr, element);
    }
    return ok(core::dicom_element::deferred(tag, vr, element.getLength()));
}

auto decode_file(const std::filesystem::path& path, const decode_options& options)
    -> Result<core::dicom_dataset> {
    return dcmtk_decoder{options}.decode_file(path);
}

}  // namespace metaview::integration
