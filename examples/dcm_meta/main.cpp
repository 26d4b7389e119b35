/**
 * @file main.cpp
 * @brief DICOM Meta - metadata listing utility
 *
 * Prints the metadata of a DICOM file as one "tag | name | VR | value"
 * line per element, descending into sequences and eliding pixel data,
 * waveform samples and other binary payloads.
 *
 * Usage:
 *   dcm_meta <file> [options]
 *
 * Example:
 *   dcm_meta image.dcm
 *   dcm_meta image.dcm --format tree
 *   dcm_meta image.dcm --max-length 64 --omit-pixel-data
 *   dcm_meta image.dcm --meta --item-base 0
 */

#include "metaview/core/dicom_dictionary.hpp"
#include "metaview/integration/dcmtk_decoder.hpp"
#include "metaview/integration/logger_adapter.hpp"
#include "metaview/render/text_sink.hpp"
#include "metaview/render/tree_sink.hpp"
#include "metaview/render/tree_walker.hpp"
#include "metaview/render/walk_options.hpp"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

namespace {

using metaview::integration::log_level;
using metaview::integration::logger_adapter;

/**
 * @brief Output format options
 */
enum class output_format { text, tree };

/**
 * @brief Command line options
 */
struct options {
    std::filesystem::path path;
    output_format format{output_format::text};
    metaview::render::walk_options walk;
    metaview::integration::decode_options decode;
    std::optional<log_level> level;
    std::filesystem::path log_directory;
    bool verbose{false};
    bool quiet{false};
};

/**
 * @brief Print usage information
 * @param program_name The name of the executable
 */
void print_usage(const char* program_name) {
    std::cout << R"(
DICOM Meta - Metadata Listing Utility

Usage: )" << program_name
              << R"( <file> [options]

Arguments:
  file                    DICOM file to list

Options:
  -h, --help              Show this help message
  -v, --verbose           Log progress to the console and print a summary
  -q, --quiet             Log errors only
  -f, --format <format>   Output format: text (default), tree
  --max-length <n>        Truncate values after n characters (default: 128)
  --max-depth <n>         Reject sequence nesting deeper than n (default: 256)
  --indent <n>            Spaces per nesting level (default: 2)
  --item-base <0|1>       Number of the first sequence item (default: 1)
  --omit-pixel-data       Leave out Pixel Data and Waveform Data rows
  --meta                  Include File Meta Information (0002,xxxx)
  --log-level <level>     trace, debug, info, warn, error, fatal, off
  --log-file <dir>        Also write the log to <dir>/metaview.log

Output Format:
  Each element is printed as
    (GGGG,EEEE) | Name | VR | Value
  Sequence items are printed as [Item N] and their elements are indented
  one more level. Binary values are shown as <binary, N bytes>.

Exit Codes:
  0  Success
  1  Error - Invalid arguments
  2  Error - File not found, invalid DICOM file or malformed dataset
)";
}

/**
 * @brief Parse a non-negative decimal number
 */
template <typename T>
auto parse_number(const char* text, T& value) -> bool {
    const char* end = text + std::strlen(text);
    const auto [ptr, ec] = std::from_chars(text, end, value);
    return ec == std::errc{} && ptr == end;
}

/**
 * @brief Parse command line arguments
 * @return true if the arguments are valid and the program should run
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if ((arg == "--format" || arg == "-f") && i + 1 < argc) {
            std::string fmt = argv[++i];
            if (fmt == "text") {
                opts.format = output_format::text;
            } else if (fmt == "tree") {
                opts.format = output_format::tree;
            } else {
                std::cerr << "Error: Unknown format '" << fmt << "'. Use: text, tree\n";
                return false;
            }
        } else if (arg == "--max-length" && i + 1 < argc) {
            if (!parse_number(argv[++i], opts.walk.max_display_length)) {
                std::cerr << "Error: Invalid max length value\n";
                return false;
            }
        } else if (arg == "--max-depth" && i + 1 < argc) {
            if (!parse_number(argv[++i], opts.walk.max_depth)) {
                std::cerr << "Error: Invalid max depth value\n";
                return false;
            }
            opts.decode.max_depth = opts.walk.max_depth;
        } else if (arg == "--indent" && i + 1 < argc) {
            if (!parse_number(argv[++i], opts.walk.indent_width)) {
                std::cerr << "Error: Invalid indent value\n";
                return false;
            }
        } else if (arg == "--item-base" && i + 1 < argc) {
            if (!parse_number(argv[++i], opts.walk.item_index_base)) {
                std::cerr << "Error: Invalid item base value\n";
                return false;
            }
        } else if (arg == "--omit-pixel-data") {
            opts.walk.omit_excluded_tags = true;
        } else if (arg == "--meta") {
            opts.decode.include_meta_info = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string name = argv[++i];
            opts.level = logger_adapter::parse_log_level(name);
            if (!opts.level) {
                std::cerr << "Error: Unknown log level '" << name << "'\n";
                return false;
            }
        } else if (arg == "--log-file" && i + 1 < argc) {
            opts.log_directory = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            std::cerr << "Error: Only one file can be listed\n";
            return false;
        }
    }

    if (opts.path.empty()) {
        std::cerr << "Error: No file specified\n";
        return false;
    }

    if (opts.verbose && opts.quiet) {
        std::cerr << "Error: --verbose and --quiet are mutually exclusive\n";
        return false;
    }

    if (auto valid = opts.walk.validate(); valid.is_err()) {
        std::cerr << "Error: " << valid.error().message << "\n";
        return false;
    }

    return true;
}

/**
 * @brief Start logging when the options ask for it
 *
 * The listing goes to stdout, so console logging is only enabled in
 * verbose mode.
 */
void setup_logging(const options& opts) {
    metaview::integration::logger_config config;
    config.enable_console = opts.verbose;
    config.enable_file = !opts.log_directory.empty();
    if (config.enable_file) {
        config.log_directory = opts.log_directory;
    }

    if (opts.level) {
        config.min_level = *opts.level;
    } else if (opts.verbose) {
        config.min_level = log_level::debug;
    } else if (opts.quiet) {
        config.min_level = log_level::error;
    } else {
        config.min_level = log_level::warn;
    }

    if (!config.enable_console && !config.enable_file) {
        return;
    }
    logger_adapter::initialize(config);
}

/**
 * @brief Decode and list one file
 * @return Process exit code
 */
int list_file(const options& opts) {
    logger_adapter::debug("Listing {} (format={}, max_length={}, max_depth={})",
                          opts.path.string(),
                          opts.format == output_format::tree ? "tree" : "text",
                          opts.walk.max_display_length, opts.walk.max_depth);

    auto decoded = metaview::integration::decode_file(opts.path, opts.decode);
    if (decoded.is_err()) {
        std::cerr << "Error: " << decoded.error().message << "\n";
        return 2;
    }

    metaview::render::tree_walker walker{metaview::core::dictionary_name_resolver(),
                                         opts.walk};

    if (opts.format == output_format::tree) {
        metaview::render::tree_sink sink;
        if (auto result = walker.walk(decoded.value(), sink); result.is_err()) {
            std::cerr << "Error: " << result.error().message << "\n";
            return 2;
        }
        sink.render_tree(std::cout);
    } else {
        metaview::render::text_sink sink{std::cout, opts.walk.indent_width};
        if (auto result = walker.walk(decoded.value(), sink); result.is_err()) {
            std::cerr << "Error: " << result.error().message << "\n";
            return 2;
        }
    }

    if (opts.verbose) {
        const auto& stats = walker.last_stats();
        std::cerr << "\n" << stats.records << " records: " << stats.sequences
                  << " sequences, " << stats.items << " items, " << stats.binary
                  << " binary, " << stats.unrenderable << " unrenderable, "
                  << stats.omitted << " omitted\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    setup_logging(opts);
    const int exit_code = list_file(opts);
    logger_adapter::shutdown();
    return exit_code;
}
