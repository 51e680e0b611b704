// snapglass-diff: Compare two binary dumps of the same resource
// Reports per-record changes when a layout is given, byte regions otherwise,
// or a word/byte breakdown on request

#include <snapglass/snapglass.hpp>

#include <fmt/format.h>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Command-line interface
// ============================================================================

enum class DiffMode {
    Auto,
    Records,
    Bytes,
    Words
};

enum class OutputFormat {
    Text,
    Json,
    JsonPretty
};

struct Options {
    std::string old_file;
    std::string new_file;
    std::string output_file;
    std::string layout;
    uint32_t stride = 0;
    DiffMode mode = DiffMode::Auto;
    OutputFormat format = OutputFormat::Text;
    snapglass::Config config;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [OPTIONS] <old_dump> <new_dump>\n"
              << "\n"
              << "Compare two binary dumps of a resource.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -l, --layout <spec>     Record layout, e.g. 'pos:float[3],id:uint@12'\n"
              << "  -s, --stride <bytes>    Record stride (default: from layout)\n"
              << "  -m, --mode <mode>       auto, records, bytes, words (default: auto)\n"
              << "  -n, --max <count>       Max changed records/regions/diffs reported (default: 3)\n"
              << "  -o, --output <file>     Write to file instead of stdout\n"
              << "  -f, --format <fmt>      Output format: text, json, json-pretty\n"
              << "  -v, --verbose           Log schema details to stderr\n"
              << "\n"
              << "Modes:\n"
              << "  auto      Per-record diff if a layout is given and records differ,\n"
              << "            changed byte regions otherwise\n"
              << "  records   Per-record diff only (requires --layout)\n"
              << "  bytes     Byte counts and first differing bytes\n"
              << "  words     32-bit word diff with float reinterpretation\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " before.bin after.bin\n"
              << "  " << prog << " -l 'pos:float[4],vel:float[4]' -f json a.bin b.bin\n"
              << "  " << prog << " -m words a.bin b.bin\n";
}

bool parse_uint(std::string_view text, uint64_t& out) {
    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, base);
    return ec == std::errc() && ptr == text.data() + text.size();
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        else if (arg == "-l" || arg == "--layout") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a layout\n";
                opts.help = true;
                return opts;
            }
            opts.layout = argv[++i];
        }
        else if (arg == "-s" || arg == "--stride" || arg == "-n" || arg == "--max") {
            uint64_t value = 0;
            if (i + 1 >= argc || !parse_uint(argv[i + 1], value)) {
                std::cerr << "Error: " << arg << " requires a number\n";
                opts.help = true;
                return opts;
            }
            ++i;
            if (arg == "-s" || arg == "--stride") {
                opts.stride = static_cast<uint32_t>(value);
            } else {
                opts.config.max_changed_elements = value;
                opts.config.max_byte_regions = value;
                opts.config.max_word_diffs = value;
                opts.config.max_byte_diffs = value;
            }
        }
        else if (arg == "-m" || arg == "--mode") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a mode\n";
                opts.help = true;
                return opts;
            }
            std::string mode = argv[++i];
            if (mode == "auto") opts.mode = DiffMode::Auto;
            else if (mode == "records") opts.mode = DiffMode::Records;
            else if (mode == "bytes") opts.mode = DiffMode::Bytes;
            else if (mode == "words") opts.mode = DiffMode::Words;
            else {
                std::cerr << "Error: unknown mode '" << mode << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a filename\n";
                opts.help = true;
                return opts;
            }
            opts.output_file = argv[++i];
        }
        else if (arg == "-f" || arg == "--format") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a format\n";
                opts.help = true;
                return opts;
            }
            std::string fmt = argv[++i];
            if (fmt == "text") opts.format = OutputFormat::Text;
            else if (fmt == "json") opts.format = OutputFormat::Json;
            else if (fmt == "json-pretty") opts.format = OutputFormat::JsonPretty;
            else {
                std::cerr << "Error: unknown format '" << fmt << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        }
        else if (arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            opts.help = true;
            return opts;
        }
        else if (opts.old_file.empty()) {
            opts.old_file = arg;
        }
        else if (opts.new_file.empty()) {
            opts.new_file = arg;
        }
        else {
            std::cerr << "Error: unexpected argument '" << arg << "'\n";
            opts.help = true;
            return opts;
        }
    }

    return opts;
}

void write_value(std::ostream& out, const snapglass::Value& v, OutputFormat format) {
    snapglass::write_json(out, v, format == OutputFormat::JsonPretty);
    out << "\n";
}

int run_diff(const Options& opts) {
    auto old_data = snapglass::read_file(opts.old_file);
    if (!old_data) {
        std::cerr << "Error: cannot read '" << opts.old_file << "'\n";
        return 1;
    }
    auto new_data = snapglass::read_file(opts.new_file);
    if (!new_data) {
        std::cerr << "Error: cannot read '" << opts.new_file << "'\n";
        return 1;
    }

    std::optional<snapglass::Layout> layout;
    if (!opts.layout.empty()) {
        snapglass::Error err = snapglass::Error::None;
        auto type = snapglass::parse_layout_spec(opts.layout, opts.stride, &err);
        if (!type) {
            std::cerr << "Error: " << snapglass::to_string(err) << ": '" << opts.layout << "'\n";
            return 1;
        }
        layout = snapglass::flatten(*type);
        if (layout->empty()) {
            std::cerr << "Error: " << snapglass::to_string(snapglass::Error::NoScalarFields) << "\n";
            return 1;
        }
        if (opts.verbose) {
            std::cerr << fmt::format("Layout: {} fields, stride {} bytes\n",
                                     layout->fields.size(), layout->stride);
            for (const auto& field : layout->fields) {
                std::cerr << fmt::format("  {} @ {} ({})\n", field.name(), field.offset,
                                         snapglass::scalar_name(field.type));
            }
        }
    }

    if (opts.mode == DiffMode::Records && !layout) {
        std::cerr << "Error: records mode requires --layout\n";
        return 1;
    }

    if (opts.verbose) {
        std::cerr << fmt::format("Comparing {} ({} bytes) with {} ({} bytes)\n",
                                 opts.old_file, old_data->size(), opts.new_file, new_data->size());
    }

    // Output stream
    std::ofstream file_out;
    std::ostream* out = &std::cout;
    if (!opts.output_file.empty()) {
        file_out.open(opts.output_file);
        if (!file_out) {
            std::cerr << "Error: cannot open output file '" << opts.output_file << "'\n";
            return 1;
        }
        out = &file_out;
    }

    bool text = opts.format == OutputFormat::Text;

    switch (opts.mode) {
        case DiffMode::Bytes: {
            auto summary = snapglass::summarize_bytes(*old_data, *new_data, opts.config.max_byte_diffs);
            if (text) snapglass::write_byte_summary_text(*out, summary);
            else write_value(*out, snapglass::to_value(summary), opts.format);
            break;
        }
        case DiffMode::Words: {
            auto summary = snapglass::diff_words(*old_data, *new_data, opts.config);
            if (text) snapglass::write_word_summary_text(*out, summary);
            else write_value(*out, snapglass::to_value(summary), opts.format);
            break;
        }
        case DiffMode::Records: {
            snapglass::ResourceDelta delta;
            delta.elements = snapglass::diff_records(*layout, *old_data, *new_data,
                                                     opts.config.max_changed_elements);
            if (!delta.elements.empty()) {
                delta.kind = snapglass::ResourceDelta::Kind::Elements;
                delta.total_elements = new_data->size() / layout->stride;
            }
            if (text) snapglass::write_resource_delta_text(*out, delta);
            else write_value(*out, snapglass::to_value(delta), opts.format);
            break;
        }
        case DiffMode::Auto: {
            auto delta = snapglass::diff_resource(layout ? &*layout : nullptr,
                                                  *old_data, *new_data, opts.config);
            if (text) snapglass::write_resource_delta_text(*out, delta);
            else write_value(*out, snapglass::to_value(delta), opts.format);
            break;
        }
    }

    out->flush();
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    if (opts.help) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.old_file.empty() || opts.new_file.empty()) {
        std::cerr << "Error: two dump files required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    return run_diff(opts);
}
