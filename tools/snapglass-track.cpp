// snapglass-track: Follow records or texels of a resource across a sequence
// of binary dumps, one dump per observation point, and report the initial
// state of each instance plus every change after it

#include <snapglass/snapglass.hpp>

#include <fmt/format.h>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Command-line interface
// ============================================================================

enum class OutputFormat {
    Text,
    Json,
    JsonPretty
};

struct Options {
    std::vector<std::string> files;
    std::string output_file;
    std::string name;
    std::string layout;
    std::string texture;
    uint32_t stride = 0;
    uint64_t record_size = 0;
    std::vector<uint64_t> indices;
    std::vector<snapglass::TexelCoord> texels;
    OutputFormat format = OutputFormat::Text;
    snapglass::Config config;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [OPTIONS] <dump> [dump...]\n"
              << "\n"
              << "Track changes of a resource across an ordered sequence of dumps.\n"
              << "Each dump is one observation point, numbered from 0.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -l, --layout <spec>     Record layout, e.g. 'pos:float[3],id:uint@12'\n"
              << "  -s, --stride <bytes>    Record stride (default: from layout)\n"
              << "  -i, --index <n[,n...]>  Record index to track (repeatable, default: 0)\n"
              << "  -b, --bytes <count>     Bytes per instance in byte mode (default: 65536)\n"
              << "  -t, --texture <desc>    Track texels: WxH[xD][:channels[:type[:mips[:slices]]]]\n"
              << "  -p, --texel <coord>     Texel x,y[,z[,mip[,slice]]] (repeatable, default: 0,0)\n"
              << "  -n, --name <name>       Resource name used in the report\n"
              << "  -o, --output <file>     Write to file instead of stdout\n"
              << "  -f, --format <fmt>      Output format: text, json, json-pretty\n"
              << "  -v, --verbose           Log progress to stderr\n"
              << "\n"
              << "Without --layout or --texture, raw bytes are compared and changes are\n"
              << "reported as byte regions.\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " -l 'v:float[3]' -i 0 -i 5 frame_*.bin\n"
              << "  " << prog << " -t 64x64:4:ubyte -p 10,12 -f json-pretty rt_*.bin\n"
              << "  " << prog << " -b 256 a.bin b.bin c.bin\n";
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

// Split on `sep` and parse every part as an unsigned number
bool parse_uint_list(std::string_view text, char sep, std::vector<uint64_t>& out) {
    while (true) {
        size_t pos = text.find(sep);
        uint64_t value = 0;
        if (!parse_uint(text.substr(0, pos), value)) {
            return false;
        }
        out.push_back(value);
        if (pos == std::string_view::npos) {
            return true;
        }
        text.remove_prefix(pos + 1);
    }
}

std::optional<snapglass::TexelCoord> parse_texel(std::string_view text) {
    std::vector<uint64_t> parts;
    if (!parse_uint_list(text, ',', parts) || parts.size() < 2 || parts.size() > 5) {
        return std::nullopt;
    }
    parts.resize(5, 0);

    snapglass::TexelCoord coord;
    coord.x = static_cast<uint32_t>(parts[0]);
    coord.y = static_cast<uint32_t>(parts[1]);
    coord.z = static_cast<uint32_t>(parts[2]);
    coord.mip = static_cast<uint32_t>(parts[3]);
    coord.slice = static_cast<uint32_t>(parts[4]);
    return coord;
}

std::optional<snapglass::TextureDesc> parse_texture(std::string_view text) {
    snapglass::TextureDesc desc;

    size_t colon = text.find(':');
    std::vector<uint64_t> dims;
    if (!parse_uint_list(text.substr(0, colon), 'x', dims) || dims.size() < 2 || dims.size() > 3) {
        return std::nullopt;
    }
    desc.width = static_cast<uint32_t>(dims[0]);
    desc.height = static_cast<uint32_t>(dims[1]);
    desc.depth = dims.size() > 2 ? static_cast<uint32_t>(dims[2]) : 1;

    // Optional fields: channels, type, mips, slices
    std::vector<std::string_view> rest;
    while (colon != std::string_view::npos) {
        text.remove_prefix(colon + 1);
        colon = text.find(':');
        rest.push_back(text.substr(0, colon));
    }
    if (rest.size() > 4) {
        return std::nullopt;
    }

    uint64_t value = 0;
    if (rest.size() > 0) {
        if (!parse_uint(rest[0], value) || value < 1 || value > 4) return std::nullopt;
        desc.channels = static_cast<uint32_t>(value);
    }
    if (rest.size() > 1) {
        auto type = snapglass::parse_scalar_type(rest[1]);
        if (!type) return std::nullopt;
        desc.channel_type = *type;
    }
    if (rest.size() > 2) {
        if (!parse_uint(rest[2], value) || value == 0) return std::nullopt;
        desc.mips = static_cast<uint32_t>(value);
    }
    if (rest.size() > 3) {
        if (!parse_uint(rest[3], value) || value == 0) return std::nullopt;
        desc.array_size = static_cast<uint32_t>(value);
    }
    return desc;
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto need_value = [&](const char* what) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires " << what << "\n";
                opts.help = true;
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        else if (arg == "-l" || arg == "--layout") {
            if (!need_value("a layout")) return opts;
            opts.layout = argv[++i];
        }
        else if (arg == "-s" || arg == "--stride") {
            uint64_t value = 0;
            if (!need_value("a number")) return opts;
            if (!parse_uint(argv[++i], value) || value == 0) {
                std::cerr << "Error: invalid stride '" << argv[i] << "'\n";
                opts.help = true;
                return opts;
            }
            opts.stride = static_cast<uint32_t>(value);
        }
        else if (arg == "-b" || arg == "--bytes") {
            if (!need_value("a number")) return opts;
            if (!parse_uint(argv[++i], opts.record_size) || opts.record_size == 0) {
                std::cerr << "Error: invalid byte count '" << argv[i] << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "-i" || arg == "--index") {
            if (!need_value("an index")) return opts;
            if (!parse_uint_list(argv[++i], ',', opts.indices)) {
                std::cerr << "Error: invalid index list '" << argv[i] << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "-t" || arg == "--texture") {
            if (!need_value("a texture description")) return opts;
            opts.texture = argv[++i];
        }
        else if (arg == "-p" || arg == "--texel") {
            if (!need_value("a coordinate")) return opts;
            auto coord = parse_texel(argv[++i]);
            if (!coord) {
                std::cerr << "Error: invalid texel '" << argv[i] << "'\n";
                opts.help = true;
                return opts;
            }
            opts.texels.push_back(*coord);
        }
        else if (arg == "-n" || arg == "--name") {
            if (!need_value("a name")) return opts;
            opts.name = argv[++i];
        }
        else if (arg == "-o" || arg == "--output") {
            if (!need_value("a filename")) return opts;
            opts.output_file = argv[++i];
        }
        else if (arg == "-f" || arg == "--format") {
            if (!need_value("a format")) return opts;
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
        else {
            opts.files.push_back(arg);
        }
    }

    return opts;
}

int run_track(const Options& opts) {
    std::optional<snapglass::TypeNode> schema;
    std::vector<snapglass::TrackedInstance> instances;

    if (!opts.texture.empty()) {
        auto desc = parse_texture(opts.texture);
        if (!desc) {
            std::cerr << "Error: invalid texture description '" << opts.texture << "'\n";
            return 1;
        }
        schema = snapglass::texel_schema(*desc);

        std::vector<snapglass::TexelCoord> coords = opts.texels;
        if (coords.empty()) {
            coords.push_back(snapglass::TexelCoord{});
        }
        for (const auto& coord : coords) {
            instances.push_back(snapglass::texel_instance(*desc, coord));
        }
    } else if (!opts.layout.empty()) {
        snapglass::Error err = snapglass::Error::None;
        schema = snapglass::parse_layout_spec(opts.layout, opts.stride, &err);
        if (!schema) {
            std::cerr << "Error: " << snapglass::to_string(err) << ": '" << opts.layout << "'\n";
            return 1;
        }
    }

    std::optional<snapglass::Layout> layout;
    if (schema) {
        layout = snapglass::flatten(*schema);
        if (layout->empty()) {
            std::cerr << "Error: " << snapglass::to_string(snapglass::Error::NoScalarFields) << "\n";
            return 1;
        }
    }

    if (instances.empty()) {
        std::vector<uint64_t> indices = opts.indices;
        if (indices.empty()) {
            indices.push_back(0);
        }
        uint32_t stride = layout ? layout->stride : opts.stride;
        if (stride == 0 && (indices.size() > 1 || indices[0] != 0)) {
            std::cerr << "Error: tracking record indices without a layout requires --stride\n";
            return 1;
        }
        instances = snapglass::buffer_instances(indices, stride);
    }

    uint64_t record_size = opts.record_size;
    if (!layout && record_size == 0 && opts.stride != 0) {
        record_size = opts.stride;
    }

    if (opts.verbose) {
        if (layout) {
            std::cerr << fmt::format("Layout: {} fields, stride {} bytes\n",
                                     layout->fields.size(), layout->stride);
        } else {
            std::cerr << "No layout, comparing raw bytes\n";
        }
        std::cerr << fmt::format("Tracking {} instances over {} dumps\n",
                                 instances.size(), opts.files.size());
    }

    snapglass::DumpSequenceSource source(opts.files, opts.name.empty() ? opts.files.front() : opts.name);

    snapglass::ProgressFn progress;
    if (opts.verbose) {
        progress = [&](uint64_t point, size_t pos, size_t total) {
            std::cerr << fmt::format("  [{}/{}] point {}: {}\n", pos + 1, total, point,
                                     opts.files[static_cast<size_t>(point)]);
        };
    }

    auto report = snapglass::track_timeline(source, 0, std::move(instances),
                                            layout ? &*layout : nullptr, record_size,
                                            opts.config, progress);
    if (schema) {
        report.schema = snapglass::describe_schema(*schema);
    }

    if (report.points_visited < opts.files.size()) {
        std::cerr << fmt::format("Warning: {} of {} dumps could not be read\n",
                                 opts.files.size() - report.points_visited, opts.files.size());
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

    switch (opts.format) {
        case OutputFormat::Text:
            snapglass::write_timeline_text(*out, report);
            break;
        case OutputFormat::Json:
            snapglass::write_timeline_json(*out, report, false);
            break;
        case OutputFormat::JsonPretty:
            snapglass::write_timeline_json(*out, report, true);
            break;
    }
    out->flush();

    if (opts.verbose) {
        std::cerr << fmt::format("\nObserved {} of {} instances with {} total changes\n",
                                 report.instances.size(), report.tracked.size(),
                                 report.total_changes);
    }

    return 0;
}

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    if (opts.help) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.files.empty()) {
        std::cerr << "Error: at least one dump file required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    return run_track(opts);
}
