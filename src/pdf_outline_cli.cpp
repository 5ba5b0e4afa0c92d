#include <pdf_outline/outline_extractor.h>
#include <pdf_outline/json_serializer.h>
#include <pdf_outline/text_extractor.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <getopt.h>

namespace fs = std::filesystem;
using namespace pdf_outline;

struct CLIOptions {
    std::string input_path;
    std::string output_path;
    std::string dump_spans_path;
    bool spans_input = false;
    bool pretty = false;
    bool diagnostics = false;
    bool quiet = false;
    bool help = false;
    bool version = false;
    OutlineOptions outline;
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] <input.pdf|input_dir|spans.json>\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -o, --output PATH          Output JSON file, or directory for directory input\n";
    std::cout << "                             (default: output/<name>_structure.json)\n";
    std::cout << "  --spans                    Input is a span dump JSON instead of a PDF\n";
    std::cout << "  --dump-spans PATH          Write the extracted spans as JSON\n";
    std::cout << "  --page-limit N             Process only the first N pages (default: 50)\n";
    std::cout << "  --time-limit-ms N          Wall-clock budget per document (default: 10000)\n";
    std::cout << "  --memory-mb N              Working memory budget (default: 200)\n";
    std::cout << "  --threads N                Threads for page decoding (default: 1)\n";
    std::cout << "  --pretty                   Indent the JSON output\n";
    std::cout << "  --diagnostics              Add partial flag, warnings and stats to the output\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -q, --quiet                Quiet mode (minimal output)\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  PDF_OUTLINE_PAGE_LIMIT, PDF_OUTLINE_TIME_LIMIT_MS, PDF_OUTLINE_MEMORY_MB,\n";
    std::cout << "  PDF_OUTLINE_VERBOSE (flags take precedence)\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " report.pdf\n";
    std::cout << "  " << program_name << " -o outlines/ --threads 4 papers/\n";
    std::cout << "  " << program_name << " --spans --pretty dump.json\n";
}

void print_version() {
    std::cout << "pdf_outline_cli version 1.0.0\n";
    std::cout << "Built with C++17, MuPDF and ICU\n";
}

int parse_non_negative(const std::string& value, const char* name) {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size() || parsed < 0) {
        throw std::invalid_argument(std::string(name) + " must be a non-negative integer");
    }
    return parsed;
}

void apply_environment(OutlineOptions& options) {
    if (const char* value = std::getenv("PDF_OUTLINE_PAGE_LIMIT")) {
        options.page_limit = parse_non_negative(value, "PDF_OUTLINE_PAGE_LIMIT");
    }
    if (const char* value = std::getenv("PDF_OUTLINE_TIME_LIMIT_MS")) {
        options.time_limit = std::chrono::milliseconds(parse_non_negative(value, "PDF_OUTLINE_TIME_LIMIT_MS"));
    }
    if (const char* value = std::getenv("PDF_OUTLINE_MEMORY_MB")) {
        options.memory_limit_mb = parse_non_negative(value, "PDF_OUTLINE_MEMORY_MB");
    }
    if (const char* value = std::getenv("PDF_OUTLINE_VERBOSE")) {
        std::string flag(value);
        options.verbose = !flag.empty() && flag != "0" && flag != "false";
    }
}

CLIOptions parse_arguments(int argc, char* argv[]) {
    CLIOptions options;
    apply_environment(options.outline);

    const char* short_opts = "o:vqh";
    const struct option long_opts[] = {
        {"output", required_argument, nullptr, 'o'},
        {"spans", no_argument, nullptr, 1001},
        {"dump-spans", required_argument, nullptr, 1002},
        {"page-limit", required_argument, nullptr, 1003},
        {"time-limit-ms", required_argument, nullptr, 1004},
        {"memory-mb", required_argument, nullptr, 1005},
        {"threads", required_argument, nullptr, 1006},
        {"pretty", no_argument, nullptr, 1007},
        {"diagnostics", no_argument, nullptr, 1008},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 1009},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, &option_index)) != -1) {
        switch (opt) {
            case 'o':
                options.output_path = optarg;
                break;
            case 1001:  // spans
                options.spans_input = true;
                break;
            case 1002:  // dump-spans
                options.dump_spans_path = optarg;
                break;
            case 1003:  // page-limit
                options.outline.page_limit = parse_non_negative(optarg, "page-limit");
                break;
            case 1004:  // time-limit-ms
                options.outline.time_limit = std::chrono::milliseconds(parse_non_negative(optarg, "time-limit-ms"));
                break;
            case 1005:  // memory-mb
                options.outline.memory_limit_mb = parse_non_negative(optarg, "memory-mb");
                break;
            case 1006:  // threads
                options.outline.thread_count = std::max(1, parse_non_negative(optarg, "threads"));
                break;
            case 1007:
                options.pretty = true;
                break;
            case 1008:
                options.diagnostics = true;
                break;
            case 'v':
                options.outline.verbose = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                return options;
            case 1009:  // version
                options.version = true;
                return options;
            default:
                throw std::invalid_argument("Unknown option");
        }
    }

    if (optind < argc) {
        options.input_path = argv[optind++];
    }
    if (optind < argc) {
        throw std::invalid_argument("Only one input path may be given");
    }
    if (options.input_path.empty()) {
        throw std::invalid_argument("Input path is required");
    }
    if (options.outline.verbose && options.quiet) {
        throw std::invalid_argument("Cannot use both --verbose and --quiet");
    }

    return options;
}

std::string default_output_name(const fs::path& input) {
    return input.stem().string() + "_structure.json";
}

// A document that could not be opened at all counts as a failed input
bool document_failed(const Outline& outline) {
    if (outline.stats.pages_processed > 0) {
        return false;
    }
    return std::any_of(outline.diagnostics.begin(), outline.diagnostics.end(), [](const Diagnostic& d) {
        return d.kind == DiagnosticKind::MalformedDocument && d.page < 0;
    });
}

bool process_file(OutlineExtractor& extractor, const fs::path& input, const fs::path& output,
                  const CLIOptions& options) {
    auto start = std::chrono::steady_clock::now();
    try {
        Outline outline;
        if (options.spans_input) {
            outline = extractor.extract_pages(JsonSerializer::load_pages(input.string()));
        } else if (!options.dump_spans_path.empty()) {
            TextExtractor text_extractor(options.outline.verbose);
            ExtractOptions extract_opts;
            extract_opts.page_limit = options.outline.page_limit;
            extract_opts.thread_count = options.outline.thread_count;
            extract_opts.verbose = options.outline.verbose;
            auto pages = text_extractor.extract_all_pages(input.string(), extract_opts);

            std::ofstream dump(options.dump_spans_path);
            if (!dump) {
                throw std::runtime_error("Cannot write span dump: " + options.dump_spans_path);
            }
            dump << JsonSerializer::pages_to_json(pages).dump(2) << "\n";
            outline = extractor.extract_pages(pages);
        } else {
            outline = extractor.extract(input.string());
        }

        if (!options.quiet) {
            for (const auto& diagnostic : outline.diagnostics) {
                std::cerr << "[WARNING] " << input.string() << ": " << diagnostic.message << "\n";
            }
        }
        if (document_failed(outline)) {
            std::cerr << "[ERROR] " << input.string() << ": document could not be processed\n";
            return false;
        }

        if (output.has_parent_path() && !fs::exists(output.parent_path())) {
            fs::create_directories(output.parent_path());
        }
        std::ofstream out(output);
        if (!out) {
            throw std::runtime_error("Cannot write output file: " + output.string());
        }
        out << JsonSerializer::serialize_outline(outline, options.pretty, options.diagnostics) << "\n";
        out.close();

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (!options.quiet) {
            std::cout << "[SUCCESS] Extracted " << outline.headings.size() << " headings from "
                      << input.filename().string() << "\n";
            std::cout << "  Title: " << (outline.title.empty() ? "(none)" : outline.title) << "\n";
            std::cout << "  Output: " << output.string() << "\n";
            std::cout << "  Time: " << duration.count() << "ms"
                      << (outline.partial ? " (partial)" : "") << "\n";
        } else {
            std::cout << "SUCCESS|" << input.string() << "|" << outline.headings.size() << "|"
                      << duration.count() << "\n";
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << input.string() << ": " << e.what() << "\n";
        return false;
    }
}

std::vector<fs::path> collect_inputs(const fs::path& input_dir, bool spans_input) {
    const std::string wanted = spans_input ? ".json" : ".pdf";
    std::vector<fs::path> files;
    for (const auto& entry : fs::recursive_directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            auto ext = entry.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
            if (ext == wanted) {
                files.push_back(entry.path());
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

int main(int argc, char* argv[]) {
    try {
        CLIOptions options = parse_arguments(argc, argv);

        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (options.version) {
            print_version();
            return 0;
        }

        fs::path input(options.input_path);
        if (!fs::exists(input)) {
            throw std::runtime_error("Input path does not exist: " + options.input_path);
        }

        OutlineExtractor extractor(options.outline);

        if (fs::is_regular_file(input)) {
            fs::path output = options.output_path.empty()
                ? fs::path("output") / default_output_name(input)
                : fs::path(options.output_path);
            return process_file(extractor, input, output, options) ? 0 : 1;
        }

        if (!fs::is_directory(input)) {
            throw std::invalid_argument("Input must be a PDF file, a span dump or a directory");
        }
        if (!options.dump_spans_path.empty()) {
            throw std::invalid_argument("--dump-spans needs a single input file");
        }

        auto files = collect_inputs(input, options.spans_input);
        if (files.empty()) {
            std::cout << "No input files found in " << input.string() << std::endl;
            return 1;
        }
        if (!options.quiet) {
            std::cout << "Found " << files.size() << " files to process\n" << std::endl;
        }

        fs::path output_dir = options.output_path.empty() ? fs::path("output") : fs::path(options.output_path);
        fs::create_directories(output_dir);

        size_t success_count = 0;
        for (const auto& file : files) {
            if (process_file(extractor, file, output_dir / default_output_name(file), options)) {
                success_count++;
            }
        }

        if (!options.quiet) {
            auto stats = extractor.get_stats();
            std::cout << "\n=== Processing Complete ===\n";
            std::cout << "Successfully processed: " << success_count << "/" << files.size() << " files\n";
            std::cout << "Total pages: " << stats["pages_processed"] << "\n";
            std::cout << "Total headings: " << stats["headings_emitted"] << "\n";
            if (stats.contains("pages_per_second")) {
                std::cout << "Average pages/second: " << std::fixed << std::setprecision(1)
                          << stats["pages_per_second"].get<double>() << "\n";
            }
        }
        return success_count > 0 ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: Invalid argument - " << e.what() << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
