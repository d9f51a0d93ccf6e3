#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "src/diag/diagnostic.hpp"
#include "src/ir/helper.hpp"
#include "src/ir/pretty_print/pretty_print.hpp"
#include "src/ir/reader/reader.hpp"
#include "src/pipeline/pipeline.hpp"
#include "src/span/dump_registry.hpp"
#include "src/utils/error.hpp"

namespace {

struct DriverArgs {
    pipeline::PipelineOptions options;
    std::string input;
    std::string output;
    bool list_passes = false;
    bool compact = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--disable=a,b] [--tie-break=a,b] [--trace] [--verify] [--compact] [-o <file>] <input.ir>\n"
              << "       " << program << " --list-passes" << std::endl;
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto item = text.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        if (!item.empty()) {
            items.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

DriverArgs parse_args(int argc, char* argv[]) {
    DriverArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.rfind("--disable=", 0) == 0) {
            for (auto& name : split_list(arg.substr(10))) {
                args.options.disabled_passes.insert(std::move(name));
            }
        } else if (arg.rfind("--tie-break=", 0) == 0) {
            args.options.tie_break_names = split_list(arg.substr(12));
        } else if (arg == "--trace") {
            args.options.trace = true;
        } else if (arg == "--verify") {
            args.options.verify = true;
        } else if (arg == "--list-passes") {
            args.list_passes = true;
        } else if (arg == "--compact") {
            args.compact = true;
        } else if (arg == "-o") {
            if (i + 1 >= argc) {
                error_helper::report_config_error("-o expects a file name");
            }
            args.output = argv[++i];
        } else if (!arg.empty() && arg.front() == '-') {
            error_helper::report_config_error("Unknown option '" + std::string(arg) + "'");
        } else if (args.input.empty()) {
            args.input = std::string(arg);
        } else {
            error_helper::report_config_error("More than one input file given");
        }
    }
    return args;
}

void print_reader_error(const ReaderError& error, const span::DumpRegistry& dumps) {
    std::cerr << "Error: " << error.what() << std::endl;
    auto error_span = error.span();
    if (!error_span.is_valid()) {
        std::cerr << " (no location information)" << std::endl;
        return;
    }
    std::cerr << "--> " << dumps.describe(error_span) << std::endl;
    auto excerpt = dumps.excerpt(error_span);
    if (!excerpt.empty()) {
        std::cerr << excerpt << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    span::DumpRegistry dumps;

    try {
        auto args = parse_args(argc, argv);
        auto pipeline = pipeline::default_pipeline(args.options);

        if (args.list_passes) {
            for (const auto& info : pipeline.passes()) {
                std::cout << info.name << " (" << pass::to_string(info.tier) << ")"
                          << (pipeline.enabled(info.name) ? "" : " [disabled]") << std::endl;
            }
            return 0;
        }
        if (args.input.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        std::ifstream file_stream(args.input);
        if (!file_stream) {
            std::cerr << "Error: could not open file " << args.input << std::endl;
            return 1;
        }
        std::stringstream code_stream;
        code_stream << file_stream.rdbuf();

        auto dump = dumps.add(args.input, code_stream.str());
        auto items = ir::reader::read_items(dumps.text(dump), dump);
        auto unit = items.size() == 1 ? items.front() : ir::helper::from_statements(items);

        diag::StreamSink sink(std::cerr, &dumps);
        auto result = pipeline.run(unit, sink);

        std::string text = items.size() == 1 ? ir::to_string(result, args.compact)
                                             : ir::to_string(ir::helper::statements_of(result), args.compact);
        if (args.output.empty()) {
            std::cout << text << std::endl;
        } else {
            std::ofstream out(args.output);
            if (!out) {
                std::cerr << "Error: could not write file " << args.output << std::endl;
                return 1;
            }
            out << text << std::endl;
        }
        return 0;

    } catch (const ReaderError& e) {
        print_reader_error(e, dumps);
        return 1;
    } catch (const PipelineConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
