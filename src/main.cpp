#include "lexer.hpp"
#include "parser.hpp"
#include "layout.hpp"
#include "element.hpp"
#include "printer.hpp"
#include "errors.hpp"
#include <charconv>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <argparse/argparse.hpp>

using namespace bitwise;

std::string read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const std::string& filename, const std::vector<uint8_t>& bytes) {
    std::ofstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw std::runtime_error("Failed writing " + filename);
    }
}

// Decimal, 0x hex, optionally negative. nullopt when text is not a number.
std::optional<std::int64_t> parse_integer(std::string_view text) {
    bool negative = false;
    if (text.starts_with("-")) {
        negative = true;
        text.remove_prefix(1);
    }
    int base = 10;
    if (text.starts_with("0x") || text.starts_with("0X")) {
        base = 16;
        text.remove_prefix(2);
    }
    if (text.empty()) return std::nullopt;

    std::int64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return negative ? -value : value;
}

// PATH=VALUE where VALUE is an integer, a [a,b,c] list, or text ("quoted" or bare).
// Text shorter than a char array is padded with spaces.
void apply_assignment(Element& root, const std::string& assignment) {
    const size_t eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error("Expected PATH=VALUE, got '" + assignment + "'");
    }
    Element target = root.path(assignment.substr(0, eq));
    std::string value = assignment.substr(eq + 1);

    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        std::vector<std::int64_t> values;
        std::stringstream items(value.substr(1, value.size() - 2));
        std::string item;
        while (std::getline(items, item, ',')) {
            const auto first = item.find_first_not_of(' ');
            const auto last = item.find_last_not_of(' ');
            const auto number = first == std::string::npos ? std::nullopt : parse_integer(std::string_view(item).substr(first, last - first + 1));
            if (!number) {
                throw std::runtime_error("Invalid list element '" + item + "' in " + assignment);
            }
            values.push_back(*number);
        }
        target.assign(values);
        return;
    }

    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    } else if (auto number = parse_integer(value)) {
        target.assign(*number);
        return;
    }

    if (target.kind() == NodeKind::Array)
        target.assign(value, ' ');
    else
        target.assign(std::string_view(value));
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("bitwise", "0.1.0", argparse::default_arguments::all);

    program.add_argument("schema")
        .help("The layout schema to compile")
        .required();

    program.add_argument("image")
        .help("Memory image to read (default: a blank image)")
        .nargs(argparse::nargs_pattern::optional);

    program.add_argument("-o", "--output")
        .help("Write the (modified) image to this file")
        .default_value(std::string(""));

    program.add_argument("--size")
        .help("Size in bytes of the blank image used when no IMAGE is given (default: the layout size)")
        .scan<'i', int>();

    program.add_argument("--fill")
        .help("Byte value of the blank image")
        .default_value(0)
        .scan<'i', int>();

    program.add_argument("--expect-size")
        .help("Fail when the layout reaches past the end of the image")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--emit-tokens")
        .help("Emit the tokens to stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--emit-layout")
        .help("Emit the resolved layout to stdout")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--dump")
        .help("Print every field of the image")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--get")
        .help("Print one field, e.g. --get channels[3].name")
        .default_value(std::vector<std::string>{})
        .append();

    program.add_argument("--set")
        .help("Assign one field, e.g. --set settings.squelch=3")
        .default_value(std::vector<std::string>{})
        .append();

    program.add_argument("-v", "--verbose")
        .help("Print debug diagnostics such as #printoffset")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const std::string schema_file = program.get<std::string>("schema");
    const auto image_file = program.present("image");
    const std::string output = program.get<std::string>("--output");
    const int fill = program.get<int>("--fill");

    if (fill < 0 || fill > 0xFF) {
        std::cerr << "Error: --fill must be a byte value\n";
        return 1;
    }

    try {
        // The schema text must stay in scope while its tokens are alive
        const std::string schema_text = read_file(schema_file);

        if (program.get<bool>("--emit-tokens")) {
            Lexer lexer(schema_text);
            printTokens(std::cout, lexer.tokenize());
        }

        const CompiledSchema schema = compile(schema_text);

        std::optional<BackingStore> store;
        if (image_file) {
            const std::string image = read_file(*image_file);
            store = BackingStore::load(std::vector<uint8_t>(image.begin(), image.end()));
        } else if (auto size = program.present<int>("--size")) {
            if (*size < 0) throw std::runtime_error("--size must not be negative");
            store.emplace(static_cast<size_t>(*size), static_cast<uint8_t>(fill));
        }

        ResolveOptions options;
        options.log = &std::cerr;
        options.verbose = program.get<bool>("--verbose");
        if (program.get<bool>("--expect-size")) {
            if (!store) throw std::runtime_error("--expect-size needs an IMAGE or --size");
            options.expectedSize = store->size();
        }

        const ResolvedLayout layout = resolve(schema, options);
        if (program.get<bool>("--emit-layout")) {
            printLayout(std::cout, layout);
        }

        if (!store) {
            store.emplace(layout.size(), static_cast<uint8_t>(fill));
        }
        Element root = bind(layout, *store);

        for (const auto& assignment : program.get<std::vector<std::string>>("--set")) {
            apply_assignment(root, assignment);
        }

        for (const auto& path : program.get<std::vector<std::string>>("--get")) {
            printValues(std::cout, root.path(path));
        }

        if (program.get<bool>("--dump")) {
            printValues(std::cout, root);
        }

        if (!output.empty()) {
            write_file(output, store->dump());
            if (options.verbose)
                std::cerr << "[debug] Wrote " << store->size() << " bytes to " << output << "\n";
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
