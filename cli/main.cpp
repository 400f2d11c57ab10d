#include "markdown_strings.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace markdown_strings_cpp;

static void usage(char const* prog) {
    std::cerr << "Usage: " << prog << " [--file <path>] [--context <name>] [--code-block] [--quote] [--heading <n>]\n"
              << "Reads text from stdin or --file and writes escaped Markdown to stdout.\n"
              << "Options:\n"
              << "  --file <path>       Read text from file instead of stdin\n"
              << "  --context <name>    Escaping context: plain, url, table-cell, list-item, code\n"
              << "  --code-block        Wrap the text in a fenced code block\n"
              << "  --language <lang>   Info string of the code block\n"
              << "  --quote             Render the text as a blockquote\n"
              << "  --heading <1-6>     Render the text as a heading\n"
              << "  --safe-mode         Reject unescaped output\n"
              << "  --raw               Do not escape the text\n"
              << "  --help              Show this help\n";
}

static std::string read_all(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static bool parse_context(std::string const& name, EscapeContext& context) {
    if (name == "plain") context = EscapeContext::Plain;
    else if (name == "url") context = EscapeContext::Url;
    else if (name == "table-cell") context = EscapeContext::TableCell;
    else if (name == "list-item") context = EscapeContext::ListItem;
    else if (name == "code") context = EscapeContext::Code;
    else return false;
    return true;
}

enum class Mode { Escape, CodeBlock, Quote, Heading };

int main(int argc, char** argv) {
    std::string filePath;
    std::string language;
    EscapeContext context = EscapeContext::Plain;
    Mode mode = Mode::Escape;
    int level = 1;
    bool raw = false;
    MarkdownOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (arg == "--file" && i + 1 < argc) {
            filePath = argv[++i];
        } else if (arg == "--context" && i + 1 < argc) {
            if (!parse_context(argv[++i], context)) {
                usage(argv[0]);
                return 1;
            }
        } else if (arg == "--code-block") {
            mode = Mode::CodeBlock;
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--quote") {
            mode = Mode::Quote;
        } else if (arg == "--heading" && i + 1 < argc) {
            mode = Mode::Heading;
            level = std::atoi(argv[++i]);
        } else if (arg == "--safe-mode") {
            opts.safeMode = true;
        } else if (arg == "--raw") {
            raw = true;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    std::string input;
    if (!filePath.empty()) {
        std::ifstream f(filePath);
        if (!f) {
            std::cerr << "Failed to open " << filePath << "\n";
            return 1;
        }
        input = read_all(f);
    } else {
        input = read_all(std::cin);
    }
    input = trimTrailingNewlines(input);

    try {
        MarkdownBuilder md(opts);
        std::string output;
        switch (mode) {
            case Mode::CodeBlock:
                output = md.codeBlock(input, language, !raw).text();
                break;
            case Mode::Quote:
                output = md.blockquote(input, !raw).text();
                break;
            case Mode::Heading:
                output = md.heading(level, input, !raw).text();
                break;
            case Mode::Escape:
                output = raw ? md.text(input, false).text() : escapeText(input, context);
                break;
        }
        std::cout << trimTrailingNewlines(output) << "\n";
    } catch (MarkdownError const& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
