// markdown_strings.cpp/example/main.cpp
#include "markdown_strings.h"

#include <functional>
#include <iostream>
#include <string>

using namespace markdown_strings_cpp;

namespace {

Node releaseNotes(MarkdownBuilder const& md) {
    return md.document({
        md.h1("Release notes for v2.0_rc1"),
        md.paragraph({"Fixed ", md.bold("*many*"), " bugs.", md.lineBreak(), "Details below."}),
        md.bulletList({
            "Escaping of [brackets] & <angles>",
            md.italic({"Tables with ", md.code("a|b"), " cells"}),
            {"nested under the previous item", md.referenceLink("see the tracker", "issues")},
        }),
        md.checklist({"write docs", "ship it"}, std::vector<bool>{true, false}),
        md.table({"Option", "Values"},
                 {{"bulletListMarker", "- * +"}, {md.link("hr", "https://spec.commonmark.org/"), "--- *** ___"}},
                 {"left", "center"}),
        md.blockquote({"Quoted with an ", md.image("image", "https://example.com/a (b).png")}),
        md.codeBlock("int main() {\n    return 0;\n}", "cpp"),
        md.horizontalRule(),
        md.linkReference("issues", "https://example.com/issues"),
    });
}

} // namespace

int main() {
    MarkdownBuilder md;
    MarkdownOptions defaults = md.options();

    auto demo = [&](std::string const& title, std::function<void(MarkdownOptions&)> configure) {
        md.configureOptions([&](MarkdownOptions& opts) {
            opts = defaults;
            configure(opts);
        });
        std::cout << title << "\n" << releaseNotes(md).text() << "\n\n";
    };

    demo("**Defaults**", [](MarkdownOptions&) {});

    demo("**HR Option: * * ***", [](MarkdownOptions& opts) {
        opts.hr = "* * *";
    });

    demo("**Bullet List Marker: +**", [](MarkdownOptions& opts) {
        opts.bulletListMarker = "+";
    });

    demo("**Em/Strong Delimiters: _ and __**", [](MarkdownOptions& opts) {
        opts.emDelimiter = "_";
        opts.strongDelimiter = "__";
    });

    Node unescaped = md.paragraph({"Trusted ", md.text("<kbd>Ctrl</kbd>", false)});
    std::cout << "**Unescaped fragment**\n" << unescaped.text() << "escaped: " << std::boolalpha
              << unescaped.escaped() << "\n\n";

    setSafeMode(true);
    try {
        paragraph("<kbd>Ctrl</kbd>", false);
    } catch (SafeModeError const& e) {
        std::cout << "**Safe mode**\n" << e.what() << "\n";
    }
    setSafeMode(false);

    return 0;
}
