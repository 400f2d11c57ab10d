// markdown_strings.cpp/test/markdown_strings_test.cpp
#include <gtest/gtest.h>

#include "markdown_strings.h"

#include <climits>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace markdown_strings_cpp;

// Free functions share the process-wide safe-mode flag; reset it around
// every test so no test observes another's setting.
class MarkdownStringsTest : public ::testing::Test {
protected:
    void SetUp() override { setSafeMode(false); }
    void TearDown() override { setSafeMode(false); }

    MarkdownBuilder md;
};

TEST_F(MarkdownStringsTest, Text) {
    Node n = text("2_000 *stars*");
    EXPECT_EQ(n.kind(), Kind::Text);
    EXPECT_EQ(n.text(), "2\\_000 \\*stars\\*");
    EXPECT_TRUE(n.escaped());
}

TEST_F(MarkdownStringsTest, Bold) {
    Node n = bold("2_000");
    EXPECT_EQ(n.kind(), Kind::Bold);
    EXPECT_EQ(n.text(), "**2\\_000**");
    EXPECT_TRUE(n.escaped());
}

TEST_F(MarkdownStringsTest, Italic) {
    EXPECT_EQ(italic("note").text(), "*note*");
}

TEST_F(MarkdownStringsTest, Strikethrough) {
    EXPECT_EQ(strikethrough("gone").text(), "~~gone~~");
}

TEST_F(MarkdownStringsTest, BoldWithItalicChild) {
    EXPECT_EQ(bold({"very ", italic("important")}).text(), "**very *important***");
}

TEST_F(MarkdownStringsTest, EmptyContent) {
    EXPECT_EQ(bold("").text(), "****");
    EXPECT_EQ(bold(Content()).text(), "****");
}

TEST_F(MarkdownStringsTest, CodeWithBackticks) {
    EXPECT_EQ(code("a `b` c").text(), "``a `b` c``");
}

TEST_F(MarkdownStringsTest, CodeIsVerbatim) {
    EXPECT_EQ(code("*x* [y]").text(), "`*x* [y]`");
    EXPECT_EQ(code("").text(), "``");
}

TEST_F(MarkdownStringsTest, CodeFoldsLineEndingsToSpaces) {
    Node p = paragraph({"see ", code("x\n\n# Injected")});
    EXPECT_EQ(p.text(), "see `x  # Injected`\n\n");
    EXPECT_EQ(p.text().find("\n#"), std::string::npos);
    EXPECT_TRUE(p.escaped());
    EXPECT_EQ(code("a\r\nb\rc").text(), "`a b c`");
}

TEST_F(MarkdownStringsTest, CodeStartingWithBacktickIsPadded) {
    EXPECT_EQ(code("`x`").text(), "`` `x` ``");
    EXPECT_EQ(code("a``").text(), "``` a`` ```");
}

TEST_F(MarkdownStringsTest, Link) {
    Node n = md.link("docs", "https://example.com/a b");
    EXPECT_EQ(n.kind(), Kind::Link);
    EXPECT_EQ(n.text(), "[docs](https://example.com/a%20b)");
}

TEST_F(MarkdownStringsTest, LinkWithFormattedText) {
    EXPECT_EQ(md.link({bold("x"), " y"}, "u").text(), "[**x** y](u)");
}

TEST_F(MarkdownStringsTest, LinkEscapesTextBrackets) {
    EXPECT_EQ(md.link("[x]", "u").text(), "[\\[x\\]](u)");
}

TEST_F(MarkdownStringsTest, LinkRejectsLinkChild) {
    EXPECT_THROW(md.link(md.link("a", "b"), "c"), InvalidNestingError);
}

TEST_F(MarkdownStringsTest, FreeLinkFunction) {
    static_assert(std::is_same_v<decltype(markdown_strings_cpp::link("a", "b")), Node>);
    EXPECT_EQ(markdown_strings_cpp::link("a", "b").text(), "[a](b)");
    EXPECT_EQ(markdown_strings_cpp::link("*a*", "b", false).text(), "[*a*](b)");
    EXPECT_EQ(markdown_strings_cpp::link(bold("a"), std::string("b")).text(), "[**a**](b)");
}

TEST_F(MarkdownStringsTest, Image) {
    Node n = image("alt *text*", "https://example.com/logo.png");
    EXPECT_EQ(n.kind(), Kind::Image);
    EXPECT_EQ(n.text(), "![alt \\*text\\*](https://example.com/logo.png)");
}

TEST_F(MarkdownStringsTest, LineBreakAndEmpty) {
    EXPECT_EQ(lineBreak().text(), "  \n");
    EXPECT_TRUE(lineBreak().escaped());
    EXPECT_EQ(empty().text(), "");
    EXPECT_EQ(empty().kind(), Kind::Empty);
}

TEST_F(MarkdownStringsTest, ReferenceLink) {
    EXPECT_EQ(referenceLink("the docs", "ref-1").text(), "[the docs][ref-1]");
    EXPECT_EQ(referenceLink("x", "ref_1").text(), "[x][ref\\_1]");
}

TEST_F(MarkdownStringsTest, Paragraph) {
    Node n = paragraph({"Fixed ", bold("2_000"), " bugs"});
    EXPECT_EQ(n.kind(), Kind::Paragraph);
    EXPECT_EQ(n.text(), "Fixed **2\\_000** bugs\n\n");
}

TEST_F(MarkdownStringsTest, ParagraphWithImageAndLineBreak) {
    EXPECT_EQ(paragraph({"a", lineBreak(), image("i", "u")}).text(), "a  \n![i](u)\n\n");
}

TEST_F(MarkdownStringsTest, ParagraphRejectsLink) {
    EXPECT_THROW(paragraph(md.link("a", "b")), InvalidNestingError);
}

TEST_F(MarkdownStringsTest, ParagraphRejectsParagraph) {
    try {
        paragraph(paragraph("inner"));
        FAIL() << "expected InvalidNestingError";
    } catch (InvalidNestingError const& e) {
        EXPECT_EQ(e.parent(), Kind::Paragraph);
        EXPECT_EQ(e.child(), Kind::Paragraph);
    }
}

TEST_F(MarkdownStringsTest, NestedSequenceIsATypeMismatch) {
    EXPECT_THROW(bold({"a", {"b"}}), TypeMismatchError);
}

TEST_F(MarkdownStringsTest, Heading) {
    EXPECT_EQ(heading(2, "Title").text(), "## Title\n\n");
    EXPECT_EQ(h1("# x").text(), "# \\# x\n\n");
    EXPECT_EQ(h6("deep").text(), "###### deep\n\n");
    EXPECT_EQ(heading(3, {"A ", code("b")}).text(), "### A `b`\n\n");
}

TEST_F(MarkdownStringsTest, HeadingLevelOutOfRange) {
    EXPECT_THROW(heading(0, "x"), ValidationError);
    EXPECT_THROW(heading(7, "x"), ValidationError);
}

TEST_F(MarkdownStringsTest, Blockquote) {
    EXPECT_EQ(blockquote("line one\nline two").text(), "> line one\n> line two\n\n");
}

TEST_F(MarkdownStringsTest, BlockquoteBlankLines) {
    EXPECT_EQ(blockquote("a\n\nb").text(), "> a\n>\n> b\n\n");
}

TEST_F(MarkdownStringsTest, BlockquoteWithInlineNodes) {
    Node n = blockquote({"Said ", italic("twice"), lineBreak(), "then once"});
    EXPECT_EQ(n.kind(), Kind::Blockquote);
    EXPECT_EQ(n.text(), "> Said *twice*  \n> then once\n\n");
}

TEST_F(MarkdownStringsTest, CodeBlock) {
    Node n = codeBlock("x = 1", "python");
    EXPECT_EQ(n.kind(), Kind::CodeBlock);
    EXPECT_EQ(n.text(), "```python\nx = 1\n```\n\n");
}

TEST_F(MarkdownStringsTest, CodeBlockFenceOutgrowsContent) {
    EXPECT_EQ(codeBlock("```").text(), "````\n```\n````\n\n");
    EXPECT_EQ(codeBlock("# *x*").text(), "```\n# *x*\n```\n\n");
}

TEST_F(MarkdownStringsTest, CodeBlockRejectsBadLanguage) {
    EXPECT_THROW(codeBlock("x", "py`"), ValidationError);
    EXPECT_THROW(codeBlock("x", "py\nthon"), ValidationError);
}

TEST_F(MarkdownStringsTest, HorizontalRule) {
    EXPECT_EQ(horizontalRule().text(), "---\n\n");
    EXPECT_EQ(horizontalRule().kind(), Kind::HorizontalRule);
}

TEST_F(MarkdownStringsTest, LinkReference) {
    Node n = linkReference("ref-1", "https://example.com/x y");
    EXPECT_EQ(n.text(), "[ref-1]: https://example.com/x%20y\n");
    EXPECT_TRUE(n.escaped());
}

TEST_F(MarkdownStringsTest, Document) {
    Node n = document({h1("Title"), paragraph("Body"), horizontalRule()});
    EXPECT_EQ(n.kind(), Kind::Document);
    EXPECT_EQ(n.text(), "# Title\nBody\n---");
}

TEST_F(MarkdownStringsTest, DocumentWithReferences) {
    Node n = document({paragraph("See below"), linkReference("1", "u"), empty()});
    EXPECT_EQ(n.text(), "See below\n[1]: u\n");
}

TEST_F(MarkdownStringsTest, DocumentRejectsInlineNodes) {
    EXPECT_THROW(document({bold("x")}), InvalidNestingError);
}

TEST_F(MarkdownStringsTest, EmptyDocument) {
    EXPECT_EQ(document({}).text(), "");
    EXPECT_TRUE(document({}).escaped());
}

TEST_F(MarkdownStringsTest, BulletList) {
    Node n = bulletList({"one", "two"});
    EXPECT_EQ(n.kind(), Kind::BulletList);
    EXPECT_EQ(n.text(), "- one\n- two\n\n");
}

TEST_F(MarkdownStringsTest, BulletListSingleItem) {
    EXPECT_EQ(bulletList("only").text(), "- only\n\n");
}

TEST_F(MarkdownStringsTest, BulletListNested) {
    EXPECT_EQ(bulletList({"a", {"b", "c", {"d"}}, "e"}).text(), "- a\n  - b\n  - c\n    - d\n- e\n\n");
}

TEST_F(MarkdownStringsTest, BulletListEscapesItems) {
    EXPECT_EQ(bulletList({"1. not ordered", "- not nested"}).text(), "- 1\\. not ordered\n- \\- not nested\n\n");
}

TEST_F(MarkdownStringsTest, BulletListNodeItemsAreTrimmed) {
    EXPECT_EQ(bulletList({paragraph("para"), md.link("l", "u")}).text(), "- para\n- [l](u)\n\n");
}

TEST_F(MarkdownStringsTest, BulletListMultiLineItem) {
    EXPECT_EQ(bulletList({"first\nsecond"}).text(), "- first\n  second\n\n");
}

TEST_F(MarkdownStringsTest, BulletListRejectsBlocks) {
    EXPECT_THROW(bulletList({codeBlock("x")}), InvalidNestingError);
    EXPECT_THROW(bulletList({bulletList({"x"})}), InvalidNestingError);
}

TEST_F(MarkdownStringsTest, OrderedList) {
    EXPECT_EQ(orderedList({"a", "b"}).text(), "1. a\n2. b\n\n");
    EXPECT_EQ(orderedList({"a", "b"}, 3).text(), "3. a\n4. b\n\n");
}

TEST_F(MarkdownStringsTest, OrderedListNestedRestartsNumbering) {
    EXPECT_EQ(orderedList({"a", {"x", "y"}, "b"}).text(), "1. a\n  1. x\n  2. y\n2. b\n\n");
}

TEST_F(MarkdownStringsTest, OrderedListMultiLineItemAlignsWithContent) {
    EXPECT_EQ(orderedList({"a\nb"}, 10).text(), "10. a\n    b\n\n");
}

TEST_F(MarkdownStringsTest, OrderedListStartMustBePositive) {
    EXPECT_THROW(orderedList({"a"}, 0), ValidationError);
    EXPECT_THROW(orderedList({"a"}, -2), ValidationError);
}

TEST_F(MarkdownStringsTest, OrderedListLargestNumber) {
    EXPECT_EQ(orderedList({"a", "b"}, 999999998).text(), "999999998. a\n999999999. b\n\n");
    EXPECT_EQ(orderedList({"a", {"x", "y"}}, 999999999).text(), "999999999. a\n  1. x\n  2. y\n\n");
}

TEST_F(MarkdownStringsTest, OrderedListNumberOverflow) {
    EXPECT_THROW(orderedList({"a", "b"}, 999999999), ValidationError);
    EXPECT_THROW(orderedList({"a", "b"}, INT_MAX), ValidationError);
    try {
        orderedList({"a"}, INT_MAX);
        FAIL() << "expected ValidationError";
    } catch (ValidationError const& e) {
        EXPECT_STREQ(e.what(), "ordered list numbers must not exceed 999999999, got start 2147483647 for 1 items");
    }
}

TEST_F(MarkdownStringsTest, Checklist) {
    Node n = checklist({"write docs", "ship"}, std::vector<bool>{true, false});
    EXPECT_EQ(n.kind(), Kind::Checklist);
    EXPECT_EQ(n.text(), "- [x] write docs\n- [ ] ship\n\n");
}

TEST_F(MarkdownStringsTest, ChecklistDefaultsToUnchecked) {
    EXPECT_EQ(checklist({"a", "b"}).text(), "- [ ] a\n- [ ] b\n\n");
}

TEST_F(MarkdownStringsTest, ChecklistNestedEntriesAreUnchecked) {
    EXPECT_EQ(checklist({"a", {"sub"}}, std::vector<bool>{true, true}).text(), "- [x] a\n  - [ ] sub\n\n");
}

TEST_F(MarkdownStringsTest, ChecklistLengthMismatch) {
    EXPECT_THROW(checklist({"a", "b"}, std::vector<bool>{true}), ValidationError);
}

TEST_F(MarkdownStringsTest, Table) {
    Node n = table({"Name", "Value"}, {{"a|b", "1"}});
    EXPECT_EQ(n.kind(), Kind::Table);
    EXPECT_EQ(n.text(), "Name | Value\n--- | ---\na\\|b | 1\n\n");
}

TEST_F(MarkdownStringsTest, TableEscapesPipesFromNodeCells) {
    Node n = table({"h"}, {{bold("a|b")}, {md.link("x", "a|b")}, {code("c|d")}});
    EXPECT_EQ(n.text(), "h\n---\n**a\\|b**\n[x](a\\|b)\n`c\\|d`\n\n");
    EXPECT_TRUE(n.escaped());
}

TEST_F(MarkdownStringsTest, TableKeepsEscapedPipes) {
    EXPECT_EQ(table({"h"}, {{bold("a\\|b", false)}}).text(), "h\n---\n**a\\|b**\n\n");
    EXPECT_EQ(table({"h"}, {{"a\\|b"}}).text(), "h\n---\na\\\\\\|b\n\n");
}

TEST_F(MarkdownStringsTest, TableWithAlignment) {
    Node n = table({"L", "C", "R"}, {{"1", "2", "3"}}, {"left", "center", "right"});
    EXPECT_EQ(n.text(), "L | C | R\n:--- | :---: | ---:\n1 | 2 | 3\n\n");
}

TEST_F(MarkdownStringsTest, TableWithoutRows) {
    EXPECT_EQ(table({"Only"}, {}).text(), "Only\n---\n\n");
}

TEST_F(MarkdownStringsTest, TableCellNodes) {
    Node n = table({"Link"}, {{md.link("x", "u")}, {bold("y")}});
    EXPECT_EQ(n.text(), "Link\n---\n[x](u)\n**y**\n\n");
}

TEST_F(MarkdownStringsTest, TableRequiresHeaders) {
    EXPECT_THROW(table({}, {}), ValidationError);
}

TEST_F(MarkdownStringsTest, TableRowWidthMismatch) {
    try {
        table({"a", "b"}, {{"1", "2"}, {"3"}});
        FAIL() << "expected ValidationError";
    } catch (ValidationError const& e) {
        EXPECT_STREQ(e.what(), "table row 2 has 1 columns but headers have 2");
    }
}

TEST_F(MarkdownStringsTest, TableBadAlignment) {
    EXPECT_THROW(table({"a"}, {}, {"middle"}), ValidationError);
    EXPECT_THROW(table({"a", "b"}, {}, {"left"}), ValidationError);
}

TEST_F(MarkdownStringsTest, TableCellLineBreak) {
    EXPECT_THROW(table({"a"}, {{"x\ny"}}), ValidationError);
    EXPECT_THROW(table({"a"}, {{lineBreak()}}), InvalidNestingError);
}

TEST_F(MarkdownStringsTest, ParseAlignment) {
    EXPECT_EQ(parseAlignment("left"), Alignment::Left);
    EXPECT_EQ(parseAlignment("center"), Alignment::Center);
    EXPECT_EQ(parseAlignment("right"), Alignment::Right);
    EXPECT_THROW(parseAlignment("Left"), ValidationError);
}

TEST_F(MarkdownStringsTest, UnescapedContentTaintsNode) {
    Node n = bold("*x*", false);
    EXPECT_EQ(n.text(), "***x***");
    EXPECT_FALSE(n.escaped());
}

TEST_F(MarkdownStringsTest, TaintPropagatesUpward) {
    Node raw = text("<kbd>", false);
    Node p = paragraph({"safe ", bold(raw)});
    EXPECT_EQ(p.text(), "safe **<kbd>**\n\n");
    EXPECT_FALSE(p.escaped());
    EXPECT_FALSE(document({p}).escaped());
    EXPECT_FALSE(bulletList({"a", raw}).escaped());
    EXPECT_FALSE(table({"h"}, {{raw}}).escaped());
}

TEST_F(MarkdownStringsTest, EscapedParentStaysEscaped) {
    EXPECT_TRUE(document({paragraph({"a", bold("b")}), bulletList({"c"})}).escaped());
}

TEST_F(MarkdownStringsTest, UnescapedUrlIsStillEscaped) {
    EXPECT_EQ(md.link("*a*", "x y", false).text(), "[*a*](x%20y)");
}

TEST_F(MarkdownStringsTest, GlobalSafeMode) {
    setSafeMode(true);
    EXPECT_TRUE(isSafeMode());
    EXPECT_THROW(bold("x", false), SafeModeError);
    EXPECT_THROW(codeBlock("x", "", false), SafeModeError);
    EXPECT_THROW(bulletList({"x"}, false), SafeModeError);
    EXPECT_THROW(table({"h"}, {}, {}, false), SafeModeError);
    EXPECT_EQ(bold("x").text(), "**x**");
    setSafeMode(false);
    EXPECT_FALSE(isSafeMode());
    EXPECT_NO_THROW(bold("x", false));
}

namespace {

// Every constructor that takes an `escape` argument, built from "*x*".
struct EscapeCase {
    char const* name;
    std::function<Node(MarkdownBuilder const&, bool)> build;
};

std::vector<EscapeCase> const kBuilderCases = {
    {"text", [](MarkdownBuilder const& b, bool e) { return b.text("*x*", e); }},
    {"bold", [](MarkdownBuilder const& b, bool e) { return b.bold("*x*", e); }},
    {"italic", [](MarkdownBuilder const& b, bool e) { return b.italic("*x*", e); }},
    {"strikethrough", [](MarkdownBuilder const& b, bool e) { return b.strikethrough("*x*", e); }},
    {"code", [](MarkdownBuilder const& b, bool e) { return b.code("*x*", e); }},
    {"link", [](MarkdownBuilder const& b, bool e) { return b.link("*x*", "u", e); }},
    {"image", [](MarkdownBuilder const& b, bool e) { return b.image("*x*", "u", e); }},
    {"referenceLink", [](MarkdownBuilder const& b, bool e) { return b.referenceLink("*x*", "id", e); }},
    {"paragraph", [](MarkdownBuilder const& b, bool e) { return b.paragraph("*x*", e); }},
    {"heading", [](MarkdownBuilder const& b, bool e) { return b.heading(2, "*x*", e); }},
    {"h1", [](MarkdownBuilder const& b, bool e) { return b.h1("*x*", e); }},
    {"h6", [](MarkdownBuilder const& b, bool e) { return b.h6("*x*", e); }},
    {"blockquote", [](MarkdownBuilder const& b, bool e) { return b.blockquote("*x*", e); }},
    {"codeBlock", [](MarkdownBuilder const& b, bool e) { return b.codeBlock("*x*", "", e); }},
    {"bulletList", [](MarkdownBuilder const& b, bool e) { return b.bulletList({"*x*"}, e); }},
    {"orderedList", [](MarkdownBuilder const& b, bool e) { return b.orderedList({"*x*"}, 1, e); }},
    {"checklist", [](MarkdownBuilder const& b, bool e) { return b.checklist({"*x*"}, std::nullopt, e); }},
    {"table", [](MarkdownBuilder const& b, bool e) { return b.table({"h"}, {{"*x*"}}, {}, e); }},
};

std::vector<std::pair<char const*, std::function<Node(bool)>>> const kFreeCases = {
    {"text", [](bool e) { return text("*x*", e); }},
    {"bold", [](bool e) { return bold("*x*", e); }},
    {"italic", [](bool e) { return italic("*x*", e); }},
    {"strikethrough", [](bool e) { return strikethrough("*x*", e); }},
    {"code", [](bool e) { return code("*x*", e); }},
    {"link", [](bool e) { return markdown_strings_cpp::link("*x*", "u", e); }},
    {"image", [](bool e) { return image("*x*", "u", e); }},
    {"referenceLink", [](bool e) { return referenceLink("*x*", "id", e); }},
    {"paragraph", [](bool e) { return paragraph("*x*", e); }},
    {"heading", [](bool e) { return heading(3, "*x*", e); }},
    {"h1", [](bool e) { return h1("*x*", e); }},
    {"h2", [](bool e) { return h2("*x*", e); }},
    {"blockquote", [](bool e) { return blockquote("*x*", e); }},
    {"codeBlock", [](bool e) { return codeBlock("*x*", "", e); }},
    {"bulletList", [](bool e) { return bulletList({"*x*"}, e); }},
    {"orderedList", [](bool e) { return orderedList({"*x*"}, 1, e); }},
    {"checklist", [](bool e) { return checklist({"*x*"}, std::nullopt, e); }},
    {"table", [](bool e) { return table({"h"}, {{"*x*"}}, {}, e); }},
};

} // namespace

TEST_F(MarkdownStringsTest, BuilderSafeModeCoversEveryConstructor) {
    MarkdownOptions options;
    options.safeMode = true;
    MarkdownBuilder strict(options);
    for (auto const& c : kBuilderCases) {
        EXPECT_THROW(c.build(strict, false), SafeModeError) << c.name;
        EXPECT_TRUE(c.build(strict, true).escaped()) << c.name;
    }
}

TEST_F(MarkdownStringsTest, UnescapedRequestTaintsEveryConstructor) {
    for (auto const& c : kBuilderCases) {
        EXPECT_FALSE(c.build(md, false).escaped()) << c.name;
        EXPECT_TRUE(c.build(md, true).escaped()) << c.name;
    }
}

TEST_F(MarkdownStringsTest, GlobalSafeModeCoversEveryFreeFunction) {
    setSafeMode(true);
    for (auto const& [name, build] : kFreeCases) {
        EXPECT_THROW(build(false), SafeModeError) << name;
        EXPECT_TRUE(build(true).escaped()) << name;
    }
    setSafeMode(false);
    for (auto const& [name, build] : kFreeCases) {
        EXPECT_FALSE(build(false).escaped()) << name;
    }
}

TEST_F(MarkdownStringsTest, SafeModeErrorMessage) {
    setSafeMode(true);
    try {
        text("x", false);
        FAIL() << "expected SafeModeError";
    } catch (SafeModeError const& e) {
        EXPECT_STREQ(e.what(), "escape=false is disabled in safe mode");
    }
}

TEST_F(MarkdownStringsTest, BuilderSafeModeIsIndependentOfGlobal) {
    MarkdownOptions options;
    options.safeMode = true;
    MarkdownBuilder strict(options);
    EXPECT_THROW(strict.italic("x", false), SafeModeError);
    EXPECT_NO_THROW(md.italic("x", false));
    EXPECT_FALSE(isSafeMode());
}

TEST_F(MarkdownStringsTest, CustomDelimiters) {
    MarkdownOptions options;
    options.strongDelimiter = "__";
    options.emDelimiter = "_";
    options.bulletListMarker = "*";
    options.hr = "* * *";
    MarkdownBuilder custom(options);
    EXPECT_EQ(custom.bold("x").text(), "__x__");
    EXPECT_EQ(custom.italic("x").text(), "_x_");
    EXPECT_EQ(custom.bulletList({"a"}).text(), "* a\n\n");
    EXPECT_EQ(custom.checklist({"a"}).text(), "* [ ] a\n\n");
    EXPECT_EQ(custom.horizontalRule().text(), "* * *\n\n");
}

TEST_F(MarkdownStringsTest, InvalidOptions) {
    MarkdownOptions options;
    options.strongDelimiter = "~~";
    EXPECT_THROW(MarkdownBuilder{options}, ValidationError);
}

TEST_F(MarkdownStringsTest, ConfigureOptionsKeepsOldValuesOnError) {
    md.configureOptions([](MarkdownOptions& opts) { opts.emDelimiter = "_"; });
    EXPECT_EQ(md.italic("x").text(), "_x_");
    EXPECT_THROW(md.configureOptions([](MarkdownOptions& opts) { opts.hr = "==="; }), ValidationError);
    EXPECT_EQ(md.options().hr, "---");
    EXPECT_EQ(md.options().emDelimiter, "_");
}

TEST_F(MarkdownStringsTest, NodeEquality) {
    EXPECT_EQ(bold("x"), bold("x"));
    EXPECT_NE(bold("x"), italic("x"));
    EXPECT_NE(text("*", false), text("*"));
}

TEST_F(MarkdownStringsTest, NodeStreamOutput) {
    std::ostringstream out;
    out << paragraph("a \"b\"");
    EXPECT_EQ(out.str(), "Node(kind=paragraph, escaped=true, text=\"a \\\"b\\\"\\n\\n\")");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
