#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "markdown_strings.h"

#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace {

using markdown_strings_cpp::Content;
using markdown_strings_cpp::EscapeContext;
using markdown_strings_cpp::Kind;
using markdown_strings_cpp::MarkdownBuilder;
using markdown_strings_cpp::MarkdownOptions;
using markdown_strings_cpp::Node;

// str, Node, None and (nested) list/tuple values become Content.
Content to_content(py::handle value) {
    if (value.is_none()) {
        return Content();
    }
    if (py::isinstance<py::str>(value)) {
        return Content(value.cast<std::string>());
    }
    if (py::isinstance<Node>(value)) {
        return Content(value.cast<Node>());
    }
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        Content::Sequence items;
        for (auto item : value) {
            items.push_back(to_content(item));
        }
        return Content(std::move(items));
    }
    throw markdown_strings_cpp::TypeMismatchError(
        "content must be str, Node or a list of them, got " +
        py::str(py::type::handle_of(value).attr("__name__")).cast<std::string>());
}

std::vector<Content> to_cells(py::handle value) {
    std::vector<Content> cells;
    for (auto item : value) {
        cells.push_back(to_content(item));
    }
    return cells;
}

std::vector<std::vector<Content>> to_rows(py::handle value) {
    std::vector<std::vector<Content>> rows;
    for (auto row : value) {
        rows.push_back(to_cells(row));
    }
    return rows;
}

std::string node_repr(Node const& node) {
    std::ostringstream out;
    out << node;
    return out.str();
}

void apply_option(MarkdownOptions& opts, std::string const& key, py::handle value) {
    if (key == "strongDelimiter") {
        opts.strongDelimiter = value.cast<std::string>();
    } else if (key == "emDelimiter") {
        opts.emDelimiter = value.cast<std::string>();
    } else if (key == "bulletListMarker") {
        opts.bulletListMarker = value.cast<std::string>();
    } else if (key == "hr") {
        opts.hr = value.cast<std::string>();
    } else if (key == "safeMode") {
        opts.safeMode = value.cast<bool>();
    } else {
        throw py::key_error("Unknown option: " + key);
    }
}

// Constructor methods of MarkdownBuilder, named as in Python.
void def_constructors(py::class_<MarkdownBuilder>& cls) {
    auto content = py::arg("content");
    auto escape = py::arg("escape") = true;

    cls.def("text", [](MarkdownBuilder const& self, std::string const& value, bool esc) {
        return self.text(value, esc);
    }, py::arg("value"), escape);
    cls.def("bold", [](MarkdownBuilder const& self, py::object c, bool esc) {
        return self.bold(to_content(c), esc);
    }, content, escape);
    cls.def("italic", [](MarkdownBuilder const& self, py::object c, bool esc) {
        return self.italic(to_content(c), esc);
    }, content, escape);
    cls.def("strikethrough", [](MarkdownBuilder const& self, py::object c, bool esc) {
        return self.strikethrough(to_content(c), esc);
    }, content, escape);
    cls.def("code", &MarkdownBuilder::code, content, escape);
    cls.def("link", [](MarkdownBuilder const& self, py::object text, std::string const& url, bool esc) {
        return self.link(to_content(text), url, esc);
    }, py::arg("text"), py::arg("url"), escape);
    cls.def("image", &MarkdownBuilder::image, py::arg("alt_text"), py::arg("url"), escape);
    cls.def("line_break", &MarkdownBuilder::lineBreak);
    cls.def("empty", &MarkdownBuilder::empty);
    cls.def("reference_link", [](MarkdownBuilder const& self, py::object text, std::string const& id, bool esc) {
        return self.referenceLink(to_content(text), id, esc);
    }, py::arg("text"), py::arg("reference_id"), escape);

    cls.def("paragraph", [](MarkdownBuilder const& self, py::object c, bool esc) {
        return self.paragraph(to_content(c), esc);
    }, content, escape);
    cls.def("heading", [](MarkdownBuilder const& self, int level, py::object c, bool esc) {
        return self.heading(level, to_content(c), esc);
    }, py::arg("level"), content, escape);
    static char const* const kHeadingNames[] = {"h1", "h2", "h3", "h4", "h5", "h6"};
    for (int level = 1; level <= 6; ++level) {
        cls.def(kHeadingNames[level - 1], [level](MarkdownBuilder const& self, py::object c, bool esc) {
            return self.heading(level, to_content(c), esc);
        }, content, escape);
    }
    cls.def("blockquote", [](MarkdownBuilder const& self, py::object c, bool esc) {
        return self.blockquote(to_content(c), esc);
    }, content, escape);
    cls.def("code_block", &MarkdownBuilder::codeBlock, content, py::arg("language") = "", escape);
    cls.def("horizontal_rule", &MarkdownBuilder::horizontalRule);
    cls.def("link_reference", &MarkdownBuilder::linkReference, py::arg("reference_id"), py::arg("url"));

    cls.def("document", &MarkdownBuilder::document, py::arg("children"));
    cls.def("bullet_list", [](MarkdownBuilder const& self, py::object items, bool esc) {
        return self.bulletList(to_content(items), esc);
    }, py::arg("items"), escape);
    cls.def("ordered_list", [](MarkdownBuilder const& self, py::object items, int start, bool esc) {
        return self.orderedList(to_content(items), start, esc);
    }, py::arg("items"), py::arg("start") = 1, escape);
    cls.def("checklist", [](MarkdownBuilder const& self, py::object items,
                            std::optional<std::vector<bool>> const& checked, bool esc) {
        return self.checklist(to_content(items), checked, esc);
    }, py::arg("items"), py::arg("checked") = py::none(), escape);
    cls.def("table", [](MarkdownBuilder const& self, py::object headers, py::object rows,
                        std::optional<std::vector<std::string>> const& alignment, bool esc) {
        return self.table(to_cells(headers), to_rows(rows), alignment.value_or(std::vector<std::string>{}), esc);
    }, py::arg("headers"), py::arg("rows"), py::arg("alignment") = py::none(), escape);
}

// Module-level functions run the builder method of the same name on a
// builder seeded from the process-wide safe-mode flag.
void def_module_functions(py::module_& m, py::class_<MarkdownBuilder> const& cls) {
    static char const* const kNames[] = {
        "text", "bold", "italic", "strikethrough", "code", "link", "image", "line_break", "empty",
        "reference_link", "paragraph", "heading", "h1", "h2", "h3", "h4", "h5", "h6", "blockquote",
        "code_block", "horizontal_rule", "link_reference", "document", "bullet_list", "ordered_list",
        "checklist", "table",
    };
    for (char const* name : kNames) {
        py::object method = cls.attr(name);
        m.attr(name) = py::cpp_function(
            [method](py::args args, py::kwargs kwargs) {
                return method(py::cast(markdown_strings_cpp::defaultBuilder()), *args, **kwargs);
            },
            py::name(name));
    }
}

} // namespace

PYBIND11_MODULE(markdown_strings, m) {
    m.doc() = "markdown_strings.cpp Python bindings";

    auto& base = py::register_exception<markdown_strings_cpp::MarkdownError>(m, "MarkdownError", PyExc_ValueError);
    py::register_exception<markdown_strings_cpp::InvalidNestingError>(m, "InvalidNestingError", base.ptr());
    py::register_exception<markdown_strings_cpp::ValidationError>(m, "ValidationError", base.ptr());
    py::register_exception<markdown_strings_cpp::TypeMismatchError>(m, "TypeMismatchError", base.ptr());
    py::register_exception<markdown_strings_cpp::SafeModeError>(m, "SafeModeError", base.ptr());

    py::enum_<Kind>(m, "Kind")
        .value("Text", Kind::Text)
        .value("Bold", Kind::Bold)
        .value("Italic", Kind::Italic)
        .value("Code", Kind::Code)
        .value("Strikethrough", Kind::Strikethrough)
        .value("Link", Kind::Link)
        .value("Image", Kind::Image)
        .value("LineBreak", Kind::LineBreak)
        .value("ReferenceLink", Kind::ReferenceLink)
        .value("Paragraph", Kind::Paragraph)
        .value("Heading", Kind::Heading)
        .value("Blockquote", Kind::Blockquote)
        .value("CodeBlock", Kind::CodeBlock)
        .value("Document", Kind::Document)
        .value("BulletList", Kind::BulletList)
        .value("OrderedList", Kind::OrderedList)
        .value("Checklist", Kind::Checklist)
        .value("Table", Kind::Table)
        .value("HorizontalRule", Kind::HorizontalRule)
        .value("LinkReference", Kind::LinkReference)
        .value("Empty", Kind::Empty);

    py::enum_<EscapeContext>(m, "EscapeContext")
        .value("Plain", EscapeContext::Plain)
        .value("Url", EscapeContext::Url)
        .value("TableCell", EscapeContext::TableCell)
        .value("ListItem", EscapeContext::ListItem)
        .value("Code", EscapeContext::Code);

    py::class_<Node>(m, "Node", R"doc(
Immutable Markdown fragment.

Nodes are created only by the constructor functions; `escaped` is False when
any part of the fragment was built with escape=False.
)doc")
        .def_property_readonly("kind", &Node::kind)
        .def_property_readonly("text", &Node::text)
        .def_property_readonly("escaped", &Node::escaped)
        .def("__repr__", &node_repr)
        .def("__str__", &Node::text)
        .def("__eq__", [](Node const& self, Node const& other) { return self == other; });

    py::class_<MarkdownOptions>(m, "MarkdownOptions")
        .def(py::init<>())
        .def_readwrite("strongDelimiter", &MarkdownOptions::strongDelimiter)
        .def_readwrite("emDelimiter", &MarkdownOptions::emDelimiter)
        .def_readwrite("bulletListMarker", &MarkdownOptions::bulletListMarker)
        .def_readwrite("hr", &MarkdownOptions::hr)
        .def_readwrite("safeMode", &MarkdownOptions::safeMode);

    py::class_<MarkdownBuilder> builder(m, "MarkdownBuilder");
    builder
        .def(py::init<>())
        .def(py::init<MarkdownOptions>(), py::arg("options"))
        .def(
            "configure_options",
            [](MarkdownBuilder& self, py::kwargs kwargs) -> MarkdownBuilder& {
                self.configureOptions([&](MarkdownOptions& opts) {
                    for (auto item : kwargs) {
                        std::string key = py::cast<std::string>(item.first);
                        apply_option(opts, key, item.second);
                    }
                });
                return self;
            },
            py::return_value_policy::reference_internal
        )
        .def(
            "options",
            &MarkdownBuilder::options,
            py::return_value_policy::reference_internal
        );
    def_constructors(builder);
    def_module_functions(m, builder);

    m.def("escape_text", &markdown_strings_cpp::escapeText,
          py::arg("text"), py::arg("context") = EscapeContext::Plain);
    m.def("set_safe_mode", &markdown_strings_cpp::setSafeMode, py::arg("enabled"));
    m.def("is_safe_mode", &markdown_strings_cpp::isSafeMode);
}
