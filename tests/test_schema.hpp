#pragma once

// Shared schema and node builders for the folio-cpp test suites.

#include <folio-cpp/folio.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace folio_cpp::test {

inline auto make_schema() -> std::shared_ptr<const Schema> {
    return Schema::create(SchemaSpec{
        .nodes = {
            {"doc", {.content = "block+", .attrs = {{"lang", {.default_value = Null{}}}}}},
            {"paragraph", {.content = "inline*", .group = "block"}},
            {"heading", {.content = "inline*", .group = "block", .defining = true,
                         .attrs = {{"level", {.default_value = std::int64_t{1}}}}}},
            {"blockquote", {.content = "block+", .group = "block", .defining = true}},
            {"horizontal_rule", {.group = "block"}},
            {"code_block", {.content = "text*", .marks = "", .group = "block", .code = true}},
            {"image", {.group = "inline", .inline_node = true,
                       .attrs = {{"src", {}}, {"alt", {.default_value = Null{}}}}}},
            {"hard_break", {.group = "inline", .inline_node = true, .selectable = false}},
            {"text", {.group = "inline", .inline_node = true}},
        },
        .marks = {
            {"link", {.attrs = {{"href", {}}}, .inclusive = false}},
            {"em", {}},
            {"strong", {}},
            {"code", {.excludes = "_"}},
        },
    });
}

inline auto schema() -> const std::shared_ptr<const Schema>& {
    static const auto instance = make_schema();
    return instance;
}

// -- Nodes --------------------------------------------------------------------

inline auto doc(std::vector<NodePtr> content) -> NodePtr {
    return schema()->node("doc", {}, std::move(content));
}

inline auto p(std::vector<NodePtr> content = {}) -> NodePtr {
    return schema()->node("paragraph", {}, std::move(content));
}

inline auto p(std::string_view text) -> NodePtr {
    return p(std::vector<NodePtr>{schema()->text(text)});
}

inline auto h(std::int64_t level, std::string_view text) -> NodePtr {
    return schema()->node("heading", {{"level", level}}, {schema()->text(text)});
}

inline auto blockquote(std::vector<NodePtr> content) -> NodePtr {
    return schema()->node("blockquote", {}, std::move(content));
}

inline auto hr() -> NodePtr {
    return schema()->node("horizontal_rule");
}

inline auto code_block(std::string_view text) -> NodePtr {
    return schema()->node("code_block", {}, {schema()->text(text)});
}

inline auto img(std::string src = "img.png") -> NodePtr {
    return schema()->node("image", {{"src", std::move(src)}});
}

inline auto br() -> NodePtr {
    return schema()->node("hard_break");
}

inline auto t(std::string_view text, MarkSet marks = {}) -> NodePtr {
    return schema()->text(text, std::move(marks));
}

// -- Marks --------------------------------------------------------------------

inline auto em() -> Mark { return schema()->mark("em"); }
inline auto strong() -> Mark { return schema()->mark("strong"); }
inline auto code() -> Mark { return schema()->mark("code"); }
inline auto link(std::string href) -> Mark { return schema()->mark("link", {{"href", std::move(href)}}); }

// -- Helpers ------------------------------------------------------------------

/// Two documents are structurally equal.
inline auto same_doc(const NodePtr& a, const NodePtr& b) -> bool {
    return a->eq(*b);
}

}  // namespace folio_cpp::test
