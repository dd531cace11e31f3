#include <folio-cpp/json.hpp>
#include <folio-cpp/error.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace folio_cpp {

namespace {

auto json_error(std::string message) -> Exception {
    return Exception{ErrorKind::invalid_json, std::move(message)};
}

auto require(const nlohmann::json& j, std::string_view field) -> const nlohmann::json& {
    if (!j.is_object()) throw json_error("Expected a JSON object");
    auto it = j.find(field);
    if (it == j.end()) throw json_error("Missing field \"" + std::string{field} + "\"");
    return *it;
}

auto require_string(const nlohmann::json& j, std::string_view field) -> std::string {
    const auto& v = require(j, field);
    if (!v.is_string()) throw json_error("Field \"" + std::string{field} + "\" must be a string");
    return v.get<std::string>();
}

auto require_pos(const nlohmann::json& j, std::string_view field) -> std::size_t {
    const auto& v = require(j, field);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<std::int64_t>() >= 0)) {
        throw json_error("Field \"" + std::string{field} + "\" must be a non-negative integer");
    }
    return v.get<std::size_t>();
}

auto optional_pos(const nlohmann::json& j, std::string_view field) -> std::size_t {
    return j.contains(field) ? require_pos(j, field) : 0;
}

auto optional_flag(const nlohmann::json& j, std::string_view field) -> bool {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) return false;
    if (!it->is_boolean()) throw json_error("Field \"" + std::string{field} + "\" must be a boolean");
    return it->get<bool>();
}

auto attrs_to_json(const Attrs& attrs) -> nlohmann::json {
    auto obj = nlohmann::json::object();
    for (const auto& [name, value] : attrs) {
        obj[name] = value;
    }
    return obj;
}

}  // namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ScalarValue& v) {
    std::visit([&j](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, Null>) {
            j = nullptr;
        } else {
            j = value;
        }
    }, v);
}

void from_json(const nlohmann::json& j, ScalarValue& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Null{};
            break;
        case nlohmann::json::value_t::boolean:
            v = j.get<bool>();
            break;
        case nlohmann::json::value_t::number_integer:
            v = j.get<std::int64_t>();
            break;
        case nlohmann::json::value_t::number_unsigned: {
            auto n = j.get<std::uint64_t>();
            if (n > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw json_error("Integer " + std::to_string(n) + " out of range");
            }
            v = static_cast<std::int64_t>(n);
            break;
        }
        case nlohmann::json::value_t::number_float:
            v = j.get<double>();
            break;
        case nlohmann::json::value_t::string:
            v = j.get<std::string>();
            break;
        default:
            throw json_error("Attribute values must be null, boolean, number or string");
    }
}

void to_json(nlohmann::json& j, const Mark& m) {
    j = nlohmann::json{{"type", m.type->name()}};
    if (!m.attrs.empty()) j["attrs"] = attrs_to_json(m.attrs);
}

void to_json(nlohmann::json& j, const Node& n) {
    j = nlohmann::json{{"type", n.type().name()}};
    if (!n.attrs().empty()) j["attrs"] = attrs_to_json(n.attrs());
    if (n.content().size() > 0) j["content"] = n.content();
    if (!n.marks().empty()) j["marks"] = n.marks();
    if (n.is_text()) j["text"] = n.text();
}

void to_json(nlohmann::json& j, const Fragment& f) {
    if (f.child_count() == 0) {
        j = nullptr;
        return;
    }
    j = nlohmann::json::array();
    for (const auto& child : f.children()) {
        j.push_back(*child);
    }
}

void to_json(nlohmann::json& j, const Slice& s) {
    if (s.content().size() == 0) {
        j = nullptr;
        return;
    }
    j = nlohmann::json{{"content", s.content()}};
    if (s.open_start() > 0) j["openStart"] = s.open_start();
    if (s.open_end() > 0) j["openEnd"] = s.open_end();
}

void to_json(nlohmann::json& j, const Step& s) {
    j = nlohmann::json{{"stepType", std::string{step_type_name(s)}}};
    std::visit(overload{
        [&j](const ReplaceStep& step) {
            j["from"] = step.from;
            j["to"] = step.to;
            if (step.slice.content().size() > 0) j["slice"] = step.slice;
            if (step.structure) j["structure"] = true;
        },
        [&j](const ReplaceAroundStep& step) {
            j["from"] = step.from;
            j["to"] = step.to;
            j["gapFrom"] = step.gap_from;
            j["gapTo"] = step.gap_to;
            j["insert"] = step.insert;
            if (step.slice.content().size() > 0) j["slice"] = step.slice;
            if (step.structure) j["structure"] = true;
        },
        [&j](const AddMarkStep& step) {
            j["mark"] = step.mark;
            j["from"] = step.from;
            j["to"] = step.to;
        },
        [&j](const RemoveMarkStep& step) {
            j["mark"] = step.mark;
            j["from"] = step.from;
            j["to"] = step.to;
        },
        [&j](const AttrStep& step) {
            j["pos"] = step.pos;
            j["attr"] = step.attr;
            j["value"] = step.value;
        },
        [&j](const DocAttrStep& step) {
            j["attr"] = step.attr;
            j["value"] = step.value;
        },
    }, s);
}

void to_json(nlohmann::json& j, const Selection& s) {
    j = nlohmann::json{{"type", std::string{to_string_view(s.kind())}}};
    switch (s.kind()) {
        case SelectionKind::text:
            j["anchor"] = s.anchor();
            j["head"] = s.head();
            break;
        case SelectionKind::node:
            j["anchor"] = s.anchor();
            break;
        case SelectionKind::all:
            break;
    }
}

// =============================================================================
// Schema-aware deserialization
// =============================================================================

auto attrs_from_json(const nlohmann::json& j) -> Attrs {
    auto attrs = Attrs{};
    if (j.is_null()) return attrs;
    if (!j.is_object()) throw json_error("Attributes must be a JSON object");
    for (const auto& [name, value] : j.items()) {
        attrs.emplace(name, value.get<ScalarValue>());
    }
    return attrs;
}

auto mark_from_json(const Schema& schema, const nlohmann::json& j) -> Mark {
    auto name = require_string(j, "type");
    const auto* type = schema.find_mark_type(name);
    if (!type) throw json_error("There is no mark type " + name + " in this schema");
    return type->create(j.contains("attrs") ? attrs_from_json(j["attrs"]) : Attrs{});
}

auto marks_from_json(const Schema& schema, const nlohmann::json& j) -> MarkSet {
    if (j.is_null()) return {};
    if (!j.is_array()) throw json_error("Marks must be a JSON array");
    auto marks = MarkSet{};
    for (const auto& m : j) {
        marks.push_back(mark_from_json(schema, m));
    }
    return Mark::set_from(std::move(marks));
}

auto node_from_json(const Schema& schema, const nlohmann::json& j) -> NodePtr {
    auto name = require_string(j, "type");
    auto marks = j.contains("marks") ? marks_from_json(schema, j["marks"]) : MarkSet{};
    if (name == schema.text_type().name()) {
        auto text = require_string(j, "text");
        if (text.empty()) throw json_error("Empty text nodes are not allowed");
        return schema.text(text, std::move(marks));
    }
    const auto* type = schema.find_node_type(name);
    if (!type) throw json_error("Unknown node type: " + name);
    auto attrs = j.contains("attrs") ? attrs_from_json(j["attrs"]) : Attrs{};
    auto content = j.contains("content") ? fragment_from_json(schema, j["content"]) : Fragment{};
    return type->create_checked(attrs, std::move(content), std::move(marks));
}

auto fragment_from_json(const Schema& schema, const nlohmann::json& j) -> Fragment {
    if (j.is_null()) return {};
    if (!j.is_array()) throw json_error("Invalid input for Fragment: expected an array");
    auto nodes = std::vector<NodePtr>{};
    nodes.reserve(j.size());
    for (const auto& child : j) {
        nodes.push_back(node_from_json(schema, child));
    }
    return Fragment::from_array(std::move(nodes));
}

auto slice_from_json(const Schema& schema, const nlohmann::json& j) -> Slice {
    if (j.is_null()) return Slice::empty();
    if (!j.is_object()) throw json_error("Invalid input for Slice: expected an object");
    auto open_start = optional_pos(j, "openStart");
    auto open_end = optional_pos(j, "openEnd");
    auto content = j.contains("content") ? fragment_from_json(schema, j["content"]) : Fragment{};
    return Slice{std::move(content), open_start, open_end};
}

namespace {

auto read_step(const Schema& schema, const nlohmann::json& j) -> Step {
    auto type = require_string(j, "stepType");
    auto slice = [&]() {
        return j.contains("slice") ? slice_from_json(schema, j["slice"]) : Slice::empty();
    };
    if (type == "replace") {
        return ReplaceStep{require_pos(j, "from"), require_pos(j, "to"), slice(),
                           optional_flag(j, "structure")};
    }
    if (type == "replaceAround") {
        return ReplaceAroundStep{require_pos(j, "from"), require_pos(j, "to"),
                                 require_pos(j, "gapFrom"), require_pos(j, "gapTo"), slice(),
                                 require_pos(j, "insert"), optional_flag(j, "structure")};
    }
    if (type == "addMark") {
        return AddMarkStep{require_pos(j, "from"), require_pos(j, "to"),
                           mark_from_json(schema, require(j, "mark"))};
    }
    if (type == "removeMark") {
        return RemoveMarkStep{require_pos(j, "from"), require_pos(j, "to"),
                              mark_from_json(schema, require(j, "mark"))};
    }
    if (type == "attr") {
        return AttrStep{require_pos(j, "pos"), require_string(j, "attr"),
                        require(j, "value").get<ScalarValue>()};
    }
    if (type == "docAttr") {
        return DocAttrStep{require_string(j, "attr"), require(j, "value").get<ScalarValue>()};
    }
    throw json_error("No step type " + type + " defined");
}

}  // namespace

auto step_from_json(const Schema& schema, const nlohmann::json& j) -> Step {
    auto step = read_step(schema, j);
    try {
        check_step(step);
    } catch (const Exception& e) {
        throw json_error(e.what());
    }
    return step;
}

auto selection_from_json(const NodePtr& doc, const nlohmann::json& j) -> Selection {
    auto type = require_string(j, "type");
    auto size = doc->content().size();
    auto in_doc = [&](std::string_view field) {
        auto pos = require_pos(j, field);
        if (pos > size) throw json_error("Selection position " + std::to_string(pos) + " outside of document");
        return pos;
    };
    if (type == "text") {
        return Selection::text(doc, in_doc("anchor"), in_doc("head"));
    }
    if (type == "node") {
        return Selection::node(doc, in_doc("anchor"));
    }
    if (type == "all") {
        return Selection::all(doc);
    }
    throw json_error("No selection type " + type + " defined");
}

}  // namespace folio_cpp
