#include <folio-cpp/schema.hpp>
#include <folio-cpp/error.hpp>
#include <folio-cpp/node.hpp>

#include <algorithm>
#include <sstream>

namespace folio_cpp {

namespace {

auto split_words(std::string_view text) -> std::vector<std::string> {
    auto words = std::vector<std::string>{};
    auto in = std::istringstream{std::string{text}};
    for (auto word = std::string{}; in >> word;) words.push_back(word);
    return words;
}

auto contains(const std::vector<std::string>& words, std::string_view word) -> bool {
    return std::ranges::find(words, word) != words.end();
}

}  // namespace

// -- ContentMatch -------------------------------------------------------------

ContentMatch::ContentMatch(std::string_view expr, const Schema& schema) {
    auto max = std::optional<std::size_t>{0};
    for (const auto& part : split_words(expr)) {
        empty_ = false;
        auto name = std::string_view{part};
        auto quant = char{0};
        if (name.ends_with('+') || name.ends_with('*') || name.ends_with('?')) {
            quant = name.back();
            name.remove_suffix(1);
        }

        auto matched = std::vector<const NodeType*>{};
        if (const auto* type = schema.find_node_type(name)) {
            matched.push_back(type);
        } else {
            for (const auto* type : schema.node_types()) {
                if (type->is_in_group(name)) matched.push_back(type);
            }
        }
        if (matched.empty()) {
            throw Exception{ErrorKind::invalid_schema,
                            "No node type or group '" + std::string{name} + "' found"};
        }
        for (const auto* type : matched) {
            if (std::ranges::find(candidates_, type) == candidates_.end()) candidates_.push_back(type);
        }

        switch (quant) {
            case '+': ++min_count_; max.reset(); break;
            case '*': max.reset(); break;
            case '?': if (max) ++*max; break;
            default:  ++min_count_; if (max) ++*max; break;
        }
    }
    max_count_ = max;
}

auto ContentMatch::allows_type(const NodeType& type) const -> bool {
    return std::ranges::find(candidates_, &type) != candidates_.end();
}

auto ContentMatch::valid_content(const Fragment& fragment) const -> bool {
    auto count = fragment.child_count();
    if (count < min_count_) return false;
    if (max_count_ && count > *max_count_) return false;
    return std::ranges::all_of(fragment.children(), [this](const NodePtr& child) {
        return allows_type(child->type());
    });
}

auto ContentMatch::find_wrapping(const NodeType& type) const
    -> std::optional<std::vector<const NodeType*>> {
    if (allows_type(type)) return std::vector<const NodeType*>{};
    for (const auto* candidate : candidates_) {
        if (candidate->is_text() || candidate->is_leaf() || candidate->has_required_attrs()) continue;
        if (candidate->content_match().allows_type(type)) {
            return std::vector<const NodeType*>{candidate};
        }
    }
    return std::nullopt;
}

auto ContentMatch::default_type() const -> const NodeType* {
    for (const auto* candidate : candidates_) {
        if (!candidate->is_text() && !candidate->has_required_attrs()) return candidate;
    }
    return nullptr;
}

auto ContentMatch::compatible(const ContentMatch& other) const -> bool {
    return std::ranges::any_of(candidates_, [&](const NodeType* t) { return other.allows_type(*t); });
}

auto ContentMatch::inline_content() const -> bool {
    return !candidates_.empty() && candidates_.front()->is_inline();
}

// -- NodeType -----------------------------------------------------------------

NodeType::NodeType(std::string name, const Schema& schema, NodeSpec spec)
    : name_{std::move(name)},
      schema_{&schema},
      spec_{std::move(spec)},
      groups_{split_words(spec_.group)},
      is_block_{!spec_.inline_node && name_ != "text"},
      is_text_{name_ == "text"} {}

auto NodeType::is_in_group(std::string_view group) const -> bool {
    return contains(groups_, group);
}

auto NodeType::has_required_attrs() const -> bool {
    return std::ranges::any_of(spec_.attrs, [](const auto& entry) {
        return !entry.second.default_value.has_value();
    });
}

auto NodeType::compatible_content(const NodeType& other) const -> bool {
    return this == &other || content_match().compatible(other.content_match());
}

auto NodeType::compute_attrs(const Attrs& attrs) const -> Attrs {
    auto result = Attrs{};
    for (const auto& [name, attr] : spec_.attrs) {
        if (auto it = attrs.find(name); it != attrs.end()) {
            result.emplace(name, it->second);
        } else if (attr.default_value) {
            result.emplace(name, *attr.default_value);
        } else {
            throw Exception{ErrorKind::invalid_content,
                            "No value supplied for attribute " + name + " on " + name_};
        }
    }
    return result;
}

auto NodeType::create(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr {
    if (is_text_) {
        throw Exception{ErrorKind::invalid_operation, "NodeType::create can't construct text nodes"};
    }
    return std::make_shared<const Node>(*this, compute_attrs(attrs), std::move(content),
                                        Mark::set_from(std::move(marks)));
}

auto NodeType::create_checked(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr {
    check_content(content);
    return create(attrs, std::move(content), std::move(marks));
}

auto NodeType::create_and_fill(const Attrs& attrs, Fragment content, MarkSet marks) const -> NodePtr {
    if (valid_content(content)) return create(attrs, std::move(content), std::move(marks));
    if (content.size() > 0) return nullptr;

    const auto& match = content_match();
    const auto* fill = match.default_type();
    if (!fill) return nullptr;
    auto children = std::vector<NodePtr>{};
    for (std::size_t i = 0; i < match.min_count(); ++i) {
        auto child = fill->create_and_fill({}, Fragment{}, {});
        if (!child) return nullptr;
        children.push_back(std::move(child));
    }
    auto filled = Fragment{std::move(children)};
    if (!valid_content(filled)) return nullptr;
    return create(attrs, std::move(filled), std::move(marks));
}

auto NodeType::valid_content(const Fragment& content) const -> bool {
    if (!content_match().valid_content(content)) return false;
    return std::ranges::all_of(content.children(), [this](const NodePtr& child) {
        return allows_marks(child->marks());
    });
}

void NodeType::check_content(const Fragment& content) const {
    if (!valid_content(content)) {
        throw Exception{ErrorKind::invalid_content,
                        "Invalid content for node " + name_ + ": " + content.to_string()};
    }
}

auto NodeType::content_match() const -> const ContentMatch& {
    return *content_match_;
}

auto NodeType::allows_mark_type(const MarkType& type) const -> bool {
    return !mark_set_ || std::ranges::find(*mark_set_, &type) != mark_set_->end();
}

auto NodeType::allows_marks(const MarkSet& marks) const -> bool {
    return std::ranges::all_of(marks, [this](const Mark& m) { return allows_mark_type(*m.type); });
}

auto NodeType::allowed_marks(const MarkSet& marks) const -> MarkSet {
    if (!mark_set_) return marks;
    auto result = MarkSet{};
    for (const auto& m : marks) {
        if (allows_mark_type(*m.type)) result.push_back(m);
    }
    return result;
}

// -- MarkType -----------------------------------------------------------------

MarkType::MarkType(std::string name, std::size_t rank, const Schema& schema, MarkSpec spec)
    : name_{std::move(name)}, rank_{rank}, schema_{&schema}, spec_{std::move(spec)} {}

auto MarkType::create(const Attrs& attrs) const -> Mark {
    auto computed = Attrs{};
    for (const auto& [name, attr] : spec_.attrs) {
        if (auto it = attrs.find(name); it != attrs.end()) {
            computed.emplace(name, it->second);
        } else if (attr.default_value) {
            computed.emplace(name, *attr.default_value);
        } else {
            throw Exception{ErrorKind::invalid_content,
                            "No value supplied for attribute " + name + " on mark " + name_};
        }
    }
    return Mark{this, std::move(computed)};
}

auto MarkType::remove_from_set(const MarkSet& set) const -> MarkSet {
    auto result = MarkSet{};
    for (const auto& m : set) {
        if (m.type != this) result.push_back(m);
    }
    return result;
}

auto MarkType::is_in_set(const MarkSet& set) const -> const Mark* {
    for (const auto& m : set) {
        if (m.type == this) return &m;
    }
    return nullptr;
}

auto MarkType::excludes(const MarkType& other) const -> bool {
    return std::ranges::find(excluded_, &other) != excluded_.end();
}

auto MarkType::is_in_group(std::string_view group) const -> bool {
    return contains(split_words(spec_.group), group);
}

// -- Schema -------------------------------------------------------------------

auto Schema::create(SchemaSpec spec) -> std::shared_ptr<const Schema> {
    return std::make_shared<Schema>(std::move(spec));
}

Schema::Schema(SchemaSpec spec) : spec_{std::move(spec)} {
    for (const auto& [name, node_spec] : spec_.nodes) {
        if (find_node_type(name)) {
            throw Exception{ErrorKind::invalid_schema, "Duplicate node type " + name};
        }
        nodes_.push_back(std::make_unique<NodeType>(name, *this, node_spec));
    }
    for (const auto& [name, mark_spec] : spec_.marks) {
        if (find_mark_type(name) || find_node_type(name)) {
            throw Exception{ErrorKind::invalid_schema, name + " can not be both a node and a mark"};
        }
        marks_.push_back(std::make_unique<MarkType>(name, marks_.size(), *this, mark_spec));
    }

    top_node_type_ = find_node_type(spec_.top_node);
    if (!top_node_type_) {
        throw Exception{ErrorKind::invalid_schema, "Schema is missing its top node type " + spec_.top_node};
    }
    text_type_ = find_node_type("text");
    if (!text_type_) {
        throw Exception{ErrorKind::invalid_schema, "Every schema needs a 'text' type"};
    }
    if (!text_type_->spec().attrs.empty()) {
        throw Exception{ErrorKind::invalid_schema, "The text node type should not have attributes"};
    }

    for (auto& type : nodes_) {
        type->content_match_.emplace(type->spec_.content, *this);
        type->inline_content_ = type->content_match_->inline_content();
    }
    for (auto& type : nodes_) {
        const auto& marks = type->spec_.marks;
        if (marks && *marks == "_") {
            type->mark_set_.reset();
        } else if (marks && marks->empty()) {
            type->mark_set_ = std::vector<const MarkType*>{};
        } else if (marks) {
            type->mark_set_ = gather_marks(*marks);
        } else if (!type->inline_content_) {
            type->mark_set_ = std::vector<const MarkType*>{};
        }
    }
    for (auto& mark : marks_) {
        const auto& excludes = mark->spec_.excludes;
        if (!excludes) {
            mark->excluded_ = {mark.get()};
        } else if (!excludes->empty()) {
            mark->excluded_ = gather_marks(*excludes);
        }
    }
}

auto Schema::gather_marks(std::string_view names) const -> std::vector<const MarkType*> {
    auto found = std::vector<const MarkType*>{};
    auto add = [&](const MarkType* m) {
        if (std::ranges::find(found, m) == found.end()) found.push_back(m);
    };
    for (const auto& name : split_words(names)) {
        if (const auto* mark = find_mark_type(name)) {
            add(mark);
            continue;
        }
        auto ok = false;
        for (const auto& mark : marks_) {
            if (name == "_" || mark->is_in_group(name)) {
                add(mark.get());
                ok = true;
            }
        }
        if (!ok) throw Exception{ErrorKind::invalid_schema, "Unknown mark type: '" + name + "'"};
    }
    return found;
}

auto Schema::node_type(std::string_view name) const -> const NodeType& {
    if (const auto* type = find_node_type(name)) return *type;
    throw Exception{ErrorKind::invalid_schema, "Unknown node type: " + std::string{name}};
}

auto Schema::find_node_type(std::string_view name) const -> const NodeType* {
    for (const auto& type : nodes_) {
        if (type->name() == name) return type.get();
    }
    return nullptr;
}

auto Schema::mark_type(std::string_view name) const -> const MarkType& {
    if (const auto* type = find_mark_type(name)) return *type;
    throw Exception{ErrorKind::invalid_schema, "Unknown mark type: " + std::string{name}};
}

auto Schema::find_mark_type(std::string_view name) const -> const MarkType* {
    for (const auto& type : marks_) {
        if (type->name() == name) return type.get();
    }
    return nullptr;
}

auto Schema::node_types() const -> std::vector<const NodeType*> {
    auto result = std::vector<const NodeType*>{};
    for (const auto& type : nodes_) result.push_back(type.get());
    return result;
}

auto Schema::mark_types() const -> std::vector<const MarkType*> {
    auto result = std::vector<const MarkType*>{};
    for (const auto& type : marks_) result.push_back(type.get());
    return result;
}

auto Schema::node(std::string_view type, const Attrs& attrs,
                  std::vector<NodePtr> content, MarkSet marks) const -> NodePtr {
    return node_type(type).create_checked(attrs, Fragment::from_array(std::move(content)),
                                          std::move(marks));
}

auto Schema::text(std::string_view text, MarkSet marks) const -> NodePtr {
    if (text.empty()) throw Exception{ErrorKind::invalid_content, "Empty text nodes are not allowed"};
    return std::make_shared<const Node>(*text_type_, Attrs{}, std::string{text},
                                        Mark::set_from(std::move(marks)));
}

auto Schema::mark(std::string_view type, const Attrs& attrs) const -> Mark {
    return mark_type(type).create(attrs);
}

}  // namespace folio_cpp
