#include <folio-cpp/mark.hpp>
#include <folio-cpp/schema.hpp>

#include <algorithm>
#include <optional>

namespace folio_cpp {

auto Mark::add_to_set(const MarkSet& set) const -> MarkSet {
    auto copy = std::optional<MarkSet>{};
    auto placed = false;
    for (std::size_t i = 0; i < set.size(); ++i) {
        const auto& other = set[i];
        if (eq(other)) return set;
        if (type->excludes(*other.type)) {
            if (!copy) copy = MarkSet(set.begin(), set.begin() + static_cast<std::ptrdiff_t>(i));
        } else if (other.type->excludes(*type)) {
            return set;
        } else {
            if (!placed && other.type->rank() > type->rank()) {
                if (!copy) copy = MarkSet(set.begin(), set.begin() + static_cast<std::ptrdiff_t>(i));
                copy->push_back(*this);
                placed = true;
            }
            if (copy) copy->push_back(other);
        }
    }
    if (!copy) copy = set;
    if (!placed) copy->push_back(*this);
    return *copy;
}

auto Mark::remove_from_set(const MarkSet& set) const -> MarkSet {
    auto result = MarkSet{};
    for (const auto& m : set) {
        if (!eq(m)) result.push_back(m);
    }
    return result;
}

auto Mark::is_in_set(const MarkSet& set) const -> bool {
    return std::ranges::any_of(set, [this](const Mark& m) { return eq(m); });
}

auto Mark::to_string() const -> std::string {
    auto out = type->name();
    if (!attrs.empty()) {
        out += '(';
        auto first = true;
        for (const auto& [name, value] : attrs) {
            if (!first) out += ", ";
            first = false;
            out += name + "=" + folio_cpp::to_string(value);
        }
        out += ')';
    }
    return out;
}

auto Mark::same_set(const MarkSet& a, const MarkSet& b) -> bool {
    return a == b;
}

auto Mark::set_from(MarkSet marks) -> MarkSet {
    if (marks.size() < 2) return marks;
    std::ranges::stable_sort(marks, [](const Mark& a, const Mark& b) {
        return a.type->rank() < b.type->rank();
    });
    return marks;
}

}  // namespace folio_cpp
