#include <folio-cpp/mapping.hpp>
#include <folio-cpp/error.hpp>

#include <cassert>
#include <string>

namespace folio_cpp {

namespace {

constexpr std::uint64_t lower16 = 0xffff;
constexpr std::uint64_t factor16 = 0x10000;

auto make_recover(std::size_t index, std::size_t offset) -> std::uint64_t {
    return index + offset * factor16;
}

auto recover_index(std::uint64_t value) -> std::size_t {
    return static_cast<std::size_t>(value & lower16);
}

auto recover_offset(std::uint64_t value) -> std::size_t {
    return static_cast<std::size_t>((value - (value & lower16)) / factor16);
}

auto signed_size(std::size_t n) -> std::int64_t {
    return static_cast<std::int64_t>(n);
}

void check_ranges(const std::vector<StepMap::Range>& ranges) {
    auto end = std::size_t{0};
    for (const auto& r : ranges) {
        if (r.start < end) {
            throw Exception{ErrorKind::invalid_position,
                            "Step map range at " + std::to_string(r.start) + " overlaps or precedes the range before it"};
        }
        end = r.start + r.old_size;
    }
}

}  // namespace

// -- StepMap ------------------------------------------------------------------

StepMap::StepMap(std::initializer_list<Range> ranges) : ranges_{ranges} {
    check_ranges(ranges_);
}

StepMap::StepMap(std::vector<Range> ranges, bool inverted)
    : ranges_{std::move(ranges)}, inverted_{inverted} {
    check_ranges(ranges_);
}

auto StepMap::offset(std::int64_t n) -> StepMap {
    if (n == 0) return StepMap{};
    if (n < 0) return StepMap{{0, static_cast<std::size_t>(-n), 0}};
    return StepMap{{0, 0, static_cast<std::size_t>(n)}};
}

auto StepMap::recover(std::uint64_t value) const -> std::size_t {
    auto diff = std::int64_t{0};
    auto index = recover_index(value);
    assert(index < ranges_.size() && "recover token does not belong to this map");
    if (!inverted_) {
        for (std::size_t i = 0; i < index; ++i) {
            diff += signed_size(ranges_[i].new_size) - signed_size(ranges_[i].old_size);
        }
    }
    return static_cast<std::size_t>(signed_size(ranges_[index].start) + diff
                                    + signed_size(recover_offset(value)));
}

auto StepMap::map(std::size_t pos, int assoc) const -> std::size_t {
    return map_impl(pos, assoc, true).pos;
}

auto StepMap::map_result(std::size_t pos, int assoc) const -> MapResult {
    return map_impl(pos, assoc, false);
}

auto StepMap::map_impl(std::size_t pos, int assoc, bool simple) const -> MapResult {
    auto diff = std::int64_t{0};
    auto p = signed_size(pos);
    for (std::size_t i = 0; i < ranges_.size(); ++i) {
        const auto& range = ranges_[i];
        auto start = signed_size(range.start) - (inverted_ ? diff : 0);
        if (start > p) break;
        auto old_size = signed_size(inverted_ ? range.new_size : range.old_size);
        auto new_size = signed_size(inverted_ ? range.old_size : range.new_size);
        auto end = start + old_size;
        if (p <= end) {
            auto side = old_size == 0 ? assoc : p == start ? -1 : p == end ? 1 : assoc;
            auto result = static_cast<std::size_t>(start + diff + (side < 0 ? 0 : new_size));
            if (simple) return MapResult{result};
            auto recover = p == (assoc < 0 ? start : end)
                ? std::optional<std::uint64_t>{}
                : std::optional<std::uint64_t>{make_recover(i, static_cast<std::size_t>(p - start))};
            auto info = p == start ? del::after : p == end ? del::before : del::across;
            if (assoc < 0 ? p != start : p != end) info |= del::side;
            return MapResult{result, info, recover};
        }
        diff += new_size - old_size;
    }
    return MapResult{static_cast<std::size_t>(p + diff)};
}

auto StepMap::touches(std::size_t pos, std::uint64_t recover) const -> bool {
    auto diff = std::int64_t{0};
    auto index = recover_index(recover);
    auto p = signed_size(pos);
    for (std::size_t i = 0; i < ranges_.size(); ++i) {
        const auto& range = ranges_[i];
        auto start = signed_size(range.start) - (inverted_ ? diff : 0);
        if (start > p) break;
        auto old_size = signed_size(inverted_ ? range.new_size : range.old_size);
        auto new_size = signed_size(inverted_ ? range.old_size : range.new_size);
        if (p <= start + old_size && i == index) return true;
        diff += new_size - old_size;
    }
    return false;
}

void StepMap::for_each(
    const std::function<void(std::size_t, std::size_t, std::size_t, std::size_t)>& f) const {
    auto diff = std::int64_t{0};
    for (const auto& range : ranges_) {
        auto start = signed_size(range.start);
        auto old_start = static_cast<std::size_t>(start - (inverted_ ? diff : 0));
        auto new_start = static_cast<std::size_t>(start + (inverted_ ? 0 : diff));
        auto old_size = inverted_ ? range.new_size : range.old_size;
        auto new_size = inverted_ ? range.old_size : range.new_size;
        f(old_start, old_start + old_size, new_start, new_start + new_size);
        diff += signed_size(new_size) - signed_size(old_size);
    }
}

auto StepMap::invert() const -> StepMap {
    return StepMap{ranges_, !inverted_};
}

auto StepMap::to_string() const -> std::string {
    auto out = std::string{inverted_ ? "-(" : "("};
    for (std::size_t i = 0; i < ranges_.size(); ++i) {
        if (i) out += ", ";
        out += std::to_string(ranges_[i].start) + ":" + std::to_string(ranges_[i].old_size) + "->"
             + std::to_string(ranges_[i].new_size);
    }
    return out + ")";
}

// -- Mapping ------------------------------------------------------------------

Mapping::Mapping(std::vector<StepMap> maps) : maps_{std::move(maps)} {}

auto Mapping::slice(std::size_t from, std::size_t to) const -> Mapping {
    if (from > to || to > maps_.size()) {
        throw Exception{ErrorKind::invalid_position,
                        "Mapping slice " + std::to_string(from) + "-" + std::to_string(to)
                            + " outside of " + std::to_string(maps_.size()) + " maps"};
    }
    auto result = Mapping{std::vector<StepMap>(maps_.begin() + static_cast<std::ptrdiff_t>(from),
                                               maps_.begin() + static_cast<std::ptrdiff_t>(to))};
    for (const auto& [a, b] : mirror_) {
        if (a >= from && a < to && b >= from && b < to) {
            result.mirror_.emplace_back(a - from, b - from);
        }
    }
    return result;
}

void Mapping::append_map(StepMap map, std::optional<std::size_t> mirrors) {
    maps_.push_back(std::move(map));
    if (mirrors) set_mirror(maps_.size() - 1, *mirrors);
}

void Mapping::append_mapping(const Mapping& other) {
    auto start_size = maps_.size();
    for (std::size_t i = 0; i < other.maps_.size(); ++i) {
        auto mirr = other.get_mirror(i);
        append_map(other.maps_[i], mirr && *mirr < i ? std::optional{start_size + *mirr} : std::nullopt);
    }
}

void Mapping::append_mapping_inverted(const Mapping& other) {
    auto total_size = maps_.size() + other.maps_.size();
    for (auto i = other.maps_.size(); i-- > 0;) {
        auto mirr = other.get_mirror(i);
        append_map(other.maps_[i].invert(),
                   mirr && *mirr > i ? std::optional{total_size - *mirr - 1} : std::nullopt);
    }
}

auto Mapping::get_mirror(std::size_t n) const -> std::optional<std::size_t> {
    for (const auto& [a, b] : mirror_) {
        if (a == n) return b;
        if (b == n) return a;
    }
    return std::nullopt;
}

void Mapping::set_mirror(std::size_t n, std::size_t m) {
    mirror_.emplace_back(n, m);
}

auto Mapping::invert() const -> Mapping {
    auto inverse = Mapping{};
    inverse.append_mapping_inverted(*this);
    return inverse;
}

auto Mapping::map(std::size_t pos, int assoc) const -> std::size_t {
    return map_impl(pos, assoc, true).pos;
}

auto Mapping::map_result(std::size_t pos, int assoc) const -> MapResult {
    return map_impl(pos, assoc, false);
}

auto Mapping::map_impl(std::size_t pos, int assoc, bool simple) const -> MapResult {
    auto del_info = std::uint8_t{0};
    for (std::size_t i = 0; i < maps_.size(); ++i) {
        auto result = maps_[i].map_result(pos, assoc);
        if (result.recover) {
            auto corr = get_mirror(i);
            if (corr && *corr > i && *corr < maps_.size()) {
                i = *corr;
                pos = maps_[*corr].recover(*result.recover);
                continue;
            }
        }
        if (!simple) del_info |= result.del_info;
        pos = result.pos;
    }
    return MapResult{pos, del_info};
}

}  // namespace folio_cpp
