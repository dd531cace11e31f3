/// @file mapping.hpp
/// @brief Position mapping: StepMap, Mapping, and MapResult.
///
/// A StepMap records the ranges one step replaced. A Mapping chains
/// step maps and can mark pairs of maps as mirrors of each other, so
/// that positions inside content deleted and then restored map back to
/// where they were.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace folio_cpp {

/// Deletion flags reported by MapResult.
namespace del {
inline constexpr std::uint8_t before = 1;  ///< Content directly before the position was deleted.
inline constexpr std::uint8_t after = 2;   ///< Content directly after the position was deleted.
inline constexpr std::uint8_t across = 4;  ///< The position was inside a deleted range.
inline constexpr std::uint8_t side = 8;    ///< The token on the bias side was deleted.
}  // namespace del

/// The result of mapping one position.
struct MapResult {
    std::size_t pos{0};                  ///< The mapped position.
    std::uint8_t del_info{0};            ///< Bitmask of del:: flags.
    std::optional<std::uint64_t> recover;  ///< Token to recover the position through a mirror.

    /// The token on the bias side of the position was deleted.
    auto deleted() const -> bool { return (del_info & del::side) != 0; }
    /// The token before the position was deleted.
    auto deleted_before() const -> bool { return (del_info & (del::before | del::across)) != 0; }
    /// The token after the position was deleted.
    auto deleted_after() const -> bool { return (del_info & (del::after | del::across)) != 0; }
    /// The position was strictly inside a deleted range.
    auto deleted_across() const -> bool { return (del_info & del::across) != 0; }
};

/// Anything that can map positions: a StepMap or a Mapping.
class Mappable {
public:
    virtual ~Mappable() = default;

    /// Map a position. `assoc` < 0 sticks to content before it,
    /// otherwise to content after it.
    virtual auto map(std::size_t pos, int assoc = 1) const -> std::size_t = 0;
    virtual auto map_result(std::size_t pos, int assoc = 1) const -> MapResult = 0;
};

// -- StepMap ------------------------------------------------------------------

/// The replaced ranges of a single step, in ascending order of start.
class StepMap : public Mappable {
public:
    /// One replaced range: `old_size` tokens at `start` became `new_size` tokens.
    struct Range {
        std::size_t start;
        std::size_t old_size;
        std::size_t new_size;

        auto operator==(const Range&) const -> bool = default;
    };

    StepMap() = default;
    /// Throws invalid_position unless the ranges are sorted by start and
    /// do not overlap.
    StepMap(std::initializer_list<Range> ranges);
    explicit StepMap(std::vector<Range> ranges, bool inverted = false);

    /// A map that shifts everything from the start by `n` (negative
    /// deletes, positive inserts).
    static auto offset(std::int64_t n) -> StepMap;

    static auto empty() -> StepMap { return {}; }

    auto ranges() const -> const std::vector<Range>& { return ranges_; }
    auto inverted() const -> bool { return inverted_; }
    auto is_empty() const -> bool { return ranges_.empty(); }

    auto map(std::size_t pos, int assoc = 1) const -> std::size_t override;
    auto map_result(std::size_t pos, int assoc = 1) const -> MapResult override;

    /// Map the position identified by a recover token.
    auto recover(std::uint64_t value) const -> std::size_t;

    /// Whether `pos` lies in a range whose recover token matches.
    auto touches(std::size_t pos, std::uint64_t recover) const -> bool;

    /// Call `f(old_start, old_end, new_start, new_end)` for each range.
    void for_each(const std::function<void(std::size_t, std::size_t, std::size_t, std::size_t)>& f) const;

    /// The map that undoes this one.
    auto invert() const -> StepMap;

    auto to_string() const -> std::string;

    auto operator==(const StepMap& other) const -> bool {
        return ranges_ == other.ranges_ && inverted_ == other.inverted_;
    }

private:
    auto map_impl(std::size_t pos, int assoc, bool simple) const -> MapResult;

    std::vector<Range> ranges_;
    bool inverted_{false};
};

// -- Mapping ------------------------------------------------------------------

/// A sequence of step maps, optionally with mirror pairs.
class Mapping : public Mappable {
public:
    Mapping() = default;
    explicit Mapping(std::vector<StepMap> maps);

    auto maps() const -> const std::vector<StepMap>& { return maps_; }
    auto size() const -> std::size_t { return maps_.size(); }

    /// The index pairs recorded as mirrors.
    auto mirrors() const -> const std::vector<std::pair<std::size_t, std::size_t>>& { return mirror_; }

    /// A mapping over the maps in [from, to), keeping mirrors inside it.
    /// Throws invalid_position when the range is not within the mapping.
    auto slice(std::size_t from, std::size_t to) const -> Mapping;
    auto slice(std::size_t from = 0) const -> Mapping { return slice(from, maps_.size()); }

    /// Add a map, optionally naming the index of the map it mirrors.
    void append_map(StepMap map, std::optional<std::size_t> mirrors = std::nullopt);

    /// Append every map of another mapping, keeping its mirrors.
    void append_mapping(const Mapping& other);

    /// Append the inverse of another mapping.
    void append_mapping_inverted(const Mapping& other);

    /// The mirror of the map at index `n`, if any.
    auto get_mirror(std::size_t n) const -> std::optional<std::size_t>;

    /// Record that the maps at `n` and `m` undo each other.
    void set_mirror(std::size_t n, std::size_t m);

    /// A mapping that undoes this one.
    auto invert() const -> Mapping;

    auto map(std::size_t pos, int assoc = 1) const -> std::size_t override;
    auto map_result(std::size_t pos, int assoc = 1) const -> MapResult override;

private:
    auto map_impl(std::size_t pos, int assoc, bool simple) const -> MapResult;

    std::vector<StepMap> maps_;
    std::vector<std::pair<std::size_t, std::size_t>> mirror_;
};

}  // namespace folio_cpp
