#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace WC {

// Generation-checked handle into the WidgetTree arena. A destroyed widget's
// handle never becomes valid again because its slot generation is bumped.
struct WidgetId {
    std::uint32_t index      = 0;
    std::uint32_t generation = 0; // 0 is never issued by the tree

    [[nodiscard]] constexpr auto valid() const -> bool {
        return generation != 0;
    }

    constexpr auto operator==(WidgetId const&) const -> bool  = default;
    constexpr auto operator<=>(WidgetId const&) const         = default;
};

inline auto operator<<(std::ostream& os, WidgetId const& id) -> std::ostream& {
    return os << "widget#" << id.index << "." << id.generation;
}

} // namespace WC

template <>
struct std::hash<WC::WidgetId> {
    auto operator()(WC::WidgetId const& id) const noexcept -> std::size_t {
        auto const packed = (static_cast<std::uint64_t>(id.generation) << 32) | id.index;
        return std::hash<std::uint64_t>{}(packed);
    }
};
