#pragma once

#include <cstdint>
#include <limits>
#include <compare>

namespace prism::core {

template <typename Tag>
struct Handle {
    uint32_t id = std::numeric_limits<uint32_t>::max();

    constexpr bool isValid() const { return id != std::numeric_limits<uint32_t>::max(); }
    constexpr void invalidate() { id = std::numeric_limits<uint32_t>::max(); }

    auto operator<=>(const Handle&) const = default;
    explicit operator bool() const { return isValid(); }
};

struct MaterialTag {};

} // namespace prism::core

using MaterialHandle = prism::core::Handle<prism::core::MaterialTag>;

inline constexpr MaterialHandle INVALID_MATERIAL_HANDLE{};
