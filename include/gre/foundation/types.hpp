#pragma once

/// @file types.hpp
/// @brief Strong identifier types.

#include <cstdint>
#include <functional>
#include <ostream>

namespace gre::foundation {

/// Integer identifier that only compares with identifiers of the same Tag.
///
/// Zero is reserved as "no id"; engines hand out ids starting at 1.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    using value_type = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

    friend std::ostream& operator<<(std::ostream& os, const StrongId& id) {
        return os << id.value_;
    }

private:
    T value_ = 0;
};

struct PlayerIdTag {};

/// Identifier of a competitor within one RatingEngine.
using PlayerId = StrongId<PlayerIdTag>;

} // namespace gre::foundation

template <typename Tag, typename T>
struct std::hash<gre::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const gre::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
