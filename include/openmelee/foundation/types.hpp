#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the transport and matchmaking layers.

#include <compare>
#include <cstdint>
#include <functional>

namespace openmelee::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PeerIdTag {};

/// Transport-assigned identifier of a connected peer. Ids are handed out
/// in connection order and never reused within a process.
using PeerId = StrongId<PeerIdTag>;

} // namespace openmelee::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<openmelee::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const openmelee::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
