#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the library.

#include <cstdint>
#include <functional>
#include <string>

namespace latchkey::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., UserId and TokenId)
/// at compile time while keeping the same underlying representation.
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

// Tag types for strong IDs
struct UserIdTag {};
struct TokenIdTag {};

/// Opaque reference to a user account owned by the host application.
using UserId = StrongId<UserIdTag>;

/// Store-assigned identifier of a persisted remember-me record.
using TokenId = StrongId<TokenIdTag>;

/// User record as returned by the host's user lookup.
///
/// The library treats it as opaque: it is resolved during verification
/// and attached to the request, never inspected.
struct UserRecord {
    UserId id;
    std::string displayName;
    std::string email;
};

} // namespace latchkey::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<latchkey::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const latchkey::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
