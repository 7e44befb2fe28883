#include "core/types.hpp"

#include <type_traits>

// Value types are header-only; this unit pins their layout guarantees.

namespace lantern {

static_assert(sizeof(Uuid) == Uuid::BYTE_SIZE, "Uuid must stay 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");

} // namespace lantern
