#pragma once
// include/nooku/session/SessionId.hpp

#include <cstdint>
#include <string>

namespace nooku::session {

// Arena index + generation. A stale id (slot reused or freed) never resolves.
struct SessionId
{
    std::uint32_t index = 0;
    std::uint32_t generation = 0; // 0 = invalid

    [[nodiscard]] bool Valid() const noexcept { return generation != 0; }
    [[nodiscard]] std::string ToString() const
    {
        return std::to_string(index) + "#" + std::to_string(generation);
    }

    friend bool operator==(const SessionId&, const SessionId&) = default;
};

} // namespace nooku::session
