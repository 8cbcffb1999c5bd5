// /////////////////////////////////////////////////////////////////////////////
/// @file GridInterpreter.hpp
/// @brief Toy grid-world interpreter used by the demo host.
///
/// Understands one call per statement: move_up/down/left/right(n) and
/// wait(n), with "//" comments. Every unit of movement produces one frame.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/engine/IInterpreter.hpp>
#include <rwd/core/Types.hpp>

#include <vector>

namespace rwd::demo {

inline constexpr core::i32 kBoardWidth  = 12;
inline constexpr core::i32 kBoardHeight = 8;

/// @brief World state serialised into each frame.
struct GridState
{
    core::i32 x{0};
    core::i32 y{0};
    core::i32 fuel{0};
};

class GridInterpreter final : public engine::IInterpreter
{
public:
    /// @param fuel Steps available before the rover stalls.
    explicit GridInterpreter(core::i32 fuel);

    void reset() override;
    [[nodiscard]] engine::RunResult run(std::string_view script, std::string_view contextId) override;

private:
    core::i32 initialFuel_;
    GridState state_;
    std::vector<timeline::Frame> frames_;
};

} // namespace rwd::demo
