// /////////////////////////////////////////////////////////////////////////////
/// @file IInterpreter.hpp
/// @brief Black-box script interpreter contract.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/FrameSequence.hpp>
#include <rwd/diagnostics/ScriptError.hpp>

#include <expected>
#include <string_view>

namespace rwd::engine {

/// @brief Outcome of one interpreter invocation.
using RunResult = std::expected<timeline::FrameSequence, diagnostics::ScriptError>;

// /////////////////////////////////////////////////////////////////////////////
/// @class IInterpreter
/// @brief Runs a script to completion against a fresh simulation.
///
/// The call is synchronous. The controller calls reset() before every run,
/// so no simulation state leaks from one run into the next.
// /////////////////////////////////////////////////////////////////////////////
class IInterpreter
{
public:
    virtual ~IInterpreter() = default;

    /// @brief Discard the simulation left over from the previous run.
    virtual void reset() = 0;

    /// @param script    Full script text.
    /// @param contextId Level or example identifier.
    [[nodiscard]] virtual RunResult run(std::string_view script, std::string_view contextId) = 0;
};

} // namespace rwd::engine
