// /////////////////////////////////////////////////////////////////////////////
/// @file IReplayHost.hpp
/// @brief Notifications the controller sends to the host UI and storage.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/timeline/Frame.hpp>
#include <rwd/core/Types.hpp>

#include <string>
#include <string_view>

namespace rwd::engine {

/// @brief Figures reported with every completed replay.
struct ReplayStats
{
    core::usize stepCount{0};   ///< Frames in the sequence.
    core::usize codeLength{0};  ///< Script characters excluding whitespace and comments.
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IReplayHost
/// @brief Host UI listener (board redraw, modals, error reporting).
///
/// Success/failure classification of a finished replay belongs to the host:
/// it inspects the final frame against the level objective.
// /////////////////////////////////////////////////////////////////////////////
class IReplayHost
{
public:
    virtual ~IReplayHost() = default;

    /// @brief A frame was emitted (board redraw).
    virtual void onFrame(core::usize index, const timeline::Frame& frame) = 0;

    /// @brief Replay reached the last frame. @p finalFrame is null for an empty run.
    virtual void onReplayDone(std::string_view script,
                              const timeline::Frame* finalFrame,
                              const ReplayStats& stats) = 0;

    /// @brief The interpreter failed without a usable source position.
    virtual void onScriptError(std::string_view script, std::string_view message) = 0;

    /// @brief The learner cancelled; @p script is the in-progress text.
    virtual void onCancel(std::string_view script) { (void)script; }
};

// /////////////////////////////////////////////////////////////////////////////
/// @class IPersistence
/// @brief Out-of-band script saving. The engine only ever writes.
// /////////////////////////////////////////////////////////////////////////////
class IPersistence
{
public:
    virtual ~IPersistence() = default;

    virtual void saveScript(std::string_view contextId, std::string_view script) = 0;
};

} // namespace rwd::engine
