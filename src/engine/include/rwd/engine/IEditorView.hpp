// /////////////////////////////////////////////////////////////////////////////
/// @file IEditorView.hpp
/// @brief Capability interface over the host's text editing widget.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/diagnostics/IDocumentLayout.hpp>
#include <rwd/diagnostics/TextRange.hpp>
#include <rwd/core/Types.hpp>

#include <optional>
#include <string>

namespace rwd::engine {

// /////////////////////////////////////////////////////////////////////////////
/// @class IEditorView
/// @brief Document layout plus the mutations the controller needs.
// /////////////////////////////////////////////////////////////////////////////
class IEditorView : public diagnostics::IDocumentLayout
{
public:
    ~IEditorView() override = default;

    /// @brief Current script text.
    [[nodiscard]] virtual std::string text() const = 0;

    /// @brief Replace the whole script text.
    virtual void replaceText(std::string text) = 0;

    /// @brief Highlight the 1-based active line, or clear it with nullopt.
    virtual void setHighlight(std::optional<core::u32> line) = 0;

    /// @brief Show an inline diagnostic, or clear it with nullopt.
    virtual void setDiagnostic(std::optional<diagnostics::TextRange> range) = 0;

    /// @brief Toggle user editing (read-only while a replay is active).
    virtual void setEditable(bool editable) = 0;
};

} // namespace rwd::engine
