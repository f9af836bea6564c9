#pragma once

#include <QString>
#include <optional>

#include "vical/core/ViewSnapshot.hpp"
#include "vical/input/Key.hpp"

namespace vical {
namespace ui {

/*
 * Owns the curses screen for its lifetime: the constructor switches the
 * terminal to raw mode and the destructor restores it.
 */
class TerminalView
{
public:
    explicit TerminalView(bool dimCompleted = true);
    ~TerminalView();

    TerminalView(const TerminalView &) = delete;
    TerminalView &operator=(const TerminalView &) = delete;

    // Blocks until a key is available. Empty once the input is closed.
    std::optional<input::Key> readKey();
    void render(const core::ViewSnapshot &view);

private:
    void drawTitle(const core::ViewSnapshot &view);
    void drawGrid(const core::ViewSnapshot &view);
    void drawLegend(const core::ViewSnapshot &view);
    void drawTaskList(const core::ViewSnapshot &view);
    void drawStatusLine(const core::ViewSnapshot &view);
    void drawStatusMessage(int row, const core::StatusMessage &status, int maxWidth = -1);
    void print(int row, int column, const QString &text, int maxWidth = -1);

    bool m_dimCompleted = true;
    bool m_hasColors = false;
};

} // namespace ui
} // namespace vical
