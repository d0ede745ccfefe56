#pragma once

#include <memory>

namespace taskview {
namespace ui {

enum ColorPair
{
    TextColor = 1,
    AccentColor,
    SelectionColor,
    WarningColor,
    ErrorColor,
    DimColor,
    SuccessColor,
};

// Owns the curses screen and the terminal mode that was active before it.
// restore() runs at most once, whichever exit path gets there first.
class TerminalSession
{
public:
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    bool start();
    void restore();
    bool isActive() const;
    bool hasColors() const;

private:
    struct State;
    std::unique_ptr<State> m_state;
};

} // namespace ui
} // namespace taskview
