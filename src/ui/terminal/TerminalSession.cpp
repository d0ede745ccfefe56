#include "taskview/ui/terminal/TerminalSession.hpp"

#include <clocale>
#include <cstdio>
#include <termios.h>
#include <unistd.h>

#include "taskview/core/Logging.hpp"

#include <ncurses.h>

namespace taskview {
namespace ui {

namespace {
constexpr int EscapeDelayMs = 25;

void initColors()
{
    start_color();
    use_default_colors();
    init_pair(TextColor, COLOR_WHITE, -1);
    init_pair(AccentColor, COLOR_CYAN, -1);
    init_pair(SelectionColor, COLOR_WHITE, COLOR_BLUE);
    init_pair(WarningColor, COLOR_YELLOW, -1);
    init_pair(ErrorColor, COLOR_RED, -1);
    init_pair(DimColor, COLOR_BLUE, -1);
    init_pair(SuccessColor, COLOR_GREEN, -1);
}
} // namespace

struct TerminalSession::State
{
    termios original{};
    bool hasOriginal = false;
    SCREEN *screen = nullptr;
    bool colors = false;
    bool restored = false;
};

TerminalSession::TerminalSession()
    : m_state(std::make_unique<State>())
{
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &m_state->original) == 0) {
        m_state->hasOriginal = true;
    }
}

TerminalSession::~TerminalSession()
{
    restore();
}

bool TerminalSession::start()
{
    if (m_state->screen) {
        return true;
    }
    std::setlocale(LC_ALL, "");
    m_state->screen = newterm(nullptr, stdout, stdin);
    if (!m_state->screen) {
        qCCritical(lcUi) << "Could not initialize the terminal screen";
        return false;
    }
    set_term(m_state->screen);
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(EscapeDelayMs);
    curs_set(0);
    if (has_colors()) {
        initColors();
        m_state->colors = true;
    }
    m_state->restored = false;
    return true;
}

void TerminalSession::restore()
{
    if (m_state->restored) {
        return;
    }
    m_state->restored = true;

    if (m_state->screen) {
        endwin();
        delscreen(m_state->screen);
        m_state->screen = nullptr;
    }
    if (m_state->hasOriginal && tcsetattr(STDIN_FILENO, TCSADRAIN, &m_state->original) != 0) {
        qCWarning(lcUi) << "Could not fully restore terminal";
    }
}

bool TerminalSession::isActive() const
{
    return m_state->screen != nullptr;
}

bool TerminalSession::hasColors() const
{
    return m_state->colors;
}

} // namespace ui
} // namespace taskview
