#include "taskview/ui/terminal/TerminalProbe.hpp"

#include <QStringList>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace taskview {
namespace ui {

std::optional<QString> environmentProblem(const QProcessEnvironment &environment)
{
    static const QStringList embeddedHosts{
        QStringLiteral("CLAUDE_CODE"),
        QStringLiteral("VSCODE_INJECTION"),
        QStringLiteral("JUPYTER_KERNEL_ID"),
        QStringLiteral("COLAB_GPU"),
        QStringLiteral("REPLIT_ENVIRONMENT"),
    };
    for (const QString &variable : embeddedHosts) {
        if (!environment.value(variable).isEmpty()) {
            return QStringLiteral("Detected incompatible environment: %1").arg(variable);
        }
    }

    const QString term = environment.value(QStringLiteral("TERM"));
    if (term.isEmpty() || term == QLatin1String("dumb") || term == QLatin1String("unknown")
        || term.contains(QLatin1String("emacs"), Qt::CaseInsensitive)) {
        return QStringLiteral("Unsupported terminal type: %1").arg(term.isEmpty() ? QStringLiteral("none") : term);
    }
    return std::nullopt;
}

std::optional<QString> sizeProblem(int columns, int rows)
{
    if (columns < MinTerminalColumns || rows < MinTerminalRows) {
        return QStringLiteral("Terminal too small: %1x%2 (minimum %3x%4)")
            .arg(columns)
            .arg(rows)
            .arg(MinTerminalColumns)
            .arg(MinTerminalRows);
    }
    return std::nullopt;
}

ProbeResult probeTerminal(const QProcessEnvironment &environment)
{
    ProbeResult result;
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        result.reason = QStringLiteral("Not running in a TTY (terminal required)");
        return result;
    }
    if (const auto problem = environmentProblem(environment)) {
        result.reason = *problem;
        return result;
    }

    termios attributes{};
    if (tcgetattr(STDIN_FILENO, &attributes) != 0) {
        result.reason = QStringLiteral("Terminal does not support required operations");
        return result;
    }

    winsize size{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0) {
        result.reason = QStringLiteral("Cannot determine terminal size");
        return result;
    }
    if (const auto problem = sizeProblem(size.ws_col, size.ws_row)) {
        result.reason = *problem;
        return result;
    }

    result.compatible = true;
    result.reason = QStringLiteral("Terminal compatible");
    return result;
}

QString incompatibleTerminalHelp(const QString &reason)
{
    return QStringLiteral("Cannot launch task viewer: %1\n"
                          "\n"
                          "The task viewer requires a proper terminal environment.\n"
                          "Please run it from a real terminal, not from:\n"
                          "  - AI coding assistants or similar embedded shells\n"
                          "  - the VS Code integrated terminal (use an external terminal)\n"
                          "  - Jupyter notebooks\n"
                          "  - scripts with redirected output\n")
        .arg(reason);
}

} // namespace ui
} // namespace taskview
