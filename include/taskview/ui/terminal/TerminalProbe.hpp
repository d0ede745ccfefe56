#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <optional>

namespace taskview {
namespace ui {

constexpr int MinTerminalColumns = 80;
constexpr int MinTerminalRows = 24;

struct ProbeResult
{
    bool compatible = false;
    QString reason;
};

// Environment variables and TERM values that rule out an interactive session.
std::optional<QString> environmentProblem(const QProcessEnvironment &environment);
std::optional<QString> sizeProblem(int columns, int rows);

ProbeResult probeTerminal(const QProcessEnvironment &environment = QProcessEnvironment::systemEnvironment());

QString incompatibleTerminalHelp(const QString &reason);

} // namespace ui
} // namespace taskview
