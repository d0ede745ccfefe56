#pragma once

#include <QString>
#include <string>

#include "taskview/ui/terminal/TerminalSession.hpp"

namespace taskview {
namespace ui {

// Sanitized, single-line text cut to the given number of terminal columns.
std::wstring fitToColumns(const QString &text, int columns);

// The typed character as text, or an empty string when it is not printable.
QString printableInput(unsigned int codePoint);

// All text reaches the screen through these two helpers.
void putText(int y, int x, int width, const QString &text, int colorPair = TextColor, bool bold = false);
void drawBox(int y, int x, int height, int width, const QString &title, int colorPair = TextColor);

} // namespace ui
} // namespace taskview
