#include "taskview/ui/terminal/TextPainter.hpp"

#include <algorithm>
#include <cwchar>

#include "taskview/core/Sanitizer.hpp"

#include <ncurses.h>

namespace taskview {
namespace ui {

std::wstring fitToColumns(const QString &text, int columns)
{
    if (columns <= 0) {
        return {};
    }
    QString flat = text;
    flat.replace(QLatin1Char('\n'), QLatin1Char(' '));
    flat.replace(QLatin1Char('\r'), QLatin1Char(' '));
    flat.replace(QLatin1Char('\t'), QLatin1Char(' '));
    // The sanitizer caps lines at 100 code points; wider rows are cleaned in pieces.
    const int chunkLength = core::MaxLineLength - core::Ellipsis.size();
    QString rest = core::truncateText(flat, std::max(columns, core::DefaultMaxTextLength));
    QString cleaned;
    while (!rest.isEmpty()) {
        const QString chunk = core::truncateText(rest, chunkLength);
        cleaned += core::sanitize(chunk, chunkLength);
        rest.remove(0, chunk.size());
    }
    const std::wstring safe = cleaned.toStdWString();

    std::wstring result;
    int used = 0;
    for (wchar_t ch : safe) {
        int width = ::wcwidth(ch);
        if (width < 0) {
            ch = L'?';
            width = 1;
        }
        if (used + width > columns) {
            break;
        }
        result.push_back(ch);
        used += width;
    }
    return result;
}

QString printableInput(unsigned int codePoint)
{
    if (codePoint < 32 || codePoint > 0x10ffff) {
        return {};
    }
    const uint value = codePoint;
    const QString character = QString::fromUcs4(&value, 1);
    // Anything the sanitizer would alter is not printable.
    if (core::sanitize(character) != character) {
        return {};
    }
    return character;
}

void putText(int y, int x, int width, const QString &text, int colorPair, bool bold)
{
    if (width <= 0) {
        return;
    }
    const std::wstring line = fitToColumns(text, width);
    attr_t attributes = COLOR_PAIR(colorPair);
    if (bold) {
        attributes |= A_BOLD;
    }
    attron(attributes);
    mvaddnwstr(y, x, line.c_str(), static_cast<int>(line.size()));
    attroff(attributes);
}

void drawBox(int y, int x, int height, int width, const QString &title, int colorPair)
{
    if (height < 3 || width < 4) {
        return;
    }
    attron(COLOR_PAIR(colorPair));
    mvhline(y, x + 1, ACS_HLINE, width - 2);
    mvhline(y + height - 1, x + 1, ACS_HLINE, width - 2);
    mvvline(y + 1, x, ACS_VLINE, height - 2);
    mvvline(y + 1, x + width - 1, ACS_VLINE, height - 2);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + width - 1, ACS_URCORNER);
    mvaddch(y + height - 1, x, ACS_LLCORNER);
    mvaddch(y + height - 1, x + width - 1, ACS_LRCORNER);
    attroff(COLOR_PAIR(colorPair));

    if (!title.isEmpty() && width > 8) {
        putText(y, x + 2, width - 4, QLatin1Char(' ') + title + QLatin1Char(' '), colorPair, true);
    }
}

} // namespace ui
} // namespace taskview
