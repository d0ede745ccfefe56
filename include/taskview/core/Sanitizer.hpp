#pragma once

#include <QJsonValue>
#include <QString>

namespace taskview {
namespace core {

constexpr int DefaultMaxTextLength = 1000;
constexpr int MaxTextLines = 50;
constexpr int MaxLineLength = 100;
constexpr int MinNumber = 0;
constexpr int MaxNumber = 1000;

extern const QLatin1String Ellipsis;

// Removes escape sequences and control characters, neutralizes separator and
// "other" code points and bounds the result to maxLength code points, 50 lines
// and 100 code points per line. Total and idempotent.
QString sanitize(const QString &raw, int maxLength = DefaultMaxTextLength);
QString sanitize(const QJsonValue &raw, int maxLength = DefaultMaxTextLength);

// Clamps to [MinNumber, MaxNumber]; anything non-numeric becomes 0.
int sanitizeNumber(const QJsonValue &raw);
int clampNumber(double value);

QString coerceToString(const QJsonValue &value);

// Cuts after maxCodePoints code points without splitting a surrogate pair.
QString truncateText(const QString &text, int maxCodePoints);
int codePointCount(const QString &text);

} // namespace core
} // namespace taskview
