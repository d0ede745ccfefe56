#include "taskview/core/Sanitizer.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QStringList>
#include <QVector>
#include <cmath>

namespace taskview {
namespace core {

const QLatin1String Ellipsis("...");

namespace {
constexpr uint Escape = 0x1b;

const QRegularExpression &csiPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\x1b\\[.*?[a-zA-Z]"));
    return pattern;
}

// "\033[31m" or "\x1b[0m" typed out as plain text.
const QRegularExpression &textualCsiPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\\\(?:033|x1[bB])\\[.*?[a-zA-Z]"));
    return pattern;
}

const QRegularExpression &oscPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\x1b\\].*?\\x07"));
    return pattern;
}

const QRegularExpression &charsetPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\x1b[()][AB012]"));
    return pattern;
}

const QRegularExpression &integerPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^([+-]?)\\d+$"));
    return pattern;
}

bool isAllowedWhitespace(uint codePoint)
{
    return codePoint == ' ' || codePoint == '\n' || codePoint == '\t' || codePoint == '\r';
}

QString stripEscapeSequences(QString text)
{
    if (!text.contains(QChar(Escape)) && !text.contains(QLatin1Char('\\'))) {
        return text;
    }
    text.remove(csiPattern());
    text.remove(textualCsiPattern());
    text.remove(oscPattern());
    text.remove(charsetPattern());
    return text;
}

QString stripControlCharacters(const QString &text)
{
    QString result;
    result.reserve(text.size());
    for (const QChar ch : text) {
        const ushort unit = ch.unicode();
        if (unit >= 32 || unit == '\n' || unit == '\t' || unit == '\r') {
            result.append(ch);
        }
    }
    return result;
}

// Unpaired surrogates are kept as their own code unit value so the category
// check below catches them as Other_Surrogate.
QVector<uint> toCodePoints(const QString &text)
{
    QVector<uint> result;
    result.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch.isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            result.append(QChar::surrogateToUcs4(ch, text.at(i + 1)));
            ++i;
        } else {
            result.append(ch.unicode());
        }
    }
    return result;
}

QString fromCodePoints(const QVector<uint> &codePoints, int begin, int end)
{
    if (end <= begin) {
        return {};
    }
    return QString::fromUcs4(codePoints.constData() + begin, end - begin);
}

bool isUnsafeCategory(uint codePoint)
{
    switch (QChar::category(codePoint)) {
    case QChar::Separator_Space:
    case QChar::Separator_Line:
    case QChar::Separator_Paragraph:
    case QChar::Other_Control:
    case QChar::Other_Format:
    case QChar::Other_Surrogate:
    case QChar::Other_PrivateUse:
    case QChar::Other_NotAssigned:
        return true;
    default:
        return false;
    }
}

void truncateWithMarker(QVector<uint> &codePoints, int maxLength)
{
    if (codePoints.size() <= maxLength) {
        return;
    }
    if (maxLength <= Ellipsis.size()) {
        codePoints.resize(maxLength);
        return;
    }
    codePoints.resize(maxLength - Ellipsis.size());
    for (const char ch : Ellipsis) {
        codePoints.append(static_cast<uint>(ch));
    }
}
} // namespace

QString sanitize(const QString &raw, int maxLength)
{
    if (maxLength <= 0 || raw.isEmpty()) {
        return {};
    }

    QString text = raw;
    for (;;) {
        const QString stripped = stripControlCharacters(stripEscapeSequences(text));
        if (stripped == text) {
            break;
        }
        text = stripped;
    }

    QVector<uint> codePoints = toCodePoints(text);
    for (uint &codePoint : codePoints) {
        if (!isAllowedWhitespace(codePoint) && isUnsafeCategory(codePoint)) {
            codePoint = '?';
        }
    }

    truncateWithMarker(codePoints, maxLength);

    QStringList lines;
    int lineStart = 0;
    for (int i = 0; i <= codePoints.size() && lines.size() < MaxTextLines; ++i) {
        if (i < codePoints.size() && codePoints.at(i) != '\n') {
            continue;
        }
        QVector<uint> line = codePoints.mid(lineStart, i - lineStart);
        truncateWithMarker(line, MaxLineLength);
        lines << fromCodePoints(line, 0, line.size());
        lineStart = i + 1;
    }
    return lines.join(QLatin1Char('\n'));
}

QString sanitize(const QJsonValue &raw, int maxLength)
{
    return sanitize(coerceToString(raw), maxLength);
}

QString coerceToString(const QJsonValue &value)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: {
        const double number = value.toDouble();
        if (std::isfinite(number) && number == std::trunc(number) && std::fabs(number) < 1e15) {
            return QString::number(static_cast<qint64>(number));
        }
        return QString::number(number, 'g', 15);
    }
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    case QJsonValue::Null:
    case QJsonValue::Undefined:
        break;
    }
    return {};
}

int clampNumber(double value)
{
    if (!std::isfinite(value) || value <= MinNumber) {
        return MinNumber;
    }
    if (value >= MaxNumber) {
        return MaxNumber;
    }
    return static_cast<int>(std::trunc(value));
}

int sanitizeNumber(const QJsonValue &raw)
{
    switch (raw.type()) {
    case QJsonValue::Double:
        return clampNumber(raw.toDouble());
    case QJsonValue::Bool:
        return raw.toBool() ? 1 : 0;
    case QJsonValue::String: {
        const QString text = raw.toString().trimmed();
        const auto match = integerPattern().match(text);
        if (!match.hasMatch()) {
            return 0;
        }
        bool ok = false;
        const qlonglong number = text.toLongLong(&ok);
        if (!ok) {
            // More digits than fit in 64 bits; only the sign matters for the clamp.
            return match.captured(1) == QLatin1String("-") ? MinNumber : MaxNumber;
        }
        return clampNumber(static_cast<double>(number));
    }
    default:
        return 0;
    }
}

QString truncateText(const QString &text, int maxCodePoints)
{
    if (maxCodePoints <= 0) {
        return {};
    }
    int count = 0;
    for (int i = 0; i < text.size(); ++i) {
        if (count == maxCodePoints) {
            return text.left(i);
        }
        if (text.at(i).isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            ++i;
        }
        ++count;
    }
    return text;
}

int codePointCount(const QString &text)
{
    return toCodePoints(text).size();
}

} // namespace core
} // namespace taskview
