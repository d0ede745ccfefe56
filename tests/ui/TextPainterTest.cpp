#include <QtTest/QtTest>

#include <string>

#include "taskview/ui/terminal/TextPainter.hpp"

using namespace taskview::ui;

class TextPainterTest : public QObject
{
    Q_OBJECT

private slots:
    void wideRowKeepsFullWidth();
    void longTextFillsColumns();
    void stripsEscapesAndNewlines();
    void nonPositiveWidthIsEmpty();
    void printableInputFiltersControls();
};

void TextPainterTest::wideRowKeepsFullWidth()
{
    const std::wstring line = fitToColumns(QString(150, QLatin1Char(' ')), 150);
    QVERIFY(line == std::wstring(150, L' '));
    QVERIFY(line.find(L"...") == std::wstring::npos);
}

void TextPainterTest::longTextFillsColumns()
{
    const std::wstring line = fitToColumns(QString(250, QLatin1Char('x')), 200);
    QVERIFY(line == std::wstring(200, L'x'));

    const std::wstring narrow = fitToColumns(QStringLiteral("abcdef"), 3);
    QVERIFY(narrow == std::wstring(L"abc"));
}

void TextPainterTest::stripsEscapesAndNewlines()
{
    const std::wstring line = fitToColumns(QStringLiteral("\x1b[31mred\ntext"), 40);
    QVERIFY(line == std::wstring(L"red text"));

    const std::wstring split = fitToColumns(QString(96, QLatin1Char('a')) + QStringLiteral("\x1b[1mbold"), 200);
    QVERIFY(split.find(L'\x1b') == std::wstring::npos);
    QVERIFY(split.size() >= 100);
}

void TextPainterTest::nonPositiveWidthIsEmpty()
{
    QVERIFY(fitToColumns(QStringLiteral("text"), 0).empty());
    QVERIFY(fitToColumns(QStringLiteral("text"), -4).empty());
}

void TextPainterTest::printableInputFiltersControls()
{
    QCOMPARE(printableInput('a'), QStringLiteral("a"));
    QVERIFY(printableInput(0x1b).isEmpty());
    QVERIFY(printableInput('\n').isEmpty());
    QVERIFY(printableInput(0x200b).isEmpty());
    QVERIFY(printableInput(0x110000).isEmpty());
}

QTEST_GUILESS_MAIN(TextPainterTest)
#include "TextPainterTest.moc"
