#pragma once

#include <QString>

namespace taskview {
namespace core {

enum class ErrorKind
{
    SaveIo,
    Internal,
};

QString errorKindName(ErrorKind kind);

constexpr int DefaultMaxErrors = 10;

// Counts handled errors. Once the count reaches the limit the environment is
// considered unsafe and the application shuts down.
class ErrorBudget
{
public:
    explicit ErrorBudget(int maxErrors = DefaultMaxErrors);

    // Returns false once the budget is exhausted.
    bool record(ErrorKind kind, const QString &message);
    bool exhausted() const;
    int count() const;
    int maxErrors() const;

private:
    int m_count = 0;
    int m_maxErrors = DefaultMaxErrors;
};

} // namespace core
} // namespace taskview
