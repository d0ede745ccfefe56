#include "taskview/core/ErrorBudget.hpp"

#include "taskview/core/Logging.hpp"

namespace taskview {
namespace core {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::SaveIo:
        return QStringLiteral("save");
    case ErrorKind::Internal:
        return QStringLiteral("internal");
    }
    return QStringLiteral("unknown");
}

ErrorBudget::ErrorBudget(int maxErrors)
    : m_maxErrors(maxErrors > 0 ? maxErrors : DefaultMaxErrors)
{
}

bool ErrorBudget::record(ErrorKind kind, const QString &message)
{
    ++m_count;
    qCWarning(lcApp).noquote() << "Error" << m_count << QStringLiteral("(%1):").arg(errorKindName(kind)) << message;
    if (exhausted()) {
        qCCritical(lcApp) << "Too many errors, exiting safely";
        return false;
    }
    return true;
}

bool ErrorBudget::exhausted() const
{
    return m_count >= m_maxErrors;
}

int ErrorBudget::count() const
{
    return m_count;
}

int ErrorBudget::maxErrors() const
{
    return m_maxErrors;
}

} // namespace core
} // namespace taskview
