module;
#include <QString>

#include <exception>
#include <stdexcept>

module ferry.core.errors;

namespace ferry {

LoadError::LoadError(const QString& message)
    : std::runtime_error(message.toStdString()),
    m_message(message)
{
}

HttpError::HttpError(int status, const QString& message)
    : LoadError(message),
    m_status(status)
{
}

QString describeError(const std::exception_ptr& error)
{
    if (!error) return {};
    try {
        std::rethrow_exception(error);
    } catch (const LoadError& e) {
        return e.message();
    } catch (const std::exception& e) {
        return QString::fromUtf8(e.what());
    } catch (...) {
        return QStringLiteral("unknown error");
    }
}

bool isAbortError(const std::exception_ptr& error)
{
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const AbortError&) {
        return true;
    } catch (...) {
        return false;
    }
}

bool isRetryableError(const std::exception_ptr& error)
{
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const AbortError&) {
        return false;
    } catch (const UsageError&) {
        return false;
    } catch (...) {
        return true;
    }
}

} // namespace ferry
