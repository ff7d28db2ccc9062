module;
#include <QRandomGenerator>
#include <QString>
#include <QtGlobal>

#include <climits>
#include <cmath>
#include <memory>
#include <utility>

module ferry.core.retry;

namespace ferry {

namespace {
constexpr double kBaseDelayMs = 500.0;
constexpr double kMinDelayMs = 50.0;
}

int exponentialBackoff(int attemptIndex)
{
    // 500 ms, 1000 ms, 2000 ms, ... scaled by jitter so simultaneous failures spread out
    const double jitter = QRandomGenerator::global()->generateDouble();
    const double delay = std::ldexp(kBaseDelayMs, qMax(0, attemptIndex)) * jitter + kMinDelayMs;
    if (delay >= static_cast<double>(INT_MAX)) return INT_MAX;
    return static_cast<int>(delay);
}

Retry::Retry(const QString& description, RetryPolicy policy)
    : m_description(description),
    m_policy(std::move(policy)),
    m_state(std::make_shared<detail::RetryState>())
{
    if (m_policy.maxAttempts < 1) m_policy.maxAttempts = 1;
}

void Retry::abort()
{
    m_state->aborted = true;
}

bool Retry::isAborted() const
{
    return m_state->aborted;
}

int Retry::attempts() const
{
    return m_state->attempt;
}

void Retry::setDescription(const QString& description)
{
    m_description = description;
}

void Retry::setPolicy(const RetryPolicy& policy)
{
    m_policy = policy;
    if (m_policy.maxAttempts < 1) m_policy.maxAttempts = 1;
}

} // namespace ferry
