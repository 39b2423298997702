#include "nla/util/iteration_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "nla/exception.hpp"

namespace nla { namespace util {

IterationEvent::~IterationEvent() = default;
IterationListener::~IterationListener() = default;

IterationManager::IterationManager(std::size_t maxIterations)
  : IterationManager(maxIterations,
                     [](std::size_t max) { throw MaxCountExceededException(max); })
{
}

IterationManager::IterationManager(std::size_t maxIterations,
                                   MaxCountExceededCallback callback)
  : m_maxIterations(maxIterations),
    m_callback(std::move(callback))
{
    if (!m_callback)
        throw std::invalid_argument("IterationManager: empty max-count callback");
}

void IterationManager::addIterationListener(IterationListener* listener)
{
    if (listener == nullptr)
        throw std::invalid_argument("IterationManager: null listener");
    m_listeners.push_back(listener);
}

void IterationManager::removeIterationListener(IterationListener* listener)
{
    auto it = std::find(m_listeners.begin(), m_listeners.end(), listener);
    if (it != m_listeners.end())
        m_listeners.erase(it);
}

void IterationManager::fireInitializationEvent(const IterationEvent& e) const
{
    for (IterationListener* l : m_listeners) l->initializationPerformed(e);
}

void IterationManager::fireIterationStartedEvent(const IterationEvent& e) const
{
    for (IterationListener* l : m_listeners) l->iterationStarted(e);
}

void IterationManager::fireIterationPerformedEvent(const IterationEvent& e) const
{
    for (IterationListener* l : m_listeners) l->iterationPerformed(e);
}

void IterationManager::fireTerminationEvent(const IterationEvent& e) const
{
    for (IterationListener* l : m_listeners) l->terminationPerformed(e);
}

void IterationManager::incrementIterationCount()
{
    if (++m_iterations > m_maxIterations)
        m_callback(m_maxIterations);
}

}} // namespace nla::util
