#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace nla { namespace util {

/// Base event handed to iteration listeners.
class IterationEvent {
public:
    explicit IterationEvent(std::size_t iterations) : m_iterations(iterations) {}
    virtual ~IterationEvent();

    /// Iterations performed when the event was fired.
    std::size_t iterations() const noexcept { return m_iterations; }

private:
    std::size_t m_iterations;
};

/**
 * @brief Observer of an iterative algorithm.
 *
 * Every hook defaults to doing nothing, so listeners override only what
 * they need.
 */
class IterationListener {
public:
    virtual ~IterationListener();

    virtual void initializationPerformed(const IterationEvent&) {}
    virtual void iterationStarted(const IterationEvent&) {}
    virtual void iterationPerformed(const IterationEvent&) {}
    virtual void terminationPerformed(const IterationEvent&) {}
};

/**
 * @brief Iteration counter with a ceiling and a set of listeners.
 *
 * incrementIterationCount() calls the exhaustion callback with the
 * maximum as soon as the count goes beyond it.  The default callback
 * throws MaxCountExceededException; a callback that returns normally
 * lets the count keep growing.
 *
 * Listeners are not owned and must outlive their registration.
 */
class IterationManager {
public:
    using MaxCountExceededCallback = std::function<void(std::size_t)>;

    explicit IterationManager(std::size_t maxIterations);
    IterationManager(std::size_t maxIterations, MaxCountExceededCallback callback);

    void addIterationListener(IterationListener* listener);
    void removeIterationListener(IterationListener* listener);

    void fireInitializationEvent(const IterationEvent& e) const;
    void fireIterationStartedEvent(const IterationEvent& e) const;
    void fireIterationPerformedEvent(const IterationEvent& e) const;
    void fireTerminationEvent(const IterationEvent& e) const;

    void incrementIterationCount();
    void resetIterationCount() noexcept { m_iterations = 0; }

    std::size_t iterations() const noexcept { return m_iterations; }
    std::size_t maxIterations() const noexcept { return m_maxIterations; }

private:
    std::size_t                     m_maxIterations;
    std::size_t                     m_iterations{0};
    MaxCountExceededCallback        m_callback;
    std::vector<IterationListener*> m_listeners;
};

}} // namespace nla::util
