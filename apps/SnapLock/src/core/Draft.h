#ifndef DRAFT_H
#define DRAFT_H

#include <functional>

/**
 * Edited value with a committed counterpart.
 *
 * The candidate can be changed freely; commit() hands it to a backend call.
 * On success the candidate becomes the new original, on failure the
 * candidate is reset to the original so callers never hold a value the
 * backend refused.
 */
template <typename T>
class Draft
{
public:
    explicit Draft(const T& original = T())
        : m_original(original)
        , m_candidate(original)
    {
    }

    const T& original() const { return m_original; }
    const T& candidate() const { return m_candidate; }

    void setCandidate(const T& value) { m_candidate = value; }

    bool isDirty() const { return !(m_candidate == m_original); }

    void rollback() { m_candidate = m_original; }

    // Replaces both values, e.g. after the backend changed on its own
    void reset(const T& value)
    {
        m_original = value;
        m_candidate = value;
    }

    bool commit(const std::function<bool(const T&)>& backend)
    {
        if (backend && backend(m_candidate)) {
            m_original = m_candidate;
            return true;
        }
        m_candidate = m_original;
        return false;
    }

private:
    T m_original;
    T m_candidate;
};

#endif // DRAFT_H
