#include "PassphraseGate.hpp"

#include <QDebug>
#include <utility>

PassphraseGate::PassphraseGate(QObject *parent) noexcept : QObject(parent) {}

// Starts a new document-open sequence. Anything still held for the previous
// document is dropped without being called.
PassphraseGate::SessionId
PassphraseGate::beginSession() noexcept
{
    reset();
    return m_session;
}

void
PassphraseGate::reset() noexcept
{
    ++m_session;
    m_state    = State::Closed;
    m_request  = Request{};
    m_resolver = nullptr;
}

bool
PassphraseGate::needsPassphrase(SessionId session, Reason reason,
                                Resolver resolver) noexcept
{
    if (session != m_session)
    {
        qWarning() << "PassphraseGate::needsPassphrase(): stale session"
                   << session << "current" << m_session;
        return false;
    }

    if (m_state == State::Open || m_state == State::AwaitingInput)
    {
        qWarning() << "PassphraseGate::needsPassphrase(): unexpected request in"
                   << "state" << static_cast<int>(m_state);
        return false;
    }

    if (!resolver)
        return false;

    m_request.attemptNumber += 1;
    m_request.lastAttemptFailed = (reason == Reason::PriorAttemptRejected);
    m_resolver                  = std::move(resolver);
    m_state                     = State::AwaitingInput;

    emit requestChanged(m_request);
    return true;
}

bool
PassphraseGate::submit(const QString &passphrase) noexcept
{
    if (m_state != State::AwaitingInput || !m_resolver)
        return false;

    // Take the resolver out of the slot before calling it so that a second
    // submit, or a re-entrant one from inside the resolver, finds it empty.
    Resolver resolver = std::exchange(m_resolver, nullptr);
    m_state           = State::Verifying;

    emit verifying();
    resolver(passphrase);
    return true;
}

bool
PassphraseGate::cancel() noexcept
{
    if (m_state != State::AwaitingInput || !m_resolver)
        return false;

    Resolver resolver = std::exchange(m_resolver, nullptr);
    m_state           = State::Closed;
    m_request         = Request{};

    resolver(std::nullopt);
    emit cancelled();
    return true;
}

bool
PassphraseGate::markOpened(SessionId session) noexcept
{
    if (session != m_session || m_state == State::Open)
        return false;

    m_state    = State::Open;
    m_request  = Request{};
    m_resolver = nullptr;

    emit opened();
    return true;
}
