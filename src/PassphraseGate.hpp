#pragma once

#include <QObject>
#include <QString>
#include <functional>
#include <optional>

// Rendezvous between a document loader that pauses for a passphrase and the
// prompt shown to the user. Holds at most one pending resolver.
//
//   Closed -> AwaitingInput -> Verifying -> Open
//                 ^               |
//                 +---------------+  (rejected)
//   AwaitingInput -> Closed          (cancelled)
class PassphraseGate : public QObject
{
    Q_OBJECT
public:
    enum class State
    {
        Closed = 0,
        AwaitingInput,
        Verifying,
        Open
    };

    enum class Reason
    {
        FirstRequest = 0,
        PriorAttemptRejected
    };

    struct Request
    {
        int attemptNumber{0};
        bool lastAttemptFailed{false};
    };

    using SessionId = quint64;

    // nullopt means the user cancelled
    using Answer   = std::optional<QString>;
    using Resolver = std::function<void(const Answer &)>;

    explicit PassphraseGate(QObject *parent = nullptr) noexcept;

    inline State state() const noexcept
    {
        return m_state;
    }

    inline SessionId session() const noexcept
    {
        return m_session;
    }

    inline bool hasPendingRequest() const noexcept
    {
        return m_state == State::AwaitingInput;
    }

    // Meaningful only while hasPendingRequest()
    inline Request request() const noexcept
    {
        return m_request;
    }

    SessionId beginSession() noexcept;
    void reset() noexcept;

    bool needsPassphrase(SessionId session, Reason reason,
                         Resolver resolver) noexcept;
    bool submit(const QString &passphrase) noexcept;
    bool cancel() noexcept;
    bool markOpened(SessionId session) noexcept;

signals:
    void requestChanged(PassphraseGate::Request request);
    void verifying();
    void opened();
    void cancelled();

private:
    State m_state{State::Closed};
    SessionId m_session{0};
    Request m_request{};
    Resolver m_resolver{};
};

Q_DECLARE_METATYPE(PassphraseGate::Request)
