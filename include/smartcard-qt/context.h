// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "reader_names.h"
#include "reader_state.h"
#include "result.h"
#include "types.h"
#include <QByteArray>
#include <QList>
#include <QString>
#include <chrono>
#include <memory>
#include <optional>

namespace Smartcard {

class Card;
class ServiceBackend;
struct ContextData;

/**
 * @brief Weak handle used only to cancel a blocking wait
 *
 * Obtained from Context::canceler() and safe to hand to another thread.
 * Does not keep the session alive.
 */
class Canceler {
public:
    /**
     * @brief Wake the thread blocked in Context::getStatusChange()
     * @return Error::InvalidHandle once the session has been released
     */
    Result<void> cancel() const;

private:
    friend class Context;
    explicit Canceler(std::weak_ptr<ContextData> context);

    std::weak_ptr<ContextData> m_context;
};

/**
 * @brief A session with the smart card service
 *
 * Context is the entry point: it lists readers, connects to cards and waits
 * for reader state changes. Copies share the same session handle, which is
 * released together with the last copy (or an open Card, which keeps one).
 *
 * All methods are safe to call concurrently from several threads holding
 * copies of the same Context. Blocking calls on one session are serialized
 * by the service, so concurrent monitors should use separate sessions.
 *
 * Usage:
 * @code
 * auto established = Context::establish(Scope::User);
 * if (!established) {
 *     qWarning() << established.errorMessage();
 *     return;
 * }
 * Context ctx = established.takeValue();
 *
 * auto readers = ctx.listReadersOwned();
 * if (readers && !readers.value().isEmpty()) {
 *     auto card = ctx.connect(readers.value().first(), ShareMode::Shared, PROTOCOLS_ANY);
 *     ...
 * }
 * @endcode
 */
class Context {
public:
    /**
     * @brief Establish a new session
     * @param scope Namespace of readers visible to the session
     * @param backend Service to talk to, nullptr for the platform default
     */
    static Result<Context> establish(Scope scope, std::shared_ptr<ServiceBackend> backend = nullptr);

    Context(const Context& other) = default;
    Context(Context&& other) noexcept = default;
    Context& operator=(const Context& other) = default;
    Context& operator=(Context&& other) noexcept = default;
    ~Context() = default;

    /**
     * @brief Release the session explicitly
     *
     * Succeeds only if this is the last holder of the session (no copies,
     * no open Card). Otherwise fails with Error::CantDispose and the Context
     * stays usable. If the service fails to release, the Context keeps its
     * handle and the error is returned.
     *
     * A Canceler holds the session for the duration of Canceler::cancel(),
     * so a release racing with a cancel may fail with Error::CantDispose.
     * Retry once the cancel has returned.
     */
    Result<void> release();

    /**
     * @brief Check that the service still considers the handle valid
     */
    Result<void> isValid() const;

    /**
     * @brief Wake a thread blocked in getStatusChange() on this session
     *
     * Safe from any thread. When nothing is blocked it succeeds and leaves
     * no trace, so the next getStatusChange() waits normally.
     */
    Result<void> cancel() const;

    /**
     * @brief Weak handle that can only cancel
     */
    Canceler canceler() const;

    /**
     * @brief List the readers into a caller-provided buffer
     * @param buffer Destination; its size is the capacity offered
     * @return View over the names in buffer
     *
     * No readers is reported as an empty sequence. A buffer too small for
     * the whole list fails with Error::InsufficientBuffer and yields no
     * names; Result::requiredSize() carries the size needed when known.
     */
    Result<ReaderNames> listReaders(QByteArray& buffer) const;

    /**
     * @brief Size of the buffer listReaders() needs (0 without readers)
     */
    Result<qsizetype> listReadersLen() const;

    /**
     * @brief List the readers into owned copies
     */
    Result<QList<QByteArray>> listReadersOwned() const;

    /**
     * @brief Connect to the card in a reader
     * @param reader Reader name, as reported by listReaders()
     * @param shareMode Exclusive, Shared or Direct access
     * @param preferredProtocols Acceptable protocols (ignored for Direct)
     */
    Result<Card> connect(const QByteArray& reader, ShareMode shareMode,
                         Protocols preferredProtocols) const;

    /**
     * @brief Wait until a reader's state differs from its asserted state
     * @param timeout Maximum wait, std::nullopt to wait forever
     * @param readers Records to watch; event states and ATRs are refreshed
     *                on success, asserted states are never modified
     *
     * Fails with Error::Timeout when the timeout expires and with
     * Error::Cancelled when cancel() is called meanwhile. Timeouts longer
     * than the service supports are clamped. A negative count, or a null
     * array with a positive count, fails with Error::InvalidParameter.
     */
    Result<void> getStatusChange(std::optional<std::chrono::milliseconds> timeout,
                                 QList<ReaderState>& readers) const;
    Result<void> getStatusChange(std::optional<std::chrono::milliseconds> timeout,
                                 ReaderState* readers, qsizetype count) const;

    /**
     * @brief Check if this object still holds a session (not released)
     */
    bool isEstablished() const { return d != nullptr; }

    QString backendName() const;

private:
    explicit Context(std::shared_ptr<ContextData> data);

    std::shared_ptr<ContextData> d;
};

} // namespace Smartcard
