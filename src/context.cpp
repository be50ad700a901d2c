// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/context.h"
#include "smartcard-qt/backends/pcsc_service_backend.h"
#include "smartcard-qt/card.h"
#include "card_p.h"
#include "context_p.h"
#include <QDebug>
#include <vector>

namespace Smartcard {

namespace {

uint32_t timeoutToService(std::optional<std::chrono::milliseconds> timeout)
{
    if (!timeout) {
        return INFINITE_TIMEOUT;
    }
    const auto ms = timeout->count();
    if (ms <= 0) {
        return 0;
    }
    // INFINITE_TIMEOUT itself is the sentinel, stay below it
    if (static_cast<unsigned long long>(ms) >= INFINITE_TIMEOUT) {
        return INFINITE_TIMEOUT - 1;
    }
    return static_cast<uint32_t>(ms);
}

} // anonymous namespace

std::shared_ptr<ServiceBackend> createDefaultBackend()
{
    qDebug() << "Context: Creating PC/SC backend";
    return std::make_shared<PcscServiceBackend>();
}

ContextData::ContextData(std::shared_ptr<ServiceBackend> backend, quintptr handle)
    : backend(std::move(backend))
    , handle(handle)
{
}

ContextData::~ContextData()
{
    if (released) {
        return;
    }

    const Error error = errorFromRaw(backend->releaseContext(handle));
    if (error != Error::Success) {
        qWarning() << "Context: Failed to release context on destruction:" << errorName(error);
        return;
    }
    qDebug() << "Context: Context released";
}

// Canceler

Canceler::Canceler(std::weak_ptr<ContextData> context)
    : m_context(std::move(context))
{
}

Result<void> Canceler::cancel() const
{
    std::shared_ptr<ContextData> context = m_context.lock();
    if (!context) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    return Result<void>::fromRaw(context->service()->cancel(context->handle));
}

// Context

Context::Context(std::shared_ptr<ContextData> data)
    : d(std::move(data))
{
}

Result<Context> Context::establish(Scope scope, std::shared_ptr<ServiceBackend> backend)
{
    if (!backend) {
        backend = createDefaultBackend();
    }

    quintptr handle = 0;
    const Error error = errorFromRaw(backend->establishContext(scope, &handle));
    if (error != Error::Success) {
        qWarning() << "Context: Failed to establish context:" << errorName(error);
        return Result<Context>::fromError(error);
    }

    qDebug() << "Context: Established with" << backend->backendName()
             << "scope" << static_cast<uint32_t>(scope);
    return Result<Context>::fromSuccess(
        Context(std::make_shared<ContextData>(std::move(backend), handle)));
}

Result<void> Context::release()
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }

    // Other copies or open cards still use the session
    if (d.use_count() != 1) {
        qDebug() << "Context: Release refused, session shared by" << d.use_count() << "holders";
        return Result<void>::fromError(Error::CantDispose);
    }

    const Error error = errorFromRaw(d->service()->releaseContext(d->handle));
    if (error != Error::Success) {
        qWarning() << "Context: Failed to release context:" << errorName(error);
        return Result<void>::fromError(error);
    }

    d->released = true;
    d.reset();
    qDebug() << "Context: Context released";
    return Result<void>::fromSuccess();
}

Result<void> Context::isValid() const
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    return Result<void>::fromRaw(d->service()->isValidContext(d->handle));
}

Result<void> Context::cancel() const
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    return Result<void>::fromRaw(d->service()->cancel(d->handle));
}

Canceler Context::canceler() const
{
    return Canceler(d);
}

Result<ReaderNames> Context::listReaders(QByteArray& buffer) const
{
    if (!d) {
        return Result<ReaderNames>::fromError(Error::InvalidHandle);
    }

    uint32_t length = static_cast<uint32_t>(buffer.size());
    const Error error = errorFromRaw(d->service()->listReaders(d->handle, buffer.data(), &length));

    switch (error) {
    case Error::Success:
        break;
    case Error::NoReadersAvailable:
        return Result<ReaderNames>::fromSuccess(ReaderNames());
    case Error::InsufficientBuffer:
        return Result<ReaderNames>::fromError(
            error, length > static_cast<uint32_t>(buffer.size()) ? qsizetype(length) : -1);
    default:
        return Result<ReaderNames>::fromError(error);
    }

    const qsizetype used = qMin(qsizetype(length), buffer.size());
    return Result<ReaderNames>::fromSuccess(ReaderNames(QByteArrayView(buffer.constData(), used)));
}

Result<qsizetype> Context::listReadersLen() const
{
    if (!d) {
        return Result<qsizetype>::fromError(Error::InvalidHandle);
    }

    uint32_t length = 0;
    const Error error = errorFromRaw(d->service()->listReaders(d->handle, nullptr, &length));

    if (error == Error::NoReadersAvailable) {
        return Result<qsizetype>::fromSuccess(0);
    }
    if (error != Error::Success) {
        return Result<qsizetype>::fromError(error);
    }
    return Result<qsizetype>::fromSuccess(qsizetype(length));
}

Result<QList<QByteArray>> Context::listReadersOwned() const
{
    // A reader may be plugged in between the probe and the listing
    for (;;) {
        auto length = listReadersLen();
        if (!length) {
            return Result<QList<QByteArray>>::fromError(length.error());
        }
        if (length.value() == 0) {
            return Result<QList<QByteArray>>::fromSuccess({});
        }

        QByteArray buffer(length.value(), '\0');
        auto names = listReaders(buffer);
        if (names) {
            return Result<QList<QByteArray>>::fromSuccess(names.value().toList());
        }
        if (names.error() != Error::InsufficientBuffer) {
            return Result<QList<QByteArray>>::fromError(names.error());
        }
        qDebug() << "Context: Reader list grew while listing, retrying";
    }
}

Result<Card> Context::connect(const QByteArray& reader, ShareMode shareMode,
                              Protocols preferredProtocols) const
{
    if (!d) {
        return Result<Card>::fromError(Error::InvalidHandle);
    }
    if (reader.isEmpty() || reader.contains('\0')) {
        return Result<Card>::fromError(Error::InvalidParameter);
    }

    qDebug() << "Context: Connecting to card in reader:" << reader;

    quintptr handle = 0;
    uint32_t protocol = 0;
    const Error error = errorFromRaw(d->service()->connect(
        d->handle, reader.constData(), shareMode, preferredProtocols, &handle, &protocol));

    if (error != Error::Success) {
        qDebug() << "Context: Failed to connect to card:" << errorName(error);
        return Result<Card>::fromError(error);
    }

    std::optional<Protocol> active = protocolFromRaw(protocol);
    qDebug() << "Context: Connected, protocol:" << protocolName(active);
    return Result<Card>::fromSuccess(Card(std::make_shared<CardPrivate>(d, handle, active)));
}

Result<void> Context::getStatusChange(std::optional<std::chrono::milliseconds> timeout,
                                      QList<ReaderState>& readers) const
{
    return getStatusChange(timeout, readers.data(), readers.size());
}

Result<void> Context::getStatusChange(std::optional<std::chrono::milliseconds> timeout,
                                      ReaderState* readers, qsizetype count) const
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    if (count < 0 || (count > 0 && !readers)) {
        qWarning() << "Context: Invalid reader state array, count:" << count;
        return Result<void>::fromError(Error::InvalidParameter);
    }

    std::vector<ServiceReaderState> states(static_cast<size_t>(count));
    for (qsizetype i = 0; i < count; ++i) {
        states[i].reader = readers[i].m_name.constData();
        states[i].currentState = readers[i].m_currentState;
        states[i].eventState = readers[i].m_eventState;
    }

    const Error error = errorFromRaw(d->service()->getStatusChange(
        d->handle, timeoutToService(timeout), states.data(), static_cast<uint32_t>(count)));

    if (error != Error::Success) {
        return Result<void>::fromError(error);
    }

    for (qsizetype i = 0; i < count; ++i) {
        const qsizetype atrLength = qMin<qsizetype>(states[i].atrLength, ATR_BUFFER_SIZE);
        readers[i].update(states[i].eventState,
                          QByteArrayView(states[i].atr, atrLength));
    }
    return Result<void>::fromSuccess();
}

QString Context::backendName() const
{
    return d ? d->service()->backendName() : QString();
}

} // namespace Smartcard
