// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/card.h"
#include "smartcard-qt/transaction.h"
#include "card_p.h"
#include <QDebug>

namespace Smartcard {

namespace {

// Required size after an InsufficientBuffer failure, -1 when not reported
qsizetype requiredSize(uint32_t reported, qsizetype offered)
{
    return qsizetype(reported) > offered ? qsizetype(reported) : -1;
}

unsigned char* bytes(QByteArray& buffer)
{
    return reinterpret_cast<unsigned char*>(buffer.data());
}

const unsigned char* bytes(QByteArrayView view)
{
    return reinterpret_cast<const unsigned char*>(view.data());
}

} // anonymous namespace

// CardPrivate

CardPrivate::CardPrivate(std::shared_ptr<ContextData> context, quintptr handle,
                         std::optional<Protocol> protocol)
    : context(std::move(context))
    , handle(handle)
    , protocol(protocol)
    , connected(true)
    , transactionOpen(0)
{
}

CardPrivate::~CardPrivate()
{
    if (!connected) {
        return;
    }

    auto result = disconnect(Disposition::ResetCard);
    if (!result) {
        qWarning() << "Card: Failed to disconnect on destruction:" << errorName(result.error());
    }
}

Result<void> CardPrivate::reconnect(ShareMode shareMode, Protocols preferredProtocols,
                                    Disposition initialization)
{
    if (!connected) {
        return Result<void>::fromError(Error::InvalidHandle);
    }

    uint32_t active = 0;
    const Error error = errorFromRaw(
        service()->reconnect(handle, shareMode, preferredProtocols, initialization, &active));
    if (error != Error::Success) {
        qDebug() << "Card: Reconnect failed:" << errorName(error);
        return Result<void>::fromError(error);
    }

    protocol = protocolFromRaw(active);
    qDebug() << "Card: Reconnected, protocol:" << protocolName(protocol);
    return Result<void>::fromSuccess();
}

Result<void> CardPrivate::disconnect(Disposition disposition)
{
    if (!connected) {
        return Result<void>::fromError(Error::InvalidHandle);
    }

    const Error error = errorFromRaw(service()->disconnect(handle, disposition));
    if (error != Error::Success) {
        return Result<void>::fromError(error);
    }

    connected = false;
    handle = 0;
    protocol.reset();
    context.reset();
    qDebug() << "Card: Disconnected from card";
    return Result<void>::fromSuccess();
}

Result<CardStatus> CardPrivate::status(QByteArray& namesBuffer, QByteArray& atrBuffer) const
{
    if (!connected) {
        return Result<CardStatus>::fromError(Error::InvalidHandle);
    }

    uint32_t namesLength = static_cast<uint32_t>(namesBuffer.size());
    uint32_t atrLength = static_cast<uint32_t>(atrBuffer.size());
    uint32_t state = 0;
    uint32_t active = 0;

    const Error error = errorFromRaw(service()->status(
        handle, namesBuffer.data(), &namesLength, &state, &active,
        bytes(atrBuffer), &atrLength));

    if (error == Error::InsufficientBuffer) {
        qsizetype required = requiredSize(namesLength, namesBuffer.size());
        if (required < 0) {
            required = requiredSize(atrLength, atrBuffer.size());
        }
        return Result<CardStatus>::fromError(error, required);
    }
    if (error != Error::Success) {
        return Result<CardStatus>::fromError(error);
    }

    CardStatus status;
    status.readerNames = ReaderNames(QByteArrayView(
        namesBuffer.constData(), qMin(qsizetype(namesLength), namesBuffer.size())));
    status.status = statusFromBits(state);
    status.protocol = protocolFromRaw(active);
    status.atr = QByteArrayView(atrBuffer.constData(),
                                qMin(qsizetype(atrLength), atrBuffer.size()));
    return Result<CardStatus>::fromSuccess(status);
}

Result<StatusLengths> CardPrivate::statusLen() const
{
    if (!connected) {
        return Result<StatusLengths>::fromError(Error::InvalidHandle);
    }

    uint32_t namesLength = 0;
    uint32_t atrLength = 0;
    uint32_t state = 0;
    uint32_t active = 0;

    const Error error = errorFromRaw(service()->status(
        handle, nullptr, &namesLength, &state, &active, nullptr, &atrLength));
    if (error != Error::Success) {
        return Result<StatusLengths>::fromError(error);
    }

    StatusLengths lengths;
    lengths.readerNamesLength = namesLength;
    lengths.atrLength = atrLength;
    return Result<StatusLengths>::fromSuccess(lengths);
}

Result<CardStatusOwned> CardPrivate::statusOwned() const
{
    for (;;) {
        auto lengths = statusLen();
        if (!lengths) {
            return Result<CardStatusOwned>::fromError(lengths.error());
        }

        QByteArray names(lengths.value().readerNamesLength, '\0');
        QByteArray atr(qMax(lengths.value().atrLength, qsizetype(ATR_BUFFER_SIZE)), '\0');
        auto status = this->status(names, atr);
        if (status.error() == Error::InsufficientBuffer) {
            // The reader got renamed between the two calls
            continue;
        }
        if (!status) {
            return Result<CardStatusOwned>::fromError(status.error());
        }

        CardStatusOwned owned;
        owned.readerNames = status.value().readerNames.toList();
        owned.status = status.value().status;
        owned.protocol = status.value().protocol;
        owned.atr = status.value().atr.toByteArray();
        return Result<CardStatusOwned>::fromSuccess(owned);
    }
}

Result<QByteArrayView> CardPrivate::getAttribute(Attribute attribute, QByteArray& buffer) const
{
    if (!connected) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }

    uint32_t length = static_cast<uint32_t>(buffer.size());
    const Error error = errorFromRaw(service()->getAttribute(
        handle, static_cast<uint32_t>(attribute), bytes(buffer), &length));

    if (error == Error::InsufficientBuffer) {
        return Result<QByteArrayView>::fromError(error, requiredSize(length, buffer.size()));
    }
    if (error != Error::Success) {
        return Result<QByteArrayView>::fromError(error);
    }
    return Result<QByteArrayView>::fromSuccess(
        QByteArrayView(buffer.constData(), qMin(qsizetype(length), buffer.size())));
}

Result<qsizetype> CardPrivate::getAttributeLen(Attribute attribute) const
{
    if (!connected) {
        return Result<qsizetype>::fromError(Error::InvalidHandle);
    }

    uint32_t length = 0;
    const Error error = errorFromRaw(service()->getAttribute(
        handle, static_cast<uint32_t>(attribute), nullptr, &length));
    if (error != Error::Success) {
        return Result<qsizetype>::fromError(error);
    }
    return Result<qsizetype>::fromSuccess(qsizetype(length));
}

Result<QByteArray> CardPrivate::getAttributeOwned(Attribute attribute) const
{
    auto length = getAttributeLen(attribute);
    if (!length) {
        return Result<QByteArray>::fromError(length.error());
    }

    QByteArray buffer(length.value(), '\0');
    auto value = getAttribute(attribute, buffer);
    if (!value) {
        return Result<QByteArray>::fromError(value.error(), value.requiredSize());
    }
    buffer.truncate(value.value().size());
    return Result<QByteArray>::fromSuccess(buffer);
}

Result<void> CardPrivate::setAttribute(Attribute attribute, QByteArrayView value) const
{
    if (!connected) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    return Result<void>::fromRaw(service()->setAttribute(
        handle, static_cast<uint32_t>(attribute), bytes(value),
        static_cast<uint32_t>(value.size())));
}

Result<QByteArrayView> CardPrivate::transmit(QByteArrayView send, QByteArray& receive) const
{
    if (!connected) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }
    // Direct connections have no protocol to talk to the card with
    if (!protocol) {
        qWarning() << "Card: transmit() on a connection without protocol";
        return Result<QByteArrayView>::fromError(Error::ProtoMismatch);
    }

    uint32_t length = static_cast<uint32_t>(receive.size());
    const Error error = errorFromRaw(service()->transmit(
        handle, *protocol, bytes(send), static_cast<uint32_t>(send.size()),
        bytes(receive), &length));

    if (error == Error::InsufficientBuffer) {
        return Result<QByteArrayView>::fromError(error, requiredSize(length, receive.size()));
    }
    if (error != Error::Success) {
        return Result<QByteArrayView>::fromError(error);
    }
    return Result<QByteArrayView>::fromSuccess(
        QByteArrayView(receive.constData(), qMin(qsizetype(length), receive.size())));
}

Result<QByteArrayView> CardPrivate::control(uint32_t code, QByteArrayView send,
                                            QByteArray& receive) const
{
    if (!connected) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }

    uint32_t length = static_cast<uint32_t>(receive.size());
    const Error error = errorFromRaw(service()->control(
        handle, code, bytes(send), static_cast<uint32_t>(send.size()),
        bytes(receive), &length));

    if (error == Error::InsufficientBuffer) {
        return Result<QByteArrayView>::fromError(error, requiredSize(length, receive.size()));
    }
    if (error != Error::Success) {
        return Result<QByteArrayView>::fromError(error);
    }
    return Result<QByteArrayView>::fromSuccess(
        QByteArrayView(receive.constData(), qMin(qsizetype(length), receive.size())));
}

// Card

Card::Card(std::shared_ptr<CardPrivate> data)
    : d(std::move(data))
{
}

Card::Card(Card&& other) noexcept
    : d(std::move(other.d))
{
}

Card& Card::operator=(Card&& other) noexcept
{
    if (this != &other) {
        Card previous(std::move(*this));
        d = std::move(other.d);
    }
    return *this;
}

Card::~Card()
{
    // An open Transaction keeps the connection; the last holder disconnects
    if (d && d->connected && d->transactionOpen.loadAcquire()) {
        qDebug() << "Card: Destroyed while a transaction is open";
    }
}

Result<void> Card::checkAvailable() const
{
    if (!d || !d->connected) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    if (d->transactionOpen.loadAcquire()) {
        return Result<void>::fromError(Error::SharingViolation);
    }
    return Result<void>::fromSuccess();
}

Result<Transaction> Card::transaction()
{
    if (!d || !d->connected) {
        return Result<Transaction>::fromError(Error::InvalidHandle);
    }
    if (!d->transactionOpen.testAndSetOrdered(0, 1)) {
        qDebug() << "Card: Transaction already open";
        return Result<Transaction>::fromError(Error::SharingViolation);
    }

    const Error error = errorFromRaw(d->service()->beginTransaction(d->handle));
    if (error != Error::Success) {
        d->transactionOpen.storeRelease(0);
        qDebug() << "Card: Failed to begin transaction:" << errorName(error);
        return Result<Transaction>::fromError(error);
    }

    qDebug() << "Card: Transaction started";
    return Result<Transaction>::fromSuccess(Transaction(d));
}

Result<void> Card::reconnect(ShareMode shareMode, Protocols preferredProtocols,
                             Disposition initialization)
{
    auto available = checkAvailable();
    if (!available) {
        return available;
    }
    return d->reconnect(shareMode, preferredProtocols, initialization);
}

Result<void> Card::disconnect(Disposition disposition)
{
    auto available = checkAvailable();
    if (!available) {
        return available;
    }
    return d->disconnect(disposition);
}

Result<CardStatus> Card::status(QByteArray& namesBuffer, QByteArray& atrBuffer) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<CardStatus>::fromError(available.error());
    }
    return d->status(namesBuffer, atrBuffer);
}

Result<StatusLengths> Card::statusLen() const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<StatusLengths>::fromError(available.error());
    }
    return d->statusLen();
}

Result<CardStatusOwned> Card::statusOwned() const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<CardStatusOwned>::fromError(available.error());
    }
    return d->statusOwned();
}

Result<QByteArrayView> Card::getAttribute(Attribute attribute, QByteArray& buffer) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<QByteArrayView>::fromError(available.error());
    }
    return d->getAttribute(attribute, buffer);
}

Result<qsizetype> Card::getAttributeLen(Attribute attribute) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<qsizetype>::fromError(available.error());
    }
    return d->getAttributeLen(attribute);
}

Result<QByteArray> Card::getAttributeOwned(Attribute attribute) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<QByteArray>::fromError(available.error());
    }
    return d->getAttributeOwned(attribute);
}

Result<void> Card::setAttribute(Attribute attribute, QByteArrayView value) const
{
    auto available = checkAvailable();
    if (!available) {
        return available;
    }
    return d->setAttribute(attribute, value);
}

Result<QByteArrayView> Card::transmit(QByteArrayView send, QByteArray& receive) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<QByteArrayView>::fromError(available.error());
    }
    return d->transmit(send, receive);
}

Result<QByteArrayView> Card::control(uint32_t code, QByteArrayView send, QByteArray& receive) const
{
    auto available = checkAvailable();
    if (!available) {
        return Result<QByteArrayView>::fromError(available.error());
    }
    return d->control(code, send, receive);
}

std::optional<Protocol> Card::activeProtocol() const
{
    return (d && d->connected) ? d->protocol : std::nullopt;
}

bool Card::isConnected() const
{
    return d && d->connected;
}

bool Card::inTransaction() const
{
    return d && d->transactionOpen.loadAcquire() != 0;
}

} // namespace Smartcard
