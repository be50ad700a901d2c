// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/transaction.h"
#include "card_p.h"
#include <QDebug>

namespace Smartcard {

Transaction::Transaction(std::shared_ptr<CardPrivate> card)
    : d(std::move(card))
{
}

Transaction::Transaction(Transaction&& other) noexcept
    : d(std::move(other.d))
{
}

Transaction& Transaction::operator=(Transaction&& other) noexcept
{
    if (this != &other) {
        finish(Disposition::LeaveCard);
        d = std::move(other.d);
    }
    return *this;
}

Transaction::~Transaction()
{
    finish(Disposition::LeaveCard);
}

void Transaction::finish(Disposition disposition)
{
    if (!d) {
        return;
    }

    auto result = end(disposition);
    if (!result) {
        qWarning() << "Transaction: Failed to end on destruction:" << errorName(result.error());
        // The Card must stay usable even if the service refused
        d->transactionOpen.storeRelease(0);
        d.reset();
    }
}

Result<void> Transaction::end(Disposition disposition)
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    if (!d->connected) {
        return Result<void>::fromError(Error::InvalidHandle);
    }

    const Error error = errorFromRaw(d->service()->endTransaction(d->handle, disposition));
    if (error != Error::Success) {
        qDebug() << "Transaction: Failed to end:" << errorName(error);
        return Result<void>::fromError(error);
    }

    d->transactionOpen.storeRelease(0);
    d.reset();
    qDebug() << "Transaction: Ended";
    return Result<void>::fromSuccess();
}

Result<CardStatus> Transaction::status(QByteArray& namesBuffer, QByteArray& atrBuffer) const
{
    if (!d) {
        return Result<CardStatus>::fromError(Error::InvalidHandle);
    }
    return d->status(namesBuffer, atrBuffer);
}

Result<StatusLengths> Transaction::statusLen() const
{
    if (!d) {
        return Result<StatusLengths>::fromError(Error::InvalidHandle);
    }
    return d->statusLen();
}

Result<CardStatusOwned> Transaction::statusOwned() const
{
    if (!d) {
        return Result<CardStatusOwned>::fromError(Error::InvalidHandle);
    }
    return d->statusOwned();
}

Result<QByteArrayView> Transaction::getAttribute(Attribute attribute, QByteArray& buffer) const
{
    if (!d) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }
    return d->getAttribute(attribute, buffer);
}

Result<qsizetype> Transaction::getAttributeLen(Attribute attribute) const
{
    if (!d) {
        return Result<qsizetype>::fromError(Error::InvalidHandle);
    }
    return d->getAttributeLen(attribute);
}

Result<QByteArray> Transaction::getAttributeOwned(Attribute attribute) const
{
    if (!d) {
        return Result<QByteArray>::fromError(Error::InvalidHandle);
    }
    return d->getAttributeOwned(attribute);
}

Result<void> Transaction::setAttribute(Attribute attribute, QByteArrayView value) const
{
    if (!d) {
        return Result<void>::fromError(Error::InvalidHandle);
    }
    return d->setAttribute(attribute, value);
}

Result<QByteArrayView> Transaction::transmit(QByteArrayView send, QByteArray& receive) const
{
    if (!d) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }
    return d->transmit(send, receive);
}

Result<QByteArrayView> Transaction::control(uint32_t code, QByteArrayView send,
                                            QByteArray& receive) const
{
    if (!d) {
        return Result<QByteArrayView>::fromError(Error::InvalidHandle);
    }
    return d->control(code, send, receive);
}

std::optional<Protocol> Transaction::activeProtocol() const
{
    return (d && d->connected) ? d->protocol : std::nullopt;
}

} // namespace Smartcard
