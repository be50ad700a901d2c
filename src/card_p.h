// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "context_p.h"
#include "smartcard-qt/card.h"
#include <QAtomicInt>
#include <memory>
#include <optional>

namespace Smartcard {

/**
 * @brief State of a card connection, shared by a Card and its Transaction
 *
 * Card and Transaction check their preconditions and forward here. The
 * last holder to let go disconnects with Disposition::ResetCard if the
 * connection is still open.
 */
class CardPrivate {
public:
    CardPrivate(std::shared_ptr<ContextData> context, quintptr handle,
                std::optional<Protocol> protocol);
    ~CardPrivate();

    ServiceBackend* service() const { return context->service(); }

    Result<void> reconnect(ShareMode shareMode, Protocols preferredProtocols,
                           Disposition initialization);
    Result<void> disconnect(Disposition disposition);

    Result<CardStatus> status(QByteArray& namesBuffer, QByteArray& atrBuffer) const;
    Result<StatusLengths> statusLen() const;
    Result<CardStatusOwned> statusOwned() const;
    Result<QByteArrayView> getAttribute(Attribute attribute, QByteArray& buffer) const;
    Result<qsizetype> getAttributeLen(Attribute attribute) const;
    Result<QByteArray> getAttributeOwned(Attribute attribute) const;
    Result<void> setAttribute(Attribute attribute, QByteArrayView value) const;
    Result<QByteArrayView> transmit(QByteArrayView send, QByteArray& receive) const;
    Result<QByteArrayView> control(uint32_t code, QByteArrayView send, QByteArray& receive) const;

    // Dropped on disconnect so the session can be released
    std::shared_ptr<ContextData> context;
    quintptr handle;
    std::optional<Protocol> protocol;
    bool connected;
    QAtomicInt transactionOpen;
};

} // namespace Smartcard
