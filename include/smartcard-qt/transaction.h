// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "card.h"
#include "result.h"
#include "types.h"
#include <memory>

namespace Smartcard {

class CardPrivate;

/**
 * @brief Exclusive access window on a Card
 *
 * Created by Card::transaction(). Move-only. While open, other
 * applications cannot talk to the card, and the Card's own operations are
 * blocked; use the forwarding methods here instead.
 *
 * Destroying an open Transaction ends it with Disposition::LeaveCard; a
 * failure there is logged and otherwise ignored.
 *
 * @code
 * auto tx = card.transaction();
 * if (tx) {
 *     QByteArray response(MAX_BUFFER_SIZE, 0);
 *     auto rapdu = tx.value().transmit(apdu, response);
 *     tx.value().end(Disposition::LeaveCard);
 * }
 * @endcode
 */
class Transaction {
public:
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&& other) noexcept;
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    ~Transaction();

    /**
     * @brief End the transaction
     *
     * On failure the transaction stays open so the caller can retry,
     * possibly with another disposition.
     */
    Result<void> end(Disposition disposition);

    bool isActive() const { return d != nullptr; }

    Result<CardStatus> status(QByteArray& namesBuffer, QByteArray& atrBuffer) const;
    Result<StatusLengths> statusLen() const;
    Result<CardStatusOwned> statusOwned() const;
    Result<QByteArrayView> getAttribute(Attribute attribute, QByteArray& buffer) const;
    Result<qsizetype> getAttributeLen(Attribute attribute) const;
    Result<QByteArray> getAttributeOwned(Attribute attribute) const;
    Result<void> setAttribute(Attribute attribute, QByteArrayView value) const;
    Result<QByteArrayView> transmit(QByteArrayView send, QByteArray& receive) const;
    Result<QByteArrayView> control(uint32_t code, QByteArrayView send, QByteArray& receive) const;
    std::optional<Protocol> activeProtocol() const;

private:
    friend class Card;
    explicit Transaction(std::shared_ptr<CardPrivate> card);

    void finish(Disposition disposition);

    std::shared_ptr<CardPrivate> d;
};

} // namespace Smartcard
