// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "reader_names.h"
#include "result.h"
#include "types.h"
#include <QByteArray>
#include <QByteArrayView>
#include <QList>
#include <memory>
#include <optional>

namespace Smartcard {

class Context;
class Transaction;
class CardPrivate;

/**
 * @brief Status of a connected card, borrowing the caller's buffers
 */
struct CardStatus {
    ReaderNames readerNames;          ///< Names the reader is known by
    CardStatusFlags status;
    std::optional<Protocol> protocol; ///< Empty for Direct connections
    QByteArrayView atr;
};

/**
 * @brief Status of a connected card, owning its data
 */
struct CardStatusOwned {
    QList<QByteArray> readerNames;
    CardStatusFlags status;
    std::optional<Protocol> protocol;
    QByteArray atr;
};

/**
 * @brief Buffer sizes needed by Card::status()
 */
struct StatusLengths {
    qsizetype readerNamesLength = 0;
    qsizetype atrLength = 0;
};

/**
 * @brief A connection to a card in a reader
 *
 * Created by Context::connect(). Move-only. Keeps its session alive, so the
 * Context it came from cannot be released while the Card is connected.
 *
 * Destroying a connected Card disconnects with Disposition::ResetCard; a
 * failure there is logged and otherwise ignored. Use disconnect() to pick
 * the disposition and observe the result. If a Transaction is still open,
 * the disconnect waits until that Transaction ends or is destroyed.
 *
 * While a Transaction is open on the Card, every operation on the Card
 * itself fails with Error::SharingViolation; use the Transaction instead.
 */
class Card {
public:
    Card(Card&& other) noexcept;
    Card& operator=(Card&& other) noexcept;
    Card(const Card&) = delete;
    Card& operator=(const Card&) = delete;
    ~Card();

    /**
     * @brief Begin an exclusive access window
     *
     * Fails with Error::SharingViolation if a transaction is already open.
     * On failure (e.g. Error::ResetCard) the Card is left untouched, so the
     * caller can reconnect() and retry.
     */
    Result<Transaction> transaction();

    /**
     * @brief Renegotiate the connection in place
     * @param initialization What to do with the card before renegotiating
     */
    Result<void> reconnect(ShareMode shareMode, Protocols preferredProtocols,
                           Disposition initialization);

    /**
     * @brief Disconnect from the card
     *
     * On success the Card is no longer connected and drops its hold on the
     * session. On failure the Card stays connected so the caller can retry,
     * possibly with another disposition.
     */
    Result<void> disconnect(Disposition disposition);

    /**
     * @brief Query status, reader names and ATR into the caller's buffers
     */
    Result<CardStatus> status(QByteArray& namesBuffer, QByteArray& atrBuffer) const;
    Result<StatusLengths> statusLen() const;
    Result<CardStatusOwned> statusOwned() const;

    /**
     * @brief Read a reader attribute into buffer
     * @return View over the attribute value in buffer
     */
    Result<QByteArrayView> getAttribute(Attribute attribute, QByteArray& buffer) const;
    Result<qsizetype> getAttributeLen(Attribute attribute) const;
    Result<QByteArray> getAttributeOwned(Attribute attribute) const;
    Result<void> setAttribute(Attribute attribute, QByteArrayView value) const;

    /**
     * @brief Send a command to the card and receive the response
     * @param send Command bytes
     * @param receive Response buffer; its size is the capacity offered.
     *                MAX_BUFFER_SIZE fits any short response,
     *                MAX_BUFFER_SIZE_EXTENDED any extended one.
     * @return View over the response in receive
     *
     * Requires a negotiated protocol: on a Direct connection it fails with
     * Error::ProtoMismatch without contacting the service. On
     * Error::InsufficientBuffer the command has already run on the card.
     */
    Result<QByteArrayView> transmit(QByteArrayView send, QByteArray& receive) const;

    /**
     * @brief Send a control command to the reader driver
     * @param code Control code, see ctlCode()
     */
    Result<QByteArrayView> control(uint32_t code, QByteArrayView send, QByteArray& receive) const;

    /**
     * @brief Protocol negotiated at connect/reconnect, empty for Direct
     */
    std::optional<Protocol> activeProtocol() const;

    bool isConnected() const;
    bool inTransaction() const;

private:
    friend class Context;
    explicit Card(std::shared_ptr<CardPrivate> data);

    Result<void> checkAvailable() const;

    std::shared_ptr<CardPrivate> d;
};

} // namespace Smartcard
