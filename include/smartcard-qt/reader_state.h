// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "types.h"
#include <QByteArray>
#include <QByteArrayView>
#include <array>

namespace Smartcard {

class Context;

/**
 * @brief A reader and the state the caller believes it is in
 *
 * Passed to Context::getStatusChange(), which blocks until the reader's
 * actual (event) state differs from the asserted (current) state and then
 * refreshes eventState() and atr().
 *
 * Typical polling loop:
 * @code
 * QList<ReaderState> readers{ReaderState(pnpNotification(), ReaderStateFlag::Unaware)};
 * while (running) {
 *     for (auto& rs : readers)
 *         rs.syncCurrentState();
 *     auto result = ctx.getStatusChange(std::nullopt, readers);
 *     ...
 * }
 * @endcode
 */
class ReaderState {
public:
    /**
     * @brief Create a state record for a reader
     * @param name Reader name, or pnpNotification(). Must not contain NUL
     *             bytes; anything from the first NUL on is dropped.
     * @param currentState State the caller presumes the reader is in
     */
    ReaderState(const QByteArray& name, ReaderStates currentState);

    QByteArray name() const { return m_name; }

    /**
     * @brief ATR of the card in the reader, as of the last status change
     */
    QByteArrayView atr() const { return QByteArrayView(m_atr.data(), m_atrLength); }

    /**
     * @brief The asserted state
     */
    ReaderStates currentState() const { return readerStatesFromRaw(m_currentState); }

    /**
     * @brief The state last reported by the service
     */
    ReaderStates eventState() const { return readerStatesFromRaw(m_eventState); }

    /**
     * @brief Card insertion/removal counter of the reader
     *
     * Compare between two waits to detect a card swap that happened in
     * between.
     */
    uint32_t eventCount() const { return (m_eventState & EVENT_COUNT_MASK) >> 16; }

    /**
     * @brief Assert the last reported state as the current state
     *
     * Copies the full event word, counter included. Without the counter
     * Windows reports the PnP pseudo-reader as changed on every wait.
     */
    void syncCurrentState() { m_currentState = m_eventState; }

    void setCurrentState(ReaderStates state) { m_currentState = state.toInt(); }

    uint32_t rawCurrentState() const { return m_currentState; }
    uint32_t rawEventState() const { return m_eventState; }

private:
    friend class Context;

    void update(uint32_t eventState, QByteArrayView atr);

    QByteArray m_name;
    uint32_t m_currentState;
    uint32_t m_eventState;
    std::array<char, ATR_BUFFER_SIZE> m_atr;
    int m_atrLength;
};

} // namespace Smartcard
