// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/reader_state.h"
#include <QDebug>
#include <algorithm>
#include <cstring>

namespace Smartcard {

ReaderState::ReaderState(const QByteArray& name, ReaderStates currentState)
    : m_name(name)
    , m_currentState(currentState.toInt())
    , m_eventState(0)
    , m_atrLength(0)
{
    const qsizetype nul = m_name.indexOf('\0');
    if (nul >= 0) {
        qWarning() << "ReaderState: Reader name contains NUL, truncating:" << m_name.toHex();
        m_name.truncate(nul);
    }
    m_atr.fill(0);
}

void ReaderState::update(uint32_t eventState, QByteArrayView atr)
{
    m_eventState = eventState;
    m_atrLength = static_cast<int>(std::min<qsizetype>(atr.size(), ATR_BUFFER_SIZE));
    if (m_atrLength > 0) {
        std::memcpy(m_atr.data(), atr.data(), m_atrLength);
    }
}

} // namespace Smartcard
