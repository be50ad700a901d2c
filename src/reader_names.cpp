// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/reader_names.h"

namespace Smartcard {

void ReaderNames::const_iterator::decode()
{
    if (m_atEnd) {
        return;
    }

    if (m_pos >= m_buffer.size()) {
        m_atEnd = true;
        m_current = QByteArrayView();
        return;
    }

    const qsizetype nul = m_buffer.indexOf('\0', m_pos);
    // Unterminated tail or the empty name closing the list
    if (nul < 0 || nul == m_pos) {
        m_atEnd = true;
        m_current = QByteArrayView();
        return;
    }

    m_current = m_buffer.sliced(m_pos, nul - m_pos);
}

qsizetype ReaderNames::count() const
{
    qsizetype n = 0;
    for (auto it = begin(); it != end(); ++it) {
        ++n;
    }
    return n;
}

QList<QByteArray> ReaderNames::toList() const
{
    QList<QByteArray> names;
    for (QByteArrayView name : *this) {
        names.append(name.toByteArray());
    }
    return names;
}

QByteArray ReaderNames::encode(const QList<QByteArray>& names)
{
    QByteArray buffer;
    for (const QByteArray& name : names) {
        buffer.append(name);
        buffer.append('\0');
    }
    buffer.append('\0');
    return buffer;
}

} // namespace Smartcard
