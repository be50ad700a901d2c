// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include <QByteArray>
#include <QByteArrayView>
#include <QList>
#include <iterator>

namespace Smartcard {

/**
 * @brief Lazy view over a multi-string buffer of reader names
 *
 * The buffer holds NUL-terminated names followed by an empty name
 * ("Reader A\0Reader B\0\0"). Names are decoded one at a time while
 * iterating and borrow the buffer, so the buffer must outlive the view.
 *
 * Iteration stops at the first empty name or at the end of the buffer. A
 * trailing name without its NUL terminator is not yielded.
 */
class ReaderNames {
public:
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = QByteArrayView;
        using difference_type = qsizetype;
        using pointer = const QByteArrayView*;
        using reference = QByteArrayView;

        const_iterator() = default;

        QByteArrayView operator*() const { return m_current; }
        const QByteArrayView* operator->() const { return &m_current; }

        const_iterator& operator++() {
            m_pos += m_current.size() + 1;
            decode();
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const const_iterator& other) const {
            return m_atEnd == other.m_atEnd && (m_atEnd || m_pos == other.m_pos);
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        friend class ReaderNames;

        const_iterator(QByteArrayView buffer, qsizetype pos)
            : m_buffer(buffer), m_pos(pos), m_atEnd(false) {
            decode();
        }

        void decode();

        QByteArrayView m_buffer;
        QByteArrayView m_current;
        qsizetype m_pos = 0;
        bool m_atEnd = true;
    };

    using iterator = const_iterator;
    using value_type = QByteArrayView;

    /**
     * @brief Empty sequence
     */
    ReaderNames() = default;

    /**
     * @brief View over a multi-string buffer
     */
    explicit ReaderNames(QByteArrayView buffer) : m_buffer(buffer) {}

    const_iterator begin() const { return const_iterator(m_buffer, 0); }
    const_iterator end() const { return const_iterator(); }

    bool isEmpty() const { return begin() == end(); }

    /**
     * @brief Number of names (walks the buffer)
     */
    qsizetype count() const;

    /**
     * @brief Copy every name into an owned list
     */
    QList<QByteArray> toList() const;

    /**
     * @brief Underlying buffer as passed at construction
     */
    QByteArrayView buffer() const { return m_buffer; }

    /**
     * @brief Encode names into the multi-string form
     *
     * Each name must be non-empty and free of NUL bytes.
     */
    static QByteArray encode(const QList<QByteArray>& names);

private:
    QByteArrayView m_buffer;
};

} // namespace Smartcard
