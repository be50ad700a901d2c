// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/types.h"
#include <QtGlobal>

namespace Smartcard {

namespace {

constexpr uint32_t KNOWN_READER_STATES = 0x07FF;
constexpr uint32_t KNOWN_CARD_STATUS = 0x007F;

} // anonymous namespace

QByteArray pnpNotification()
{
    return QByteArrayLiteral("\\\\?PnP?\\Notification");
}

uint32_t ctlCode(uint32_t code)
{
#ifdef Q_OS_WIN
    // FILE_DEVICE_SMARTCARD, METHOD_BUFFERED, FILE_ANY_ACCESS
    return 0x00310000 | (code << 2);
#else
    return 0x42000000 + code;
#endif
}

std::optional<Protocol> protocolFromRaw(uint32_t raw)
{
    switch (raw) {
    case 0:
        return std::nullopt;
    case static_cast<uint32_t>(Protocol::T0):
        return Protocol::T0;
    case static_cast<uint32_t>(Protocol::T1):
        return Protocol::T1;
    case static_cast<uint32_t>(Protocol::Raw):
        return Protocol::Raw;
    default:
        qFatal("Smartcard: service negotiated an impossible protocol 0x%x", raw);
    }
    return std::nullopt;
}

CardStatusFlags statusFromBits(uint32_t raw)
{
    return CardStatusFlags::fromInt(raw & KNOWN_CARD_STATUS);
}

CardStatusFlags statusFromOrdinal(uint32_t ordinal)
{
    switch (ordinal) {
    case 0: return CardStatusFlag::Unknown;
    case 1: return CardStatusFlag::Absent;
    case 2: return CardStatusFlag::Present;
    case 3: return CardStatusFlag::Swallowed;
    case 4: return CardStatusFlag::Powered;
    case 5: return CardStatusFlag::Negotiable;
    case 6: return CardStatusFlag::Specific;
    default:
        return CardStatusFlags();
    }
}

ReaderStates readerStatesFromRaw(uint32_t raw)
{
    return ReaderStates::fromInt(raw & KNOWN_READER_STATES);
}

QString protocolName(std::optional<Protocol> protocol)
{
    if (!protocol) {
        return QStringLiteral("undefined");
    }
    switch (*protocol) {
    case Protocol::T0: return QStringLiteral("T=0");
    case Protocol::T1: return QStringLiteral("T=1");
    case Protocol::Raw: return QStringLiteral("raw");
    }
    return QStringLiteral("undefined");
}

QStringList readerStateNames(ReaderStates states)
{
    static const struct {
        ReaderStateFlag flag;
        const char* name;
    } names[] = {
        {ReaderStateFlag::Ignore, "IGNORE"},
        {ReaderStateFlag::Changed, "CHANGED"},
        {ReaderStateFlag::Unknown, "UNKNOWN"},
        {ReaderStateFlag::Unavailable, "UNAVAILABLE"},
        {ReaderStateFlag::Empty, "EMPTY"},
        {ReaderStateFlag::Present, "PRESENT"},
        {ReaderStateFlag::AtrMatch, "ATRMATCH"},
        {ReaderStateFlag::Exclusive, "EXCLUSIVE"},
        {ReaderStateFlag::InUse, "INUSE"},
        {ReaderStateFlag::Mute, "MUTE"},
        {ReaderStateFlag::Unpowered, "UNPOWERED"},
    };

    QStringList result;
    for (const auto& entry : names) {
        if (states.testFlag(entry.flag)) {
            result.append(QString::fromLatin1(entry.name));
        }
    }
    if (result.isEmpty()) {
        result.append(QStringLiteral("UNAWARE"));
    }
    return result;
}

QStringList cardStatusNames(CardStatusFlags status)
{
    static const struct {
        CardStatusFlag flag;
        const char* name;
    } names[] = {
        {CardStatusFlag::Unknown, "UNKNOWN"},
        {CardStatusFlag::Absent, "ABSENT"},
        {CardStatusFlag::Present, "PRESENT"},
        {CardStatusFlag::Swallowed, "SWALLOWED"},
        {CardStatusFlag::Powered, "POWERED"},
        {CardStatusFlag::Negotiable, "NEGOTIABLE"},
        {CardStatusFlag::Specific, "SPECIFIC"},
    };

    QStringList result;
    for (const auto& entry : names) {
        if (status.testFlag(entry.flag)) {
            result.append(QString::fromLatin1(entry.name));
        }
    }
    return result;
}

} // namespace Smartcard
