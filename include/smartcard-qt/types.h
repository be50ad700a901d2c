// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include <QByteArray>
#include <QFlags>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace Smartcard {

/**
 * @brief Scope of a context: the namespace of readers it can see
 */
enum class Scope : uint32_t {
    User = 0x0000,
    Terminal = 0x0001,
    System = 0x0002,
    Global = 0x0003
};

/**
 * @brief How a reader connection is shared with other applications
 */
enum class ShareMode : uint32_t {
    Exclusive = 0x0001,
    Shared = 0x0002,
    Direct = 0x0003    ///< Talk to the reader itself, no card protocol
};

/**
 * @brief A smart card communication protocol
 *
 * The values are the pcsc-lite protocol bits. On Windows the PC/SC backend
 * translates Raw from/to SCARD_PROTOCOL_RAW (0x10000).
 */
enum class Protocol : uint32_t {
    T0 = 0x0001,
    T1 = 0x0002,
    Raw = 0x0004
};

/**
 * @brief A mask of acceptable protocols
 */
Q_DECLARE_FLAGS(Protocols, Protocol)

/**
 * @brief What to do with the card when disconnecting or ending a transaction
 */
enum class Disposition : uint32_t {
    LeaveCard = 0x0000,
    ResetCard = 0x0001,
    UnpowerCard = 0x0002,
    EjectCard = 0x0003
};

/**
 * @brief Reader state bits, as used by getStatusChange()
 *
 * The upper 16 bits of a raw state word hold the event counter and are not
 * part of this vocabulary (see ReaderState::eventCount()).
 */
enum class ReaderStateFlag : uint32_t {
    Unaware = 0x0000,
    Ignore = 0x0001,
    Changed = 0x0002,
    Unknown = 0x0004,
    Unavailable = 0x0008,
    Empty = 0x0010,
    Present = 0x0020,
    AtrMatch = 0x0040,
    Exclusive = 0x0080,
    InUse = 0x0100,
    Mute = 0x0200,
    Unpowered = 0x0400
};
Q_DECLARE_FLAGS(ReaderStates, ReaderStateFlag)

/**
 * @brief Status of a card in a reader, as reported by Card::status()
 *
 * Always a bitmask: Windows reports the status as an ordinal code which the
 * PC/SC backend converts with statusFromOrdinal().
 */
enum class CardStatusFlag : uint32_t {
    Unknown = 0x0001,
    Absent = 0x0002,
    Present = 0x0004,
    Swallowed = 0x0008,
    Powered = 0x0010,
    Negotiable = 0x0020,
    Specific = 0x0040
};
Q_DECLARE_FLAGS(CardStatusFlags, CardStatusFlag)

/**
 * @brief A class of reader attributes
 */
enum class AttributeClass : uint32_t {
    System = 0,
    VendorInfo = 1,
    Communications = 2,
    Protocol = 3,
    PowerMgmt = 4,
    Security = 5,
    Mechanical = 6,
    VendorDefined = 7,
    IfdProtocol = 8,
    IccState = 9
};

/**
 * @brief Compose an attribute identifier from its class and tag
 */
constexpr uint32_t attributeValue(AttributeClass cls, uint32_t tag)
{
    return (static_cast<uint32_t>(cls) << 16) | tag;
}

/**
 * @brief Card reader attribute identifiers
 */
enum class Attribute : uint32_t {
    VendorName = attributeValue(AttributeClass::VendorInfo, 0x0100),
    VendorIfdType = attributeValue(AttributeClass::VendorInfo, 0x0101),
    VendorIfdVersion = attributeValue(AttributeClass::VendorInfo, 0x0102),
    VendorIfdSerialNo = attributeValue(AttributeClass::VendorInfo, 0x0103),
    ChannelId = attributeValue(AttributeClass::Communications, 0x0110),
    AsyncProtocolTypes = attributeValue(AttributeClass::Protocol, 0x0120),
    DefaultClk = attributeValue(AttributeClass::Protocol, 0x0121),
    MaxClk = attributeValue(AttributeClass::Protocol, 0x0122),
    DefaultDataRate = attributeValue(AttributeClass::Protocol, 0x0123),
    MaxDataRate = attributeValue(AttributeClass::Protocol, 0x0124),
    MaxIfsd = attributeValue(AttributeClass::Protocol, 0x0125),
    SyncProtocolTypes = attributeValue(AttributeClass::Protocol, 0x0126),
    PowerMgmtSupport = attributeValue(AttributeClass::PowerMgmt, 0x0131),
    UserToCardAuthDevice = attributeValue(AttributeClass::Security, 0x0140),
    UserAuthInputDevice = attributeValue(AttributeClass::Security, 0x0142),
    Characteristics = attributeValue(AttributeClass::Mechanical, 0x0150),

    CurrentProtocolType = attributeValue(AttributeClass::IfdProtocol, 0x0201),
    CurrentClk = attributeValue(AttributeClass::IfdProtocol, 0x0202),
    CurrentF = attributeValue(AttributeClass::IfdProtocol, 0x0203),
    CurrentD = attributeValue(AttributeClass::IfdProtocol, 0x0204),
    CurrentN = attributeValue(AttributeClass::IfdProtocol, 0x0205),
    CurrentW = attributeValue(AttributeClass::IfdProtocol, 0x0206),
    CurrentIfsc = attributeValue(AttributeClass::IfdProtocol, 0x0207),
    CurrentIfsd = attributeValue(AttributeClass::IfdProtocol, 0x0208),
    CurrentBwt = attributeValue(AttributeClass::IfdProtocol, 0x0209),
    CurrentCwt = attributeValue(AttributeClass::IfdProtocol, 0x020a),
    CurrentEbcEncoding = attributeValue(AttributeClass::IfdProtocol, 0x020b),
    ExtendedBwt = attributeValue(AttributeClass::IfdProtocol, 0x020c),

    IccPresence = attributeValue(AttributeClass::IccState, 0x0300),
    IccInterfaceStatus = attributeValue(AttributeClass::IccState, 0x0301),
    CurrentIoState = attributeValue(AttributeClass::IccState, 0x0302),
    AtrString = attributeValue(AttributeClass::IccState, 0x0303),
    IccTypePerAtr = attributeValue(AttributeClass::IccState, 0x0304),

    EscReset = attributeValue(AttributeClass::VendorDefined, 0xA000),
    EscCancel = attributeValue(AttributeClass::VendorDefined, 0xA003),
    EscAuthRequest = attributeValue(AttributeClass::VendorDefined, 0xA005),
    MaxInput = attributeValue(AttributeClass::VendorDefined, 0xA007),

    DeviceUnit = attributeValue(AttributeClass::System, 0x0001),
    DeviceInUse = attributeValue(AttributeClass::System, 0x0002),
    DeviceFriendlyName = attributeValue(AttributeClass::System, 0x0003),
    DeviceSystemName = attributeValue(AttributeClass::System, 0x0004),
    SupressT1IfsRequest = attributeValue(AttributeClass::System, 0x0007)
};

/// Maximum number of bytes in an ATR
constexpr int MAX_ATR_SIZE = 33;

/// Size of the ATR buffer inside a reader state record (36 on Windows)
constexpr int ATR_BUFFER_SIZE = 36;

/// Maximum number of bytes in a short APDU command or response
constexpr int MAX_BUFFER_SIZE = 264;

/// Maximum number of bytes in an extended APDU command or response
constexpr int MAX_BUFFER_SIZE_EXTENDED = 4 + 3 + (1 << 16) + 3 + 2;

/// Timeout value the service treats as "wait forever"
constexpr uint32_t INFINITE_TIMEOUT = 0xFFFFFFFF;

/// Mask of the event counter stored in the upper bits of a raw reader state
constexpr uint32_t EVENT_COUNT_MASK = 0xFFFF0000;

/// Protocols accepted by default when connecting
constexpr Protocols PROTOCOLS_ANY = Protocols(Protocol::T0) | Protocol::T1;

/**
 * @brief Reserved reader name that reports reader insertions and removals
 *
 * Use it as the name of a ReaderState passed to Context::getStatusChange()
 * to be woken up when the set of readers changes.
 */
QByteArray pnpNotification();

/**
 * @brief Transform a driver control code into the platform form
 *
 * Wraps SCARD_CTL_CODE; control codes passed to Card::control() are
 * usually defined as inputs to this function.
 */
uint32_t ctlCode(uint32_t code);

/**
 * @brief Convert a raw protocol value into a Protocol
 * @param raw Protocol bits in the Protocol vocabulary (0 = undefined)
 * @return The protocol, or std::nullopt for the undefined protocol
 *
 * A value outside the known set means the service broke its contract
 * (only the offered protocols can be negotiated) and is fatal.
 */
std::optional<Protocol> protocolFromRaw(uint32_t raw);

/**
 * @brief Keep the known card status bits of a bitmask-style status word
 */
CardStatusFlags statusFromBits(uint32_t raw);

/**
 * @brief Convert an ordinal card status code (Windows) to the bitmask form
 * @param ordinal 0 = unknown, 1 = absent, 2 = present, 3 = swallowed,
 *                4 = powered, 5 = negotiable, 6 = specific
 * @return Exactly one flag, or no flag for an unrecognized ordinal
 */
CardStatusFlags statusFromOrdinal(uint32_t ordinal);

/**
 * @brief Keep the known reader state bits of a raw state word
 */
ReaderStates readerStatesFromRaw(uint32_t raw);

QString protocolName(std::optional<Protocol> protocol);
QStringList readerStateNames(ReaderStates states);
QStringList cardStatusNames(CardStatusFlags status);

} // namespace Smartcard

Q_DECLARE_OPERATORS_FOR_FLAGS(Smartcard::Protocols)
Q_DECLARE_OPERATORS_FOR_FLAGS(Smartcard::ReaderStates)
Q_DECLARE_OPERATORS_FOR_FLAGS(Smartcard::CardStatusFlags)
