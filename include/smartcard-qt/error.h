// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include <QString>
#include <cstdint>

namespace Smartcard {

/**
 * @brief Status codes reported by the smart card service
 *
 * The numeric values are the PC/SC status codes, so a raw code returned by
 * the service converts to this enum one-to-one (see errorFromRaw()).
 *
 * Codes form two contiguous blocks:
 * - 0x80100001 - 0x80100031: SCARD_F_* / SCARD_E_* / SCARD_P_*
 * - 0x80100065 - 0x80100072: SCARD_W_*
 *
 * pcsc-lite reports SCARD_E_UNSUPPORTED_FEATURE as 0x8010001F, which is
 * SCARD_E_UNEXPECTED on Windows. The PC/SC backend maps it to
 * UnsupportedFeature so both platforms share the values below.
 */
enum class Error : uint32_t {
    Success = 0x00000000,

    // Usage and internal consistency
    InternalError = 0x80100001,
    Cancelled = 0x80100002,
    InvalidHandle = 0x80100003,
    InvalidParameter = 0x80100004,
    InvalidTarget = 0x80100005,
    NoMemory = 0x80100006,
    WaitedTooLong = 0x80100007,
    InsufficientBuffer = 0x80100008,
    UnknownReader = 0x80100009,
    Timeout = 0x8010000A,
    SharingViolation = 0x8010000B,
    NoSmartcard = 0x8010000C,
    UnknownCard = 0x8010000D,
    CantDispose = 0x8010000E,
    ProtoMismatch = 0x8010000F,
    NotReady = 0x80100010,
    InvalidValue = 0x80100011,
    SystemCancelled = 0x80100012,
    CommError = 0x80100013,
    UnknownError = 0x80100014,
    InvalidAtr = 0x80100015,
    NotTransacted = 0x80100016,
    ReaderUnavailable = 0x80100017,
    Shutdown = 0x80100018,
    PciTooSmall = 0x80100019,
    ReaderUnsupported = 0x8010001A,
    DuplicateReader = 0x8010001B,
    CardUnsupported = 0x8010001C,
    NoService = 0x8010001D,
    ServiceStopped = 0x8010001E,
    Unexpected = 0x8010001F,
    IccInstallation = 0x80100020,
    IccCreateorder = 0x80100021,
    UnsupportedFeature = 0x80100022,
    DirNotFound = 0x80100023,
    FileNotFound = 0x80100024,
    NoDir = 0x80100025,
    NoFile = 0x80100026,
    NoAccess = 0x80100027,
    WriteTooMany = 0x80100028,
    BadSeek = 0x80100029,
    InvalidChv = 0x8010002A,
    UnknownResMng = 0x8010002B,
    NoSuchCertificate = 0x8010002C,
    CertificateUnavailable = 0x8010002D,
    NoReadersAvailable = 0x8010002E,
    CommDataLost = 0x8010002F,
    NoKeyContainer = 0x80100030,
    ServerTooBusy = 0x80100031,

    // Card state warnings
    UnsupportedCard = 0x80100065,
    UnresponsiveCard = 0x80100066,
    UnpoweredCard = 0x80100067,
    ResetCard = 0x80100068,
    RemovedCard = 0x80100069,
    SecurityViolation = 0x8010006A,
    WrongChv = 0x8010006B,
    ChvBlocked = 0x8010006C,
    Eof = 0x8010006D,
    CancelledByUser = 0x8010006E,
    CardNotAuthenticated = 0x8010006F,
    CacheItemNotFound = 0x80100070,
    CacheItemStale = 0x80100071,
    CacheItemTooBig = 0x80100072,
};

/**
 * @brief Coarse grouping of errors for callers that react by kind
 */
enum class ErrorCategory {
    None,           ///< Success
    Usage,          ///< Invalid handle/parameter, insufficient buffer, ...
    Availability,   ///< No service, reader unavailable, no smartcard, ...
    State,          ///< Sharing violation, not ready, card reset/removed, ...
    Timing,         ///< Timeout and cancellation
    CardContent,    ///< File/dir not found, PIN and certificate errors
    Internal        ///< Internal, communication and unknown failures
};

/**
 * @brief Convert a raw service status code into an Error
 * @param raw Status code as returned by the service (0 = success)
 * @return Matching Error, or Error::UnknownError for unrecognized codes
 *
 * Unrecognized codes are logged with qWarning() and never produce an
 * out-of-range enum value.
 */
Error errorFromRaw(uint32_t raw);

/**
 * @brief Raw status code of an Error
 */
inline uint32_t errorToRaw(Error error) { return static_cast<uint32_t>(error); }

/**
 * @brief Human-readable description of an error
 */
QString errorMessage(Error error);

/**
 * @brief Symbolic name of an error (e.g. "SCARD_E_TIMEOUT")
 */
QString errorName(Error error);

/**
 * @brief Group an error into its category
 */
ErrorCategory errorCategory(Error error);

/**
 * @brief Check if the operation may succeed when retried with the same inputs
 *
 * True for transient conditions: timeout, busy service, reader not ready,
 * lost communication data, card reset and sharing violation.
 * Error::InsufficientBuffer is not retryable as-is: the caller must retry
 * with a bigger buffer.
 */
bool isRetryable(Error error);

} // namespace Smartcard
