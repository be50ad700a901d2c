// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/error.h"
#include <QDebug>

namespace Smartcard {

// Bounds of the two contiguous blocks of known status codes
static const uint32_t FIRST_ERROR_BLOCK_BEGIN = 0x80100001;
static const uint32_t FIRST_ERROR_BLOCK_END = 0x80100031;
static const uint32_t SECOND_ERROR_BLOCK_BEGIN = 0x80100065;
static const uint32_t SECOND_ERROR_BLOCK_END = 0x80100072;

Error errorFromRaw(uint32_t raw)
{
    if (raw == 0) {
        return Error::Success;
    }

    if ((raw >= FIRST_ERROR_BLOCK_BEGIN && raw <= FIRST_ERROR_BLOCK_END) ||
        (raw >= SECOND_ERROR_BLOCK_BEGIN && raw <= SECOND_ERROR_BLOCK_END)) {
        return static_cast<Error>(raw);
    }

    // Masking unknown codes keeps the enum closed for callers
    qWarning() << "Smartcard: Unknown service status code:"
               << QString("0x%1").arg(raw, 8, 16, QChar('0'));
    return Error::UnknownError;
}

QString errorMessage(Error error)
{
    // Descriptions follow the PC/SC reference documentation
    switch (error) {
    case Error::Success:
        return QStringLiteral("Success");
    case Error::InternalError:
        return QStringLiteral("An internal consistency check failed");
    case Error::Cancelled:
        return QStringLiteral("The action was cancelled by an SCardCancel request");
    case Error::InvalidHandle:
        return QStringLiteral("The supplied handle was invalid");
    case Error::InvalidParameter:
        return QStringLiteral("One or more of the supplied parameters could not be properly interpreted");
    case Error::InvalidTarget:
        return QStringLiteral("Registry startup information is missing or invalid");
    case Error::NoMemory:
        return QStringLiteral("Not enough memory available to complete this command");
    case Error::WaitedTooLong:
        return QStringLiteral("An internal consistency timer has expired");
    case Error::InsufficientBuffer:
        return QStringLiteral("The data buffer to receive returned data is too small for the returned data");
    case Error::UnknownReader:
        return QStringLiteral("The specified reader name is not recognized");
    case Error::Timeout:
        return QStringLiteral("The user-specified timeout value has expired");
    case Error::SharingViolation:
        return QStringLiteral("The smart card cannot be accessed because of other connections outstanding");
    case Error::NoSmartcard:
        return QStringLiteral("The operation requires a Smart Card, but no Smart Card is currently in the device");
    case Error::UnknownCard:
        return QStringLiteral("The specified smart card name is not recognized");
    case Error::CantDispose:
        return QStringLiteral("The system could not dispose of the media in the requested manner");
    case Error::ProtoMismatch:
        return QStringLiteral("The requested protocols are incompatible with the protocol currently in use with the smart card");
    case Error::NotReady:
        return QStringLiteral("The reader or smart card is not ready to accept commands");
    case Error::InvalidValue:
        return QStringLiteral("One or more of the supplied parameters values could not be properly interpreted");
    case Error::SystemCancelled:
        return QStringLiteral("The action was cancelled by the system, presumably to log off or shut down");
    case Error::CommError:
        return QStringLiteral("An internal communications error has been detected");
    case Error::UnknownError:
        return QStringLiteral("An internal error has been detected, but the source is unknown");
    case Error::InvalidAtr:
        return QStringLiteral("An ATR obtained from the registry is not a valid ATR string");
    case Error::NotTransacted:
        return QStringLiteral("An attempt was made to end a non-existent transaction");
    case Error::ReaderUnavailable:
        return QStringLiteral("The specified reader is not currently available for use");
    case Error::Shutdown:
        return QStringLiteral("The operation has been aborted to allow the server application to exit");
    case Error::PciTooSmall:
        return QStringLiteral("The PCI Receive buffer was too small");
    case Error::ReaderUnsupported:
        return QStringLiteral("The reader driver does not meet minimal requirements for support");
    case Error::DuplicateReader:
        return QStringLiteral("The reader driver did not produce a unique reader name");
    case Error::CardUnsupported:
        return QStringLiteral("The smart card does not meet minimal requirements for support");
    case Error::NoService:
        return QStringLiteral("The Smart card resource manager is not running");
    case Error::ServiceStopped:
        return QStringLiteral("The Smart card resource manager has shut down");
    case Error::Unexpected:
        return QStringLiteral("An unexpected card error has occurred");
    case Error::IccInstallation:
        return QStringLiteral("No primary provider can be found for the smart card");
    case Error::IccCreateorder:
        return QStringLiteral("The requested order of object creation is not supported");
    case Error::UnsupportedFeature:
        return QStringLiteral("This smart card does not support the requested feature");
    case Error::DirNotFound:
        return QStringLiteral("The identified directory does not exist in the smart card");
    case Error::FileNotFound:
        return QStringLiteral("The identified file does not exist in the smart card");
    case Error::NoDir:
        return QStringLiteral("The supplied path does not represent a smart card directory");
    case Error::NoFile:
        return QStringLiteral("The supplied path does not represent a smart card file");
    case Error::NoAccess:
        return QStringLiteral("Access is denied to this file");
    case Error::WriteTooMany:
        return QStringLiteral("The smart card does not have enough memory to store the information");
    case Error::BadSeek:
        return QStringLiteral("There was an error trying to set the smart card file object pointer");
    case Error::InvalidChv:
        return QStringLiteral("The supplied PIN is incorrect");
    case Error::UnknownResMng:
        return QStringLiteral("An unrecognized error code was returned from a layered component");
    case Error::NoSuchCertificate:
        return QStringLiteral("The requested certificate does not exist");
    case Error::CertificateUnavailable:
        return QStringLiteral("The requested certificate could not be obtained");
    case Error::NoReadersAvailable:
        return QStringLiteral("Cannot find a smart card reader");
    case Error::CommDataLost:
        return QStringLiteral("A communications error with the smart card has been detected. Retry the operation");
    case Error::NoKeyContainer:
        return QStringLiteral("The requested key container does not exist on the smart card");
    case Error::ServerTooBusy:
        return QStringLiteral("The smart card resource manager is too busy to complete this operation");
    case Error::UnsupportedCard:
        return QStringLiteral("The reader cannot communicate with the card, due to ATR string configuration conflicts");
    case Error::UnresponsiveCard:
        return QStringLiteral("The smart card is not responding to a reset");
    case Error::UnpoweredCard:
        return QStringLiteral("Power has been removed from the smart card, so that further communication is not possible");
    case Error::ResetCard:
        return QStringLiteral("The smart card has been reset, so any shared state information is invalid");
    case Error::RemovedCard:
        return QStringLiteral("The smart card has been removed, so further communication is not possible");
    case Error::SecurityViolation:
        return QStringLiteral("Access was denied because of a security violation");
    case Error::WrongChv:
        return QStringLiteral("The card cannot be accessed because the wrong PIN was presented");
    case Error::ChvBlocked:
        return QStringLiteral("The card cannot be accessed because the maximum number of PIN entry attempts has been reached");
    case Error::Eof:
        return QStringLiteral("The end of the smart card file has been reached");
    case Error::CancelledByUser:
        return QStringLiteral("The user pressed \"Cancel\" on a Smart Card Selection Dialog");
    case Error::CardNotAuthenticated:
        return QStringLiteral("No PIN was presented to the smart card");
    case Error::CacheItemNotFound:
        return QStringLiteral("The requested item could not be found in the cache");
    case Error::CacheItemStale:
        return QStringLiteral("The requested cache item is too old and was deleted from the cache");
    case Error::CacheItemTooBig:
        return QStringLiteral("The new cache item exceeds the maximum per-item size defined for the cache");
    }
    return QStringLiteral("Unknown error: 0x%1").arg(errorToRaw(error), 8, 16, QLatin1Char('0'));
}

QString errorName(Error error)
{
#define CASE(X, NAME) case Error::X: return QStringLiteral(NAME)
    switch (error) {
        CASE(Success, "SCARD_S_SUCCESS");
        CASE(InternalError, "SCARD_F_INTERNAL_ERROR");
        CASE(Cancelled, "SCARD_E_CANCELLED");
        CASE(InvalidHandle, "SCARD_E_INVALID_HANDLE");
        CASE(InvalidParameter, "SCARD_E_INVALID_PARAMETER");
        CASE(InvalidTarget, "SCARD_E_INVALID_TARGET");
        CASE(NoMemory, "SCARD_E_NO_MEMORY");
        CASE(WaitedTooLong, "SCARD_F_WAITED_TOO_LONG");
        CASE(InsufficientBuffer, "SCARD_E_INSUFFICIENT_BUFFER");
        CASE(UnknownReader, "SCARD_E_UNKNOWN_READER");
        CASE(Timeout, "SCARD_E_TIMEOUT");
        CASE(SharingViolation, "SCARD_E_SHARING_VIOLATION");
        CASE(NoSmartcard, "SCARD_E_NO_SMARTCARD");
        CASE(UnknownCard, "SCARD_E_UNKNOWN_CARD");
        CASE(CantDispose, "SCARD_E_CANT_DISPOSE");
        CASE(ProtoMismatch, "SCARD_E_PROTO_MISMATCH");
        CASE(NotReady, "SCARD_E_NOT_READY");
        CASE(InvalidValue, "SCARD_E_INVALID_VALUE");
        CASE(SystemCancelled, "SCARD_E_SYSTEM_CANCELLED");
        CASE(CommError, "SCARD_F_COMM_ERROR");
        CASE(UnknownError, "SCARD_F_UNKNOWN_ERROR");
        CASE(InvalidAtr, "SCARD_E_INVALID_ATR");
        CASE(NotTransacted, "SCARD_E_NOT_TRANSACTED");
        CASE(ReaderUnavailable, "SCARD_E_READER_UNAVAILABLE");
        CASE(Shutdown, "SCARD_P_SHUTDOWN");
        CASE(PciTooSmall, "SCARD_E_PCI_TOO_SMALL");
        CASE(ReaderUnsupported, "SCARD_E_READER_UNSUPPORTED");
        CASE(DuplicateReader, "SCARD_E_DUPLICATE_READER");
        CASE(CardUnsupported, "SCARD_E_CARD_UNSUPPORTED");
        CASE(NoService, "SCARD_E_NO_SERVICE");
        CASE(ServiceStopped, "SCARD_E_SERVICE_STOPPED");
        CASE(Unexpected, "SCARD_E_UNEXPECTED");
        CASE(IccInstallation, "SCARD_E_ICC_INSTALLATION");
        CASE(IccCreateorder, "SCARD_E_ICC_CREATEORDER");
        CASE(UnsupportedFeature, "SCARD_E_UNSUPPORTED_FEATURE");
        CASE(DirNotFound, "SCARD_E_DIR_NOT_FOUND");
        CASE(FileNotFound, "SCARD_E_FILE_NOT_FOUND");
        CASE(NoDir, "SCARD_E_NO_DIR");
        CASE(NoFile, "SCARD_E_NO_FILE");
        CASE(NoAccess, "SCARD_E_NO_ACCESS");
        CASE(WriteTooMany, "SCARD_E_WRITE_TOO_MANY");
        CASE(BadSeek, "SCARD_E_BAD_SEEK");
        CASE(InvalidChv, "SCARD_E_INVALID_CHV");
        CASE(UnknownResMng, "SCARD_E_UNKNOWN_RES_MNG");
        CASE(NoSuchCertificate, "SCARD_E_NO_SUCH_CERTIFICATE");
        CASE(CertificateUnavailable, "SCARD_E_CERTIFICATE_UNAVAILABLE");
        CASE(NoReadersAvailable, "SCARD_E_NO_READERS_AVAILABLE");
        CASE(CommDataLost, "SCARD_E_COMM_DATA_LOST");
        CASE(NoKeyContainer, "SCARD_E_NO_KEY_CONTAINER");
        CASE(ServerTooBusy, "SCARD_E_SERVER_TOO_BUSY");
        CASE(UnsupportedCard, "SCARD_W_UNSUPPORTED_CARD");
        CASE(UnresponsiveCard, "SCARD_W_UNRESPONSIVE_CARD");
        CASE(UnpoweredCard, "SCARD_W_UNPOWERED_CARD");
        CASE(ResetCard, "SCARD_W_RESET_CARD");
        CASE(RemovedCard, "SCARD_W_REMOVED_CARD");
        CASE(SecurityViolation, "SCARD_W_SECURITY_VIOLATION");
        CASE(WrongChv, "SCARD_W_WRONG_CHV");
        CASE(ChvBlocked, "SCARD_W_CHV_BLOCKED");
        CASE(Eof, "SCARD_W_EOF");
        CASE(CancelledByUser, "SCARD_W_CANCELLED_BY_USER");
        CASE(CardNotAuthenticated, "SCARD_W_CARD_NOT_AUTHENTICATED");
        CASE(CacheItemNotFound, "SCARD_W_CACHE_ITEM_NOT_FOUND");
        CASE(CacheItemStale, "SCARD_W_CACHE_ITEM_STALE");
        CASE(CacheItemTooBig, "SCARD_W_CACHE_ITEM_TOO_BIG");
    }
#undef CASE
    return QStringLiteral("UNKNOWN");
}

ErrorCategory errorCategory(Error error)
{
    switch (error) {
    case Error::Success:
        return ErrorCategory::None;

    case Error::InvalidHandle:
    case Error::InvalidParameter:
    case Error::InvalidTarget:
    case Error::InvalidValue:
    case Error::InsufficientBuffer:
    case Error::PciTooSmall:
    case Error::NoMemory:
    case Error::NotTransacted:
    case Error::CantDispose:
        return ErrorCategory::Usage;

    case Error::NoService:
    case Error::ServiceStopped:
    case Error::Shutdown:
    case Error::NoReadersAvailable:
    case Error::ReaderUnavailable:
    case Error::ReaderUnsupported:
    case Error::DuplicateReader:
    case Error::UnknownReader:
    case Error::NoSmartcard:
    case Error::UnknownCard:
    case Error::CardUnsupported:
    case Error::UnsupportedCard:
    case Error::UnsupportedFeature:
    case Error::IccInstallation:
    case Error::IccCreateorder:
    case Error::ServerTooBusy:
        return ErrorCategory::Availability;

    case Error::SharingViolation:
    case Error::NotReady:
    case Error::ProtoMismatch:
    case Error::InvalidAtr:
    case Error::ResetCard:
    case Error::RemovedCard:
    case Error::UnpoweredCard:
    case Error::UnresponsiveCard:
        return ErrorCategory::State;

    case Error::Timeout:
    case Error::Cancelled:
    case Error::SystemCancelled:
    case Error::CancelledByUser:
    case Error::WaitedTooLong:
        return ErrorCategory::Timing;

    case Error::DirNotFound:
    case Error::FileNotFound:
    case Error::NoDir:
    case Error::NoFile:
    case Error::NoAccess:
    case Error::WriteTooMany:
    case Error::BadSeek:
    case Error::Eof:
    case Error::InvalidChv:
    case Error::WrongChv:
    case Error::ChvBlocked:
    case Error::CardNotAuthenticated:
    case Error::SecurityViolation:
    case Error::NoSuchCertificate:
    case Error::CertificateUnavailable:
    case Error::NoKeyContainer:
    case Error::CacheItemNotFound:
    case Error::CacheItemStale:
    case Error::CacheItemTooBig:
        return ErrorCategory::CardContent;

    case Error::InternalError:
    case Error::CommError:
    case Error::CommDataLost:
    case Error::UnknownError:
    case Error::UnknownResMng:
    case Error::Unexpected:
        return ErrorCategory::Internal;
    }
    return ErrorCategory::Internal;
}

bool isRetryable(Error error)
{
    switch (error) {
    case Error::Timeout:
    case Error::ServerTooBusy:
    case Error::NotReady:
    case Error::CommDataLost:
    case Error::ResetCard:
    case Error::SharingViolation:
        return true;
    default:
        return false;
    }
}

} // namespace Smartcard
