// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "smartcard-qt/backends/pcsc_service_backend.h"
#include "smartcard-qt/error.h"
#include <QDebug>
#include <algorithm>
#include <cstring>
#include <vector>

#ifdef Q_OS_WIN
#include <winscard.h>
#elif defined(Q_OS_LINUX)
// Linux PCSC headers define all types
#include <PCSC/winscard.h>
#include <PCSC/pcsclite.h>
#else
// macOS PCSC headers need manual type definitions
#include <PCSC/winscard.h>
#include <PCSC/pcsclite.h>

// macOS doesn't define these Windows-style types
typedef uint32_t DWORD;
typedef int32_t LONG;
typedef uint8_t BYTE;
#endif

namespace Smartcard {

namespace {

#ifdef Q_OS_WIN
// Reader names are handled as bytes, so use the ANSI entry points
typedef SCARD_READERSTATEA NativeReaderState;
#else
typedef SCARD_READERSTATE NativeReaderState;
#endif

// pcsc-lite value of SCARD_E_UNSUPPORTED_FEATURE
constexpr uint32_t PCSCLITE_UNSUPPORTED_FEATURE = 0x8010001F;

uint32_t translateStatus(LONG rv)
{
    const uint32_t code = static_cast<uint32_t>(rv);
#ifndef Q_OS_WIN
    if (code == PCSCLITE_UNSUPPORTED_FEATURE) {
        return errorToRaw(Error::UnsupportedFeature);
    }
#endif
    return code;
}

DWORD toNativeProtocols(Protocols protocols)
{
    DWORD native = 0;
    if (protocols.testFlag(Protocol::T0)) {
        native |= SCARD_PROTOCOL_T0;
    }
    if (protocols.testFlag(Protocol::T1)) {
        native |= SCARD_PROTOCOL_T1;
    }
    if (protocols.testFlag(Protocol::Raw)) {
        native |= SCARD_PROTOCOL_RAW;
    }
    return native;
}

uint32_t fromNativeProtocol(DWORD native)
{
    switch (native) {
    case SCARD_PROTOCOL_T0:
        return static_cast<uint32_t>(Protocol::T0);
    case SCARD_PROTOCOL_T1:
        return static_cast<uint32_t>(Protocol::T1);
    case SCARD_PROTOCOL_RAW:
        return static_cast<uint32_t>(Protocol::Raw);
    default:
        // Undefined (0) or a value protocolFromRaw() rejects
        return static_cast<uint32_t>(native);
    }
}

uint32_t fromNativeStatus(DWORD native)
{
#ifdef Q_OS_WIN
    return statusFromOrdinal(static_cast<uint32_t>(native)).toInt();
#else
    return statusFromBits(static_cast<uint32_t>(native)).toInt();
#endif
}

const SCARD_IO_REQUEST* sendPci(Protocol protocol)
{
    switch (protocol) {
    case Protocol::T0:
        return SCARD_PCI_T0;
    case Protocol::T1:
        return SCARD_PCI_T1;
    case Protocol::Raw:
        break;
    }
    return SCARD_PCI_RAW;
}

} // anonymous namespace

uint32_t PcscServiceBackend::establishContext(Scope scope, quintptr* context)
{
    SCARDCONTEXT handle = 0;
    LONG rv = SCardEstablishContext(static_cast<DWORD>(scope), NULL, NULL, &handle);

    if (rv != SCARD_S_SUCCESS) {
        qWarning() << "PcscServiceBackend: Failed to establish PC/SC context:"
                   << QString("0x%1").arg(static_cast<uint32_t>(rv), 0, 16);
        return translateStatus(rv);
    }

    *context = static_cast<quintptr>(handle);
    qDebug() << "PcscServiceBackend: PC/SC context established";
    return 0;
}

uint32_t PcscServiceBackend::releaseContext(quintptr context)
{
    return translateStatus(SCardReleaseContext(static_cast<SCARDCONTEXT>(context)));
}

uint32_t PcscServiceBackend::isValidContext(quintptr context)
{
    return translateStatus(SCardIsValidContext(static_cast<SCARDCONTEXT>(context)));
}

uint32_t PcscServiceBackend::cancel(quintptr context)
{
    return translateStatus(SCardCancel(static_cast<SCARDCONTEXT>(context)));
}

uint32_t PcscServiceBackend::listReaders(quintptr context, char* buffer, uint32_t* length)
{
    DWORD size = buffer ? *length : 0;

#ifdef Q_OS_WIN
    LONG rv = SCardListReadersA(static_cast<SCARDCONTEXT>(context), NULL, buffer, &size);
#else
    LONG rv = SCardListReaders(static_cast<SCARDCONTEXT>(context), NULL, buffer, &size);
#endif

    *length = static_cast<uint32_t>(size);
    return translateStatus(rv);
}

uint32_t PcscServiceBackend::connect(quintptr context, const char* reader, ShareMode shareMode,
                                     Protocols preferredProtocols, quintptr* card,
                                     uint32_t* activeProtocol)
{
    SCARDHANDLE handle = 0;
    DWORD protocol = 0;

#ifdef Q_OS_WIN
    LONG rv = SCardConnectA(
#else
    LONG rv = SCardConnect(
#endif
        static_cast<SCARDCONTEXT>(context),
        reader,
        static_cast<DWORD>(shareMode),
        toNativeProtocols(preferredProtocols),
        &handle,
        &protocol
    );

    if (rv != SCARD_S_SUCCESS) {
        return translateStatus(rv);
    }

    *card = static_cast<quintptr>(handle);
    *activeProtocol = fromNativeProtocol(protocol);
    return 0;
}

uint32_t PcscServiceBackend::reconnect(quintptr card, ShareMode shareMode,
                                       Protocols preferredProtocols, Disposition initialization,
                                       uint32_t* activeProtocol)
{
    DWORD protocol = 0;
    LONG rv = SCardReconnect(
        static_cast<SCARDHANDLE>(card),
        static_cast<DWORD>(shareMode),
        toNativeProtocols(preferredProtocols),
        static_cast<DWORD>(initialization),
        &protocol
    );

    if (rv != SCARD_S_SUCCESS) {
        return translateStatus(rv);
    }

    *activeProtocol = fromNativeProtocol(protocol);
    return 0;
}

uint32_t PcscServiceBackend::disconnect(quintptr card, Disposition disposition)
{
    return translateStatus(SCardDisconnect(static_cast<SCARDHANDLE>(card),
                                           static_cast<DWORD>(disposition)));
}

uint32_t PcscServiceBackend::beginTransaction(quintptr card)
{
    return translateStatus(SCardBeginTransaction(static_cast<SCARDHANDLE>(card)));
}

uint32_t PcscServiceBackend::endTransaction(quintptr card, Disposition disposition)
{
    return translateStatus(SCardEndTransaction(static_cast<SCARDHANDLE>(card),
                                               static_cast<DWORD>(disposition)));
}

uint32_t PcscServiceBackend::status(quintptr card, char* names, uint32_t* namesLength,
                                    uint32_t* state, uint32_t* protocol,
                                    unsigned char* atr, uint32_t* atrLength)
{
    DWORD namesSize = names ? *namesLength : 0;
    DWORD atrSize = atr ? *atrLength : 0;
    DWORD nativeState = 0;
    DWORD nativeProtocol = 0;

#ifdef Q_OS_WIN
    LONG rv = SCardStatusA(
#else
    LONG rv = SCardStatus(
#endif
        static_cast<SCARDHANDLE>(card),
        names,
        &namesSize,
        &nativeState,
        &nativeProtocol,
        atr,
        &atrSize
    );

    *namesLength = static_cast<uint32_t>(namesSize);
    *atrLength = static_cast<uint32_t>(atrSize);

    if (rv != SCARD_S_SUCCESS) {
        return translateStatus(rv);
    }

    *state = fromNativeStatus(nativeState);
    *protocol = fromNativeProtocol(nativeProtocol);
    return 0;
}

uint32_t PcscServiceBackend::getAttribute(quintptr card, uint32_t attribute,
                                          unsigned char* buffer, uint32_t* length)
{
    DWORD size = buffer ? *length : 0;
    LONG rv = SCardGetAttrib(static_cast<SCARDHANDLE>(card), attribute, buffer, &size);
    *length = static_cast<uint32_t>(size);
    return translateStatus(rv);
}

uint32_t PcscServiceBackend::setAttribute(quintptr card, uint32_t attribute,
                                          const unsigned char* buffer, uint32_t length)
{
    return translateStatus(SCardSetAttrib(static_cast<SCARDHANDLE>(card), attribute,
                                          buffer, length));
}

uint32_t PcscServiceBackend::transmit(quintptr card, Protocol protocol,
                                      const unsigned char* send, uint32_t sendLength,
                                      unsigned char* receive, uint32_t* receiveLength)
{
    DWORD size = *receiveLength;
    LONG rv = SCardTransmit(
        static_cast<SCARDHANDLE>(card),
        sendPci(protocol),
        send,
        sendLength,
        NULL,
        receive,
        &size
    );
    *receiveLength = static_cast<uint32_t>(size);
    return translateStatus(rv);
}

uint32_t PcscServiceBackend::control(quintptr card, uint32_t code,
                                     const unsigned char* send, uint32_t sendLength,
                                     unsigned char* receive, uint32_t* receiveLength)
{
    DWORD returned = 0;
    LONG rv = SCardControl(
        static_cast<SCARDHANDLE>(card),
        code,
        send,
        sendLength,
        receive,
        *receiveLength,
        &returned
    );
    *receiveLength = static_cast<uint32_t>(returned);
    return translateStatus(rv);
}

uint32_t PcscServiceBackend::getStatusChange(quintptr context, uint32_t timeout,
                                             ServiceReaderState* readers, uint32_t count)
{
    std::vector<NativeReaderState> states(count);
    for (uint32_t i = 0; i < count; ++i) {
        memset(&states[i], 0, sizeof(NativeReaderState));
        states[i].szReader = readers[i].reader;
        states[i].dwCurrentState = readers[i].currentState;
    }

#ifdef Q_OS_WIN
    LONG rv = SCardGetStatusChangeA(
#else
    LONG rv = SCardGetStatusChange(
#endif
        static_cast<SCARDCONTEXT>(context),
        timeout,
        states.data(),
        count
    );

    if (rv != SCARD_S_SUCCESS) {
        return translateStatus(rv);
    }

    for (uint32_t i = 0; i < count; ++i) {
        const DWORD atrSize = std::min<DWORD>(states[i].cbAtr, sizeof(states[i].rgbAtr));
        readers[i].eventState = static_cast<uint32_t>(states[i].dwEventState);
        readers[i].atrLength = static_cast<uint32_t>(std::min<DWORD>(atrSize, ATR_BUFFER_SIZE));
        memcpy(readers[i].atr, states[i].rgbAtr, readers[i].atrLength);
    }
    return 0;
}

} // namespace Smartcard
