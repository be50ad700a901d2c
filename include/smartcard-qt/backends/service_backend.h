// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "../types.h"
#include <QString>
#include <QtGlobal>
#include <cstdint>
#include <memory>

namespace Smartcard {

/**
 * @brief Reader state record exchanged with the service
 *
 * Plain mirror of the platform SCARD_READERSTATE. The reader name must stay
 * valid for the duration of ServiceBackend::getStatusChange().
 */
struct ServiceReaderState {
    const char* reader = nullptr;
    uint32_t currentState = 0;
    uint32_t eventState = 0;
    uint32_t atrLength = 0;
    unsigned char atr[ATR_BUFFER_SIZE] = {};
};

/**
 * @brief Abstract interface to the external smart card service
 *
 * One entry point per service operation. Each returns the raw status code
 * (0 on success, otherwise an Error value), so errorFromRaw() turns it into
 * the unified vocabulary. Context and card handles are opaque.
 *
 * Implementations translate platform differences before returning:
 * - protocols use the Protocol bit values (0 = undefined)
 * - card status uses the CardStatusFlag bitmask
 * - status codes use the Error values
 *
 * Buffer conventions follow PC/SC: a null buffer probes the required size
 * into *length; on Error::InsufficientBuffer *length receives the required
 * size when the service reports it.
 *
 * Thread Safety:
 * cancel() must be callable from any thread while another thread is blocked
 * in getStatusChange() on the same context. Other calls on one context are
 * serialized by the service.
 */
class ServiceBackend {
public:
    virtual ~ServiceBackend() = default;

    /**
     * @brief Get backend name for debugging
     */
    virtual QString backendName() const = 0;

    virtual uint32_t establishContext(Scope scope, quintptr* context) = 0;
    virtual uint32_t releaseContext(quintptr context) = 0;
    virtual uint32_t isValidContext(quintptr context) = 0;

    /**
     * @brief Wake the thread blocked in getStatusChange() on this context
     */
    virtual uint32_t cancel(quintptr context) = 0;

    /**
     * @brief Fill a multi-string buffer with the names of the readers
     * @param buffer Destination, or nullptr to probe the size
     * @param length In: buffer size. Out: bytes written or required.
     */
    virtual uint32_t listReaders(quintptr context, char* buffer, uint32_t* length) = 0;

    virtual uint32_t connect(quintptr context, const char* reader, ShareMode shareMode,
                             Protocols preferredProtocols, quintptr* card,
                             uint32_t* activeProtocol) = 0;
    virtual uint32_t reconnect(quintptr card, ShareMode shareMode,
                               Protocols preferredProtocols, Disposition initialization,
                               uint32_t* activeProtocol) = 0;
    virtual uint32_t disconnect(quintptr card, Disposition disposition) = 0;

    virtual uint32_t beginTransaction(quintptr card) = 0;
    virtual uint32_t endTransaction(quintptr card, Disposition disposition) = 0;

    /**
     * @brief Query the card status
     *
     * names and atr may be nullptr to probe their lengths.
     */
    virtual uint32_t status(quintptr card, char* names, uint32_t* namesLength,
                            uint32_t* state, uint32_t* protocol,
                            unsigned char* atr, uint32_t* atrLength) = 0;

    virtual uint32_t getAttribute(quintptr card, uint32_t attribute,
                                  unsigned char* buffer, uint32_t* length) = 0;
    virtual uint32_t setAttribute(quintptr card, uint32_t attribute,
                                  const unsigned char* buffer, uint32_t length) = 0;

    virtual uint32_t transmit(quintptr card, Protocol protocol,
                              const unsigned char* send, uint32_t sendLength,
                              unsigned char* receive, uint32_t* receiveLength) = 0;
    virtual uint32_t control(quintptr card, uint32_t code,
                             const unsigned char* send, uint32_t sendLength,
                             unsigned char* receive, uint32_t* receiveLength) = 0;

    /**
     * @brief Block until a reader state differs from its asserted state
     * @param timeout Milliseconds, INFINITE_TIMEOUT to wait forever
     *
     * Returns Error::Timeout or Error::Cancelled when woken without change.
     * On success every record's eventState, atrLength and atr are updated.
     */
    virtual uint32_t getStatusChange(quintptr context, uint32_t timeout,
                                     ServiceReaderState* readers, uint32_t count) = 0;
};

/**
 * @brief Create the backend for the current platform (PC/SC)
 */
std::shared_ptr<ServiceBackend> createDefaultBackend();

} // namespace Smartcard
