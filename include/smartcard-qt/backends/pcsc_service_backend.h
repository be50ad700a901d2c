// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "service_backend.h"

namespace Smartcard {

/**
 * @brief ServiceBackend over the platform PC/SC library
 *
 * Forwards to winscard (pcsc-lite on Linux/BSD, PCSC.framework on macOS,
 * winscard.dll on Windows) and normalizes the platform differences:
 * - SCARD_PROTOCOL_RAW is 0x10000 on Windows and Protocol::Raw elsewhere
 * - Windows reports the card status as an ordinal, converted with
 *   statusFromOrdinal()
 * - pcsc-lite reports SCARD_E_UNSUPPORTED_FEATURE as 0x8010001F, mapped to
 *   Error::UnsupportedFeature
 *
 * Requirements:
 * - PC/SC daemon running (pcscd on Linux/macOS, built-in on Windows)
 */
class PcscServiceBackend : public ServiceBackend {
public:
    PcscServiceBackend() = default;
    ~PcscServiceBackend() override = default;

    QString backendName() const override { return "PC/SC"; }

    uint32_t establishContext(Scope scope, quintptr* context) override;
    uint32_t releaseContext(quintptr context) override;
    uint32_t isValidContext(quintptr context) override;
    uint32_t cancel(quintptr context) override;
    uint32_t listReaders(quintptr context, char* buffer, uint32_t* length) override;
    uint32_t connect(quintptr context, const char* reader, ShareMode shareMode,
                     Protocols preferredProtocols, quintptr* card,
                     uint32_t* activeProtocol) override;
    uint32_t reconnect(quintptr card, ShareMode shareMode, Protocols preferredProtocols,
                       Disposition initialization, uint32_t* activeProtocol) override;
    uint32_t disconnect(quintptr card, Disposition disposition) override;
    uint32_t beginTransaction(quintptr card) override;
    uint32_t endTransaction(quintptr card, Disposition disposition) override;
    uint32_t status(quintptr card, char* names, uint32_t* namesLength,
                    uint32_t* state, uint32_t* protocol,
                    unsigned char* atr, uint32_t* atrLength) override;
    uint32_t getAttribute(quintptr card, uint32_t attribute,
                          unsigned char* buffer, uint32_t* length) override;
    uint32_t setAttribute(quintptr card, uint32_t attribute,
                          const unsigned char* buffer, uint32_t length) override;
    uint32_t transmit(quintptr card, Protocol protocol,
                      const unsigned char* send, uint32_t sendLength,
                      unsigned char* receive, uint32_t* receiveLength) override;
    uint32_t control(quintptr card, uint32_t code,
                     const unsigned char* send, uint32_t sendLength,
                     unsigned char* receive, uint32_t* receiveLength) override;
    uint32_t getStatusChange(quintptr context, uint32_t timeout,
                             ServiceReaderState* readers, uint32_t count) override;
};

} // namespace Smartcard
