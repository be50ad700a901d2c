// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "smartcard-qt/backends/service_backend.h"
#include <QtGlobal>
#include <memory>

namespace Smartcard {

/**
 * @brief Session shared by Context copies and open cards
 *
 * Releases the service handle when the last holder goes away, unless it
 * was released explicitly.
 */
struct ContextData {
    ContextData(std::shared_ptr<ServiceBackend> backend, quintptr handle);
    ~ContextData();

    ContextData(const ContextData&) = delete;
    ContextData& operator=(const ContextData&) = delete;

    ServiceBackend* service() const { return backend.get(); }

    std::shared_ptr<ServiceBackend> backend;
    quintptr handle;
    bool released = false;
};

} // namespace Smartcard
