// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#pragma once

#include "error.h"
#include <QString>
#include <QtGlobal>
#include <optional>
#include <utility>

namespace Smartcard {

/**
 * @brief Value or error returned by every fallible smart card operation
 *
 * On success holds the value; on failure holds the Error and, for
 * Error::InsufficientBuffer, the buffer size the service asked for (or -1
 * when it was not reported).
 *
 * Example:
 * @code
 * auto context = Context::establish(Scope::User);
 * if (!context.isOk()) {
 *     qWarning() << "No PC/SC:" << context.errorMessage();
 *     return;
 * }
 * Context ctx = context.takeValue();
 * @endcode
 */
template <typename T>
class Result {
public:
    static Result fromSuccess(T value) {
        Result result;
        result.m_value.emplace(std::move(value));
        result.m_error = Error::Success;
        return result;
    }

    static Result fromError(Error error, qsizetype requiredSize = -1) {
        Result result;
        result.m_error = error;
        result.m_requiredSize = requiredSize;
        return result;
    }

    bool isOk() const { return m_value.has_value(); }
    explicit operator bool() const { return isOk(); }

    /**
     * @brief Error of a failed operation, Error::Success otherwise
     */
    Error error() const { return m_error; }

    /**
     * @brief Size the service requested after Error::InsufficientBuffer
     * @return Required size in bytes, or -1 if not reported
     */
    qsizetype requiredSize() const { return m_requiredSize; }

    QString errorMessage() const { return Smartcard::errorMessage(m_error); }

    /**
     * @brief Access the value (only valid if isOk())
     */
    const T& value() const { return *m_value; }
    T& value() { return *m_value; }

    /**
     * @brief Move the value out of the result (only valid if isOk())
     */
    T takeValue() { return std::move(*m_value); }

private:
    Result() = default;

    std::optional<T> m_value;
    Error m_error = Error::UnknownError;
    qsizetype m_requiredSize = -1;
};

/**
 * @brief Result of an operation that produces no value
 */
template <>
class Result<void> {
public:
    static Result fromSuccess() {
        return Result(Error::Success, -1);
    }

    static Result fromError(Error error, qsizetype requiredSize = -1) {
        return Result(error, requiredSize);
    }

    /**
     * @brief Build from a raw service status code
     */
    static Result fromRaw(uint32_t raw) {
        return Result(errorFromRaw(raw), -1);
    }

    bool isOk() const { return m_error == Error::Success; }
    explicit operator bool() const { return isOk(); }

    Error error() const { return m_error; }
    qsizetype requiredSize() const { return m_requiredSize; }
    QString errorMessage() const { return Smartcard::errorMessage(m_error); }

private:
    Result(Error error, qsizetype requiredSize)
        : m_error(error), m_requiredSize(requiredSize) {}

    Error m_error;
    qsizetype m_requiredSize;
};

} // namespace Smartcard
