/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef YAMLET_ERROR_EXCEPTION_HPP
#define YAMLET_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "yamlet/macro.hpp"

namespace yamlet::error {

/**
 * @brief Base exception that records where it was thrown.
 *
 * The message is assembled from any number of streamable arguments, so
 * throw sites can pass values directly instead of formatting them first.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full report: location, thread and message.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_RUNTIME_ERROR(...)                                            \
    throw yamlet::error::RuntimeError(YAMLET_FILE_NAME, YAMLET_FILE_LINE,   \
                                      YAMLET_FUNC_NAME, __VA_ARGS__)

class LogicError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_LOGIC_ERROR(...)                                              \
    throw yamlet::error::LogicError(YAMLET_FILE_NAME, YAMLET_FILE_LINE,     \
                                    YAMLET_FUNC_NAME, __VA_ARGS__)

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                          \
    throw yamlet::error::InvalidArgument(YAMLET_FILE_NAME, YAMLET_FILE_LINE, \
                                         YAMLET_FUNC_NAME, __VA_ARGS__)

class OperationCancelled : public Exception {
public:
    using Exception::Exception;
};

#define THROW_OPERATION_CANCELLED(...)                                    \
    throw yamlet::error::OperationCancelled(                              \
        YAMLET_FILE_NAME, YAMLET_FILE_LINE, YAMLET_FUNC_NAME, __VA_ARGS__)

class FailToOpenFile : public Exception {
public:
    using Exception::Exception;
};

#define THROW_FAIL_TO_OPEN_FILE(...)                                         \
    throw yamlet::error::FailToOpenFile(YAMLET_FILE_NAME, YAMLET_FILE_LINE,  \
                                        YAMLET_FUNC_NAME, __VA_ARGS__)

}  // namespace yamlet::error

#endif  // YAMLET_ERROR_EXCEPTION_HPP
