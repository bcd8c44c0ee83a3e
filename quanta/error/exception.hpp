/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef QUANTA_ERROR_EXCEPTION_HPP
#define QUANTA_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#define QUANTA_FILE_NAME __FILE__
#define QUANTA_FILE_LINE __LINE__
#define QUANTA_FUNC_NAME __func__

namespace quanta::error {

/**
 * @brief Base exception carrying the throw site and the throwing thread.
 *
 * All project exceptions derive from this class and are thrown through the
 * THROW_* macros so the location is recorded automatically.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception from a throw site and message parts.
     * @param file The source file of the throw site.
     * @param line The line of the throw site.
     * @param func The enclosing function of the throw site.
     * @param args Values streamed one after another into the message.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        message_ = oss.str();
    }

    /**
     * @brief Full description including the throw site.
     */
    auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;

    /**
     * @brief The bare message, without the throw site.
     */
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

class OutOfRange : public Exception {
public:
    using Exception::Exception;
};

}  // namespace quanta::error

#define THROW_INVALID_ARGUMENT(...)                                           \
    throw quanta::error::InvalidArgument(QUANTA_FILE_NAME, QUANTA_FILE_LINE, \
                                         QUANTA_FUNC_NAME, __VA_ARGS__)

#define THROW_OUT_OF_RANGE(...)                                          \
    throw quanta::error::OutOfRange(QUANTA_FILE_NAME, QUANTA_FILE_LINE, \
                                    QUANTA_FUNC_NAME, __VA_ARGS__)

#endif  // QUANTA_ERROR_EXCEPTION_HPP
