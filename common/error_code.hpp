/***
    This file is part of zeroconnect
    Copyright (C) 2024-2025  Johannes Pohl

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
***/

#pragma once

// local headers
#include "common/connect_error.hpp"

// standard headers
#include <optional>
#include <string>
#include <system_error>
#include <variant>


namespace zeroconnect
{

/// Error codes with detail information
struct ErrorCode : public std::error_code
{
    /// c'tor
    ErrorCode() : std::error_code(), detail_(std::nullopt)
    {
    }

    /// c'tor
    /// @param code the std error code
    ErrorCode(const std::error_code& code) : std::error_code(code), detail_(std::nullopt)
    {
    }

    /// c'tor
    /// @param errc the connect error
    /// @param detail additional details
    ErrorCode(ConnectErrc errc, std::string detail) : std::error_code(make_error_code(errc)), detail_(std::move(detail))
    {
    }

    /// c'tor
    /// @param code the std error code
    /// @param detail additional details
    ErrorCode(const std::error_code& code, std::string detail) : std::error_code(code), detail_(std::move(detail))
    {
    }

    /// Copy c'tor
    ErrorCode(const ErrorCode& other) = default;
    /// Move c'tor
    ErrorCode(ErrorCode&& other) = default;
    /// Copy assignment
    ErrorCode& operator=(const ErrorCode& rhs) = default;
    /// Move assignment
    ErrorCode& operator=(ErrorCode&& rhs) = default;

    /// @return detailed error message
    std::string detailed_message() const
    {
        if (detail_.has_value())
            return message() + ": " + *detail_;
        return message();
    }

    /// @return the detail text, if any
    const std::optional<std::string>& detail() const
    {
        return detail_;
    }

private:
    /// Optional error details
    std::optional<std::string> detail_;
};


/// Storage for an ErrorCode or a type T
/// Used as return type of the transport layer
template <class T>
struct ErrorOr
{
    /// Move construct with @p t
    ErrorOr(T&& t) : var(std::move(t))
    {
    }

    /// Construct with @p t
    ErrorOr(const T& t) : var(t)
    {
    }

    /// Move construct with an error
    ErrorOr(ErrorCode&& error) : var(std::move(error))
    {
    }

    /// Construct with an error
    ErrorOr(const ErrorCode& error) : var(error)
    {
    }

    /// @return true if contains a value (i.e. no error)
    bool hasValue() const
    {
        return std::holds_alternative<T>(var);
    }

    /// @return true if contains an error (i.e. no value)
    bool hasError() const
    {
        return std::holds_alternative<ErrorCode>(var);
    }

    /// @return the value
    const T& getValue() const
    {
        return std::get<T>(var);
    }

    /// @return the moved value
    T takeValue()
    {
        return std::move(std::get<T>(var));
    }

    /// @return the error
    const ErrorCode& getError() const
    {
        return std::get<ErrorCode>(var);
    }

    /// @return the moved error
    ErrorCode takeError()
    {
        auto ec = std::move(std::get<ErrorCode>(var));
        return ec;
    }

private:
    /// The stored ErrorCode or value
    std::variant<ErrorCode, T> var;
};


} // namespace zeroconnect
