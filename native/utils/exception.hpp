// Copyright 2024 OKX
// Licensed under the Apache License, Version 2.0, see LICENSE for details.
// SPDX-License-Identifier: Apache-2.0

#ifndef __ZKPERM_UTILS_EXCEPTION_HPP__
#define __ZKPERM_UTILS_EXCEPTION_HPP__

#include <cstdio>
#include <string>
#include <stdexcept>

#include "utils/error_codes.h"

template <typename... Types>
inline std::string fmt(const char *fmt, Types... args)
{
    size_t len = std::snprintf(nullptr, 0, fmt, args...);
    std::string ret(++len, '\0');
    std::snprintf(&ret.front(), len, fmt, args...);
    ret.resize(--len);
    return ret;
}

class zkperm_error : public std::runtime_error
{
    int _code;

public:
    zkperm_error(int err_code, const std::string &reason) : std::runtime_error{reason}
    {
        _code = err_code;
    }
    template <typename... Types>
    zkperm_error(int err_code, const char *format, Types... args) : std::runtime_error{fmt(format, args...)}
    {
        _code = err_code;
    }
    inline int code() const
    {
        return _code;
    }
};

#endif // __ZKPERM_UTILS_EXCEPTION_HPP__
