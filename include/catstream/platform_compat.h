// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include <cstdio>
#include <sys/types.h>

#if defined(_WIN32)
#  if !defined(_SSIZE_T_DEFINED)
#    include <BaseTsd.h>
using ssize_t = SSIZE_T;
#    define _SSIZE_T_DEFINED
#  endif
#  define CATSTREAM_FSEEK _fseeki64
#  define CATSTREAM_FTELL _ftelli64
#else
#  define CATSTREAM_FSEEK fseeko
#  define CATSTREAM_FTELL ftello
#endif
