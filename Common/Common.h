// Copyright (C) 2003 Dolphin Project.

// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, version 2.0 or later versions.

// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License 2.0 for more details.

// A copy of the GPL 2.0 should have been included with the program.
// If not, see http://www.gnu.org/licenses/

// Official SVN repository and contact information can be found at
// http://code.google.com/p/dolphin-emu/

#pragma once

#include <stdarg.h>

#ifdef _MSC_VER
#pragma warning (disable:4100)
#endif

#include "Log.h"
#include "CommonTypes.h"
#include "CommonFuncs.h"

#ifndef DISALLOW_COPY_AND_ASSIGN
#define DISALLOW_COPY_AND_ASSIGN(t) \
	t(const t &other) = delete;  \
	void operator =(const t &other) = delete;
#endif

// Bitwise operators for enum classes used as flag sets.
#define ENUM_CLASS_BITOPS(T) \
	static inline T operator |(const T &lhs, const T &rhs) { \
		return T((int)lhs | (int)rhs); \
	} \
	static inline T &operator |= (T &lhs, const T &rhs) { \
		lhs = lhs | rhs; \
		return lhs; \
	} \
	static inline T operator &(const T &lhs, const T &rhs) { \
		return T((int)lhs & (int)rhs); \
	} \
	static inline T &operator &= (T &lhs, const T &rhs) { \
		lhs = lhs & rhs; \
		return lhs; \
	} \
	static inline T operator ~(const T &rhs) { \
		return T(~(int)rhs); \
	} \
	static inline bool operator !(const T &rhs) { \
		return (int)rhs == 0; \
	}
