// Copyright (c) 2024- Rotary Project.

// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, version 2.0 or later versions.

// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License 2.0 for more details.

// A copy of the GPL 2.0 should have been included with the program.
// If not, see http://www.gnu.org/licenses/

#pragma once

#include <string>

#include "Rotary/RotaryCache.h"

class IniFile;

// Global settings of the rotary engine, the defaults that focus areas pick up when created.
class RotaryConfig {
public:
	RotaryConfig();

	// General
	bool bEnableLogging = true;

	// Rotary
	int iFocusHistoryCacheType = (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME;
	int iFocusHistoryExpirationPeriodMs = 86400000;
	int iFocusAreaHistoryCacheType = (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME;
	int iFocusAreaHistoryExpirationPeriodMs = 86400000;
	bool bDefaultFocusOverridesHistory = true;
	bool bClearFocusAreaHistoryWhenRotating = true;

	// Missing keys get their defaults. Returns false if the file couldn't be read, the
	// config is still fully initialized in that case.
	bool Load(const std::string &iniFilename);
	bool Save(const std::string &iniFilename);

	// Also loads and saves the [Log] section through g_logManager.
	void LoadFromIni(const IniFile &iniFile);
	void SaveToIni(IniFile *iniFile);

	void RestoreDefaults();

	Rotary::CachePolicy GetFocusHistoryPolicy() const;
	Rotary::CachePolicy GetFocusAreaHistoryPolicy() const;

private:
	// Puts back defaults for cache settings that make no sense.
	void ValidateCacheSettings();
};

extern RotaryConfig g_RotaryConfig;
