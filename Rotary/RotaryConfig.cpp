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

#include <functional>

#include "Common/Common.h"
#include "Common/Data/Format/IniFile.h"
#include "Common/Log.h"
#include "Common/Log/LogManager.h"

#include "Rotary/ConfigSettings.h"
#include "Rotary/RotaryConfig.h"

static const char * const logSectionName = "Log";

static const int DEFAULT_CACHE_TYPE = (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME;
// One day.
static const int DEFAULT_EXPIRATION_PERIOD_MS = 86400000;

#define SETTING(a, x) (const char *)&a, &a.x

// All relative to g_RotaryConfig, but applied to whichever instance is loading.
static const ConfigSetting generalSettings[] = {
	ConfigSetting("EnableLogging", SETTING(g_RotaryConfig, bEnableLogging), true, CfgFlag::DEFAULT),
};

static const ConfigSetting rotarySettings[] = {
	ConfigSetting("FocusHistoryCacheType", SETTING(g_RotaryConfig, iFocusHistoryCacheType), DEFAULT_CACHE_TYPE, CfgFlag::DEFAULT),
	ConfigSetting("FocusHistoryExpirationPeriodMs", SETTING(g_RotaryConfig, iFocusHistoryExpirationPeriodMs), DEFAULT_EXPIRATION_PERIOD_MS, CfgFlag::DEFAULT),
	ConfigSetting("FocusAreaHistoryCacheType", SETTING(g_RotaryConfig, iFocusAreaHistoryCacheType), DEFAULT_CACHE_TYPE, CfgFlag::DEFAULT),
	ConfigSetting("FocusAreaHistoryExpirationPeriodMs", SETTING(g_RotaryConfig, iFocusAreaHistoryExpirationPeriodMs), DEFAULT_EXPIRATION_PERIOD_MS, CfgFlag::DEFAULT),
	ConfigSetting("DefaultFocusOverridesHistory", SETTING(g_RotaryConfig, bDefaultFocusOverridesHistory), true, CfgFlag::DEFAULT),
	ConfigSetting("ClearFocusAreaHistoryWhenRotating", SETTING(g_RotaryConfig, bClearFocusAreaHistoryWhenRotating), true, CfgFlag::DEFAULT),
};

static const ConfigSectionSettings sectionDescs[] = {
	{"General", generalSettings, ARRAY_SIZE(generalSettings)},
	{"Rotary", rotarySettings, ARRAY_SIZE(rotarySettings)},
};

static const size_t numSections = ARRAY_SIZE(sectionDescs);

// After the tables, the constructor iterates them.
RotaryConfig g_RotaryConfig;

static void IterateSettings(std::function<void(const char *sectionName, const ConfigSetting &setting)> func) {
	for (size_t i = 0; i < numSections; ++i) {
		for (size_t j = 0; j < sectionDescs[i].settingsCount; j++) {
			func(sectionDescs[i].section, sectionDescs[i].settings[j]);
		}
	}
}

RotaryConfig::RotaryConfig() {
	RestoreDefaults();
}

void RotaryConfig::RestoreDefaults() {
	char *owner = (char *)this;
	IterateSettings([owner](const char *sectionName, const ConfigSetting &setting) {
		setting.RestoreToDefault(owner, false);
	});
}

bool RotaryConfig::Load(const std::string &iniFilename) {
	INFO_LOG(Log::Config, "Loading config: %s", iniFilename.c_str());

	IniFile iniFile;
	bool success = iniFile.Load(iniFilename);
	if (!success) {
		ERROR_LOG(Log::Config, "Failed to read '%s'. Setting config to default.", iniFilename.c_str());
		// Continue anyway to initialize the config.
	}
	LoadFromIni(iniFile);
	return success;
}

void RotaryConfig::LoadFromIni(const IniFile &iniFile) {
	char *owner = (char *)this;
	const Section emptySection;
	IterateSettings([owner, &iniFile, &emptySection](const char *sectionName, const ConfigSetting &setting) {
		const Section *section = iniFile.GetSection(sectionName);
		setting.ReadFromIniSection(owner, section ? section : &emptySection);
	});

	ValidateCacheSettings();

	const Section *log = iniFile.GetSection(logSectionName);
	if (log)
		g_logManager.LoadConfig(log, false);
}

bool RotaryConfig::Save(const std::string &iniFilename) {
	IniFile iniFile;
	if (!iniFile.Load(iniFilename)) {
		WARN_LOG(Log::Config, "Likely saving config for first time - couldn't read ini '%s'", iniFilename.c_str());
	}

	SaveToIni(&iniFile);

	if (!iniFile.Save(iniFilename)) {
		ERROR_LOG(Log::Config, "Error saving config - can't write ini '%s'", iniFilename.c_str());
		return false;
	}
	INFO_LOG(Log::Config, "Config saved: '%s'", iniFilename.c_str());
	return true;
}

void RotaryConfig::SaveToIni(IniFile *iniFile) {
	const char *owner = (const char *)this;
	IterateSettings([owner, iniFile](const char *sectionName, const ConfigSetting &setting) {
		setting.WriteToIniSection(owner, iniFile->GetOrCreateSection(sectionName));
	});

	Section *log = iniFile->GetOrCreateSection(logSectionName);
	g_logManager.SaveConfig(log);
}

static bool ValidatePolicy(const char *name, int *type, int *periodMs) {
	Rotary::CacheType cacheType;
	if (!Rotary::CacheTypeFromInt(*type, &cacheType)) {
		ERROR_LOG(Log::Config, "%sCacheType: unknown cache type %d, using the default", name, *type);
	} else if (!Rotary::CachePolicy(cacheType, *periodMs).IsValid()) {
		ERROR_LOG(Log::Config, "%sExpirationPeriodMs must be positive for an expiring cache (was %d), using the default", name, *periodMs);
	} else {
		return true;
	}
	*type = DEFAULT_CACHE_TYPE;
	*periodMs = DEFAULT_EXPIRATION_PERIOD_MS;
	return false;
}

void RotaryConfig::ValidateCacheSettings() {
	ValidatePolicy("FocusHistory", &iFocusHistoryCacheType, &iFocusHistoryExpirationPeriodMs);
	ValidatePolicy("FocusAreaHistory", &iFocusAreaHistoryCacheType, &iFocusAreaHistoryExpirationPeriodMs);
}

Rotary::CachePolicy RotaryConfig::GetFocusHistoryPolicy() const {
	return Rotary::CachePolicy((Rotary::CacheType)iFocusHistoryCacheType, iFocusHistoryExpirationPeriodMs);
}

Rotary::CachePolicy RotaryConfig::GetFocusAreaHistoryPolicy() const {
	return Rotary::CachePolicy((Rotary::CacheType)iFocusAreaHistoryCacheType, iFocusAreaHistoryExpirationPeriodMs);
}
