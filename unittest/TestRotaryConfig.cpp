#include <cstdio>
#include <cstring>
#include <new>
#include <sstream>
#include <string>

#include "Common/Data/Format/IniFile.h"
#include "Common/Log.h"
#include "Common/Log/LogManager.h"
#include "Common/StringUtils.h"
#include "Rotary/FocusArea.h"
#include "Rotary/RotaryCache.h"
#include "Rotary/RotaryConfig.h"

#include "unittest/UnitTest.h"

static bool TestIniSections() {
	std::istringstream in(
		"[Section]\n"
		"Key = Value  # comment\n"
		"Quoted = \"  spaced  \"\n"
		"Number = 42\n"
		"Flag = TRUE\n"
		"List = a, b,,c\n"
		"; Just a comment\n");
	IniFile ini;
	EXPECT_TRUE(ini.Load(in));
	const Section *section = ini.GetSection("Section");
	EXPECT_TRUE(section != nullptr);
	EXPECT_TRUE(ini.GetSection("Missing") == nullptr);

	std::string value;
	EXPECT_TRUE(section->Get("key", &value, ""));
	EXPECT_EQ_STR(value, std::string("Value"));
	EXPECT_TRUE(section->Get("Quoted", &value, ""));
	EXPECT_EQ_STR(value, std::string("  spaced  "));
	int number = 0;
	EXPECT_TRUE(section->Get("Number", &number, 0));
	EXPECT_EQ_INT(number, 42);
	EXPECT_FALSE(section->Get("Key", &number, 7));
	EXPECT_EQ_INT(number, 7);
	bool flag = false;
	EXPECT_TRUE(section->Get("Flag", &flag, false));
	EXPECT_TRUE(flag);
	std::vector<std::string> list;
	EXPECT_TRUE(section->Get("List", &list));
	EXPECT_EQ_INT((int)list.size(), 3);
	EXPECT_EQ_STR(list[2], std::string("c"));

	// Setting keeps the comment.
	Section *writable = ini.GetOrCreateSection("Section");
	writable->Set("Key", "Other");
	std::ostringstream out;
	ini.Save(out);
	EXPECT_TRUE(out.str().find("Key = Other  # comment") != std::string::npos);
	return true;
}

static bool TestConfigDefaults() {
	RotaryConfig config;
	EXPECT_TRUE(config.bEnableLogging);
	EXPECT_EQ_INT(config.iFocusHistoryCacheType, (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_EQ_INT(config.iFocusHistoryExpirationPeriodMs, 86400000);
	EXPECT_EQ_INT(config.iFocusAreaHistoryCacheType, (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_EQ_INT(config.iFocusAreaHistoryExpirationPeriodMs, 86400000);
	EXPECT_TRUE(config.bDefaultFocusOverridesHistory);
	EXPECT_TRUE(config.bClearFocusAreaHistoryWhenRotating);
	EXPECT_TRUE(config.GetFocusHistoryPolicy().IsValid());
	return true;
}

static bool TestConfigLoadAndValidate() {
	std::istringstream in(
		"[Rotary]\n"
		"FocusHistoryCacheType = 3\n"
		"FocusHistoryExpirationPeriodMs = 0\n"
		"FocusAreaHistoryCacheType = 2\n"
		"FocusAreaHistoryExpirationPeriodMs = -1\n"
		"DefaultFocusOverridesHistory = false\n");
	IniFile ini;
	EXPECT_TRUE(ini.Load(in));

	RotaryConfig config;
	config.LoadFromIni(ini);
	// Never expire doesn't need a period.
	EXPECT_EQ_INT(config.iFocusHistoryCacheType, (int)Rotary::CacheType::NEVER_EXPIRE);
	EXPECT_EQ_INT(config.iFocusHistoryExpirationPeriodMs, 0);
	// An expiring cache does, so this one went back to the defaults.
	EXPECT_EQ_INT(config.iFocusAreaHistoryCacheType, (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_EQ_INT(config.iFocusAreaHistoryExpirationPeriodMs, 86400000);
	EXPECT_FALSE(config.bDefaultFocusOverridesHistory);
	EXPECT_TRUE(config.bClearFocusAreaHistoryWhenRotating);

	std::istringstream bad(
		"[Rotary]\n"
		"FocusHistoryCacheType = 9\n"
		"FocusHistoryExpirationPeriodMs = 500\n");
	IniFile badIni;
	EXPECT_TRUE(badIni.Load(bad));
	config.LoadFromIni(badIni);
	EXPECT_EQ_INT(config.iFocusHistoryCacheType, (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_EQ_INT(config.iFocusHistoryExpirationPeriodMs, 86400000);
	// Missing keys are back to their defaults too.
	EXPECT_TRUE(config.bDefaultFocusOverridesHistory);
	return true;
}

static bool TestConfigSave() {
	RotaryConfig config;
	config.iFocusAreaHistoryCacheType = (int)Rotary::CacheType::DISABLED;
	config.bClearFocusAreaHistoryWhenRotating = false;

	IniFile ini;
	config.SaveToIni(&ini);
	const Section *rotary = ini.GetSection("Rotary");
	EXPECT_TRUE(rotary != nullptr);
	int type = 0;
	EXPECT_TRUE(rotary->Get("FocusAreaHistoryCacheType", &type, 0));
	EXPECT_EQ_INT(type, (int)Rotary::CacheType::DISABLED);
	EXPECT_TRUE(ini.GetSection("General") != nullptr);
	EXPECT_TRUE(ini.GetSection("Log") != nullptr);

	RotaryConfig loaded;
	loaded.LoadFromIni(ini);
	EXPECT_EQ_INT(loaded.iFocusAreaHistoryCacheType, (int)Rotary::CacheType::DISABLED);
	EXPECT_FALSE(loaded.bClearFocusAreaHistoryWhenRotating);
	EXPECT_TRUE(loaded.GetFocusAreaHistoryPolicy().type == Rotary::CacheType::DISABLED);
	return true;
}

static bool TestConfigConstructedOverGarbage() {
	// Construct over dirty memory so nothing depends on the storage starting out zeroed.
	alignas(RotaryConfig) unsigned char storage[sizeof(RotaryConfig)];
	memset(storage, 0x5A, sizeof(storage));
	RotaryConfig *config = new (storage) RotaryConfig();
	EXPECT_TRUE(config->bEnableLogging);
	EXPECT_EQ_INT(config->iFocusHistoryCacheType, (int)Rotary::CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_EQ_INT(config->iFocusAreaHistoryExpirationPeriodMs, 86400000);
	EXPECT_TRUE(config->bDefaultFocusOverridesHistory);
	EXPECT_TRUE(config->bClearFocusAreaHistoryWhenRotating);

	config->bClearFocusAreaHistoryWhenRotating = false;
	config->iFocusHistoryExpirationPeriodMs = 5;
	config->RestoreDefaults();
	EXPECT_TRUE(config->bClearFocusAreaHistoryWhenRotating);
	EXPECT_EQ_INT(config->iFocusHistoryExpirationPeriodMs, 86400000);
	config->~RotaryConfig();
	return true;
}

static bool TestLogSection() {
	IniFile saved;
	g_logManager.SaveConfig(saved.GetOrCreateSection("Log"));

	std::istringstream in(
		"[Log]\n"
		"FocusAreaEnabled = False\n"
		"FocusAreaLevel = 3\n"
		"ControllerLevel = 5\n"
		"ConfigLevel = 42\n");
	IniFile ini;
	EXPECT_TRUE(ini.Load(in));
	RotaryConfig config;
	config.LoadFromIni(ini);

	EXPECT_FALSE(g_logManager.IsEnabled(LogLevel::LERROR, Log::FocusArea));
	EXPECT_EQ_INT((int)g_logManager.GetLogLevel(Log::FocusArea), (int)LogLevel::LWARNING);
	EXPECT_TRUE(g_logManager.IsEnabled(LogLevel::LDEBUG, Log::Controller));
	EXPECT_FALSE(g_logManager.IsEnabled(LogLevel::LVERBOSE, Log::Controller));
	// Out of range falls back to errors only.
	EXPECT_EQ_INT((int)g_logManager.GetLogLevel(Log::Config), (int)LogLevel::LERROR);
	EXPECT_TRUE(g_logManager.IsEnabled(LogLevel::LERROR, Log::Config));
	EXPECT_FALSE(g_logManager.IsEnabled(LogLevel::LWARNING, Log::Config));

	// Saving writes back what was loaded.
	IniFile written;
	config.SaveToIni(&written);
	const Section *log = written.GetSection("Log");
	EXPECT_TRUE(log != nullptr);
	bool enabled = true;
	EXPECT_TRUE(log->Get("FOCUSAREAEnabled", &enabled, true));
	EXPECT_FALSE(enabled);

	g_logManager.SetLogLevel(Log::FocusArea, LogLevel::LINFO);
	EXPECT_EQ_INT((int)g_logManager.GetLogLevel(Log::FocusArea), (int)LogLevel::LINFO);

	g_logManager.LoadConfig(saved.GetSection("Log"), false);
	return true;
}

static bool TestConfigFile() {
	const std::string filename = "rotary_unittest.ini";
	remove(filename.c_str());

	RotaryConfig config;
	config.iFocusHistoryExpirationPeriodMs = 1000;
	config.iFocusHistoryCacheType = (int)Rotary::CacheType::NEVER_EXPIRE;
	config.bDefaultFocusOverridesHistory = false;
	// Not there yet, so the defaults stay.
	EXPECT_FALSE(config.Load(filename));
	EXPECT_EQ_INT(config.iFocusHistoryExpirationPeriodMs, 86400000);
	EXPECT_TRUE(config.bDefaultFocusOverridesHistory);

	config.iFocusAreaHistoryCacheType = (int)Rotary::CacheType::NEVER_EXPIRE;
	config.bDefaultFocusOverridesHistory = false;
	EXPECT_TRUE(config.Save(filename));

	RotaryConfig loaded;
	EXPECT_TRUE(loaded.Load(filename));
	EXPECT_EQ_INT(loaded.iFocusAreaHistoryCacheType, (int)Rotary::CacheType::NEVER_EXPIRE);
	EXPECT_FALSE(loaded.bDefaultFocusOverridesHistory);
	EXPECT_EQ_INT(loaded.iFocusHistoryExpirationPeriodMs, 86400000);

	remove(filename.c_str());
	return true;
}

static bool TestFocusAreaUsesConfig() {
	RotaryConfig saved = g_RotaryConfig;
	g_RotaryConfig.bDefaultFocusOverridesHistory = false;
	g_RotaryConfig.iFocusHistoryCacheType = (int)Rotary::CacheType::DISABLED;
	g_RotaryConfig.bClearFocusAreaHistoryWhenRotating = false;

	Rotary::FocusArea focusArea;
	EXPECT_FALSE(focusArea.GetDefaultFocusOverridesHistory());
	EXPECT_FALSE(focusArea.GetClearFocusAreaHistoryWhenRotating());
	EXPECT_TRUE(focusArea.GetRotaryCache().GetFocusHistoryPolicy().type == Rotary::CacheType::DISABLED);

	g_RotaryConfig = saved;
	return true;
}

bool TestRotaryConfig() {
	RET(TestIniSections());
	RET(TestConfigDefaults());
	RET(TestConfigConstructedOverGarbage());
	RET(TestConfigLoadAndValidate());
	RET(TestConfigSave());
	RET(TestLogSection());
	RET(TestConfigFile());
	RET(TestFocusAreaUsesConfig());
	return true;
}
