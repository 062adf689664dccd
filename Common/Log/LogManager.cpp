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

#include "rotary_config.h"

#if ROTARY_PLATFORM(ANDROID)

#include <android/log.h>

#endif

#include <algorithm>
#include <cstring>

#include "Common/Log/LogManager.h"
#include "Common/Log/StdioListener.h"
#include "Common/TimeUtil.h"
#include "Common/Data/Format/IniFile.h"
#include "Common/StringUtils.h"

LogManager g_logManager;

bool *g_bLogEnabledSetting = nullptr;

static const char level_to_char[8] = "-NEWIDV";

void GenericLog(LogLevel level, Log type, const char *file, int line, const char* fmt, ...) {
	if (g_bLogEnabledSetting && !(*g_bLogEnabledSetting))
		return;
	va_list args;
	va_start(args, fmt);
	g_logManager.LogLine(level, type, file, line, fmt, args);
	va_end(args);
}

bool GenericLogEnabled(LogLevel level, Log type) {
	if (g_bLogEnabledSetting && !(*g_bLogEnabledSetting))
		return false;
	return g_logManager.IsEnabled(level, type);
}

// NOTE: Needs to be kept in sync with the Log enum.
static const char * const g_logTypeNames[] = {
	"SYSTEM",
	"UI",
	"FOCUSAREA",
	"PARKINGVIEW",
	"ROTARYCACHE",
	"CONTROLLER",
	"CONFIG",
};

void LogManager::Init(bool *enabledSetting) {
	g_bLogEnabledSetting = enabledSetting;
	if (initialized_) {
		// Just update the pointer, already done above.
		return;
	}
	initialized_ = true;

	_dbg_assert_(ARRAY_SIZE(g_logTypeNames) == (size_t)Log::NUMBER_OF_LOGS);
	_dbg_assert_(ARRAY_SIZE(g_logTypeNames) == ARRAY_SIZE(log_));

	for (size_t i = 0; i < ARRAY_SIZE(log_); i++) {
		log_[i].enabled = true;
#if defined(_DEBUG)
		log_[i].level = LogLevel::LDEBUG;
#else
		log_[i].level = LogLevel::LINFO;
#endif
	}
}

void LogManager::Shutdown() {
	if (!initialized_) {
		// already done
		return;
	}

	outputs_ = (LogOutput)0;
	ringLog_.Clear();
	initialized_ = false;

	for (size_t i = 0; i < ARRAY_SIZE(log_); i++) {
		log_[i].enabled = true;
		log_[i].level = LogLevel::LINFO;
	}
}

LogManager::LogManager() {}

LogManager::~LogManager() {
	Shutdown();
}

void LogManager::SaveConfig(Section *section) {
	for (int i = 0; i < (int)Log::NUMBER_OF_LOGS; i++) {
		section->Set((std::string(g_logTypeNames[i]) + "Enabled"), log_[i].enabled);
		section->Set((std::string(g_logTypeNames[i]) + "Level"), (int)log_[i].level);
	}
}

void LogManager::LoadConfig(const Section *section, bool debugDefaults) {
	for (int i = 0; i < (int)Log::NUMBER_OF_LOGS; i++) {
		bool enabled = false;
		int level = 0;
		section->Get((std::string(g_logTypeNames[i]) + "Enabled"), &enabled, true);
		section->Get((std::string(g_logTypeNames[i]) + "Level"), &level, (int)(debugDefaults ? LogLevel::LDEBUG : LogLevel::LERROR));
		if (level < NOTICE_LEVEL || level > VERBOSE_LEVEL) {
			level = (int)LogLevel::LERROR;
		}
		log_[i].enabled = enabled;
		log_[i].level = (LogLevel)level;
	}
}

void LogManager::LogLine(LogLevel level, Log type, const char *file, int line, const char *format, va_list args) {
	char msgBuf[1024];
	if (!initialized_) {
		// Fall back to printf if the log manager hasn't been initialized yet.
#if ROTARY_PLATFORM(ANDROID)
		vsnprintf(msgBuf, sizeof(msgBuf), format, args);
		__android_log_print(ANDROID_LOG_INFO, "Rotary", "EARLY: %s", msgBuf);
#else
		vprintf(format, args);
		printf("\n");
#endif
		return;
	}

	const LogChannel &log = log_[(size_t)type];
	if (level > log.level || !log.enabled || outputs_ == (LogOutput)0)
		return;

	LogMessage message;
	message.level = level;
	message.log = g_logTypeNames[(size_t)type];

#ifdef _WIN32
	static const char sep = '\\';
#else
	static const char sep = '/';
#endif
	const char *fileshort = strrchr(file, sep);
	if (fileshort) {
		do
			--fileshort;
		while (fileshort > file && *fileshort != sep);
		if (fileshort != file)
			file = fileshort + 1;
	}

	snprintf(message.header, sizeof(message.header), "%s:%d %c[%s]:",
		file, line, level_to_char[(int)level],
		message.log);

	GetCurrentTimeFormatted(message.timestamp);

	va_list args_copy;

	va_copy(args_copy, args);
	size_t neededBytes = vsnprintf(msgBuf, sizeof(msgBuf), format, args);
	message.msg.resize(neededBytes + 1);
	if (neededBytes > sizeof(msgBuf)) {
		// Needed more space? Re-run vsnprintf.
		vsnprintf(&message.msg[0], neededBytes + 1, format, args_copy);
	} else {
		memcpy(&message.msg[0], msgBuf, neededBytes);
	}
	message.msg[neededBytes] = '\n';
	va_end(args_copy);

	if (!!(outputs_ & LogOutput::Stdio)) {
		std::lock_guard<std::mutex> lk(stdioLock_);
		StdioLog(message);
	}

	if (!!(outputs_ & LogOutput::RingBuffer)) {
		ringLog_.Log(message);
	}
}

void RingbufferLog::Log(const LogMessage &message) {
	messages_[curMessage_] = message;
	curMessage_++;
	if (curMessage_ >= MAX_LOGS)
		curMessage_ -= MAX_LOGS;
	count_++;
}

void OutputDebugStringUTF8(const char *p) {
	INFO_LOG(Log::System, "%s", p);
}
