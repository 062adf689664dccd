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

#include "rotary_config.h"

#include <cstdarg>
#include <mutex>
#include <string>

#include "Common/Common.h"
#include "Common/CommonFuncs.h"
#include "Common/Log.h"

// Struct that listeners can output how they want. For example, on Android we don't want to add
// timestamp or write the level as a string, those already exist.
struct LogMessage {
	char timestamp[16];
	char header[64];  // Filename/line/channel in front.
	LogLevel level;
	const char *log;
	std::string msg;  // The actual log message.
};

enum class LogOutput {
	Stdio = (1 << 0),
	RingBuffer = (1 << 1),
};
ENUM_CLASS_BITOPS(LogOutput);

class RingbufferLog {
public:
	void Log(const LogMessage &msg);

	int GetCount() const { return count_ < MAX_LOGS ? count_ : MAX_LOGS; }
	const char *TextAt(int i) const { return messages_[(curMessage_ - i - 1) & (MAX_LOGS - 1)].msg.c_str(); }

	void Clear() {
		curMessage_ = 0;
		count_ = 0;
	}

private:
	enum { MAX_LOGS = 128 };
	LogMessage messages_[MAX_LOGS];
	int curMessage_ = 0;
	int count_ = 0;
};

struct LogChannel {
	LogLevel level = LogLevel::LDEBUG;
	bool enabled = true;
};

class Section;

class LogManager {
public:
	LogManager();
	~LogManager();

	void SetOutputsEnabled(LogOutput outputs) {
		outputs_ = outputs;
	}
	void EnableOutput(LogOutput output) {
		SetOutputsEnabled(outputs_ | output);
	}

	void LogLine(LogLevel level, Log type,
				 const char *file, int line, const char *fmt, va_list args);

	bool IsEnabled(LogLevel level, Log type) const {
		const LogChannel &log = log_[(size_t)type];
		if (level > log.level || !log.enabled)
			return false;
		return true;
	}

	void SetLogLevel(Log type, LogLevel level) {
		log_[(size_t)type].level = level;
	}

	void SetEnabled(Log type, bool enable) {
		log_[(size_t)type].enabled = enable;
	}

	LogLevel GetLogLevel(Log type) const {
		return log_[(size_t)type].level;
	}

	const RingbufferLog *GetRingbuffer() const {
		return &ringLog_;
	}
	void ClearRingbuffer() {
		ringLog_.Clear();
	}

	void Init(bool *enabledSetting);
	void Shutdown();

	void SaveConfig(Section *section);
	void LoadConfig(const Section *section, bool debugDefaults);

private:
	// Prevent copies.
	LogManager(const LogManager &) = delete;
	void operator=(const LogManager &) = delete;

	bool initialized_ = false;

	LogChannel log_[(size_t)Log::NUMBER_OF_LOGS];

	LogOutput outputs_ = (LogOutput)0;

	// Stdio logging
	std::mutex stdioLock_;

	// Ring buffer
	RingbufferLog ringLog_;
};

extern LogManager g_logManager;
