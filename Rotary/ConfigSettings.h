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

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "Common/Common.h"

class Section;  // ini file section

enum class CfgFlag : u8 {
	DEFAULT = 0,
	DONT_SAVE = 1,  // normally don't like negative flags, but these are really not many.
};
ENUM_CLASS_BITOPS(CfgFlag);

// One ini key bound to a member of a settings struct, by offset from the owner.
struct ConfigSetting {
	enum class Type {
		TYPE_BOOL,
		TYPE_INT,
	};
	union DefaultValue {
		bool b;
		int i;
	};

	ConfigSetting(std::string_view ini, const char *owner, bool *v, bool def, CfgFlag flags) noexcept
		: iniKey_(ini), type_(Type::TYPE_BOOL), flags_(flags), offset_((u32)((const char *)v - owner)) {
		default_.b = def;
	}

	ConfigSetting(std::string_view ini, const char *owner, int *v, int def, CfgFlag flags) noexcept
		: iniKey_(ini), type_(Type::TYPE_INT), flags_(flags), offset_((u32)((const char *)v - owner)) {
		default_.i = def;
	}

	// Returns false if the key was missing or unparsable, in which case the default is applied.
	bool ReadFromIniSection(char *owner, const Section *section) const;

	// Yes, this can be const because what's modified is not the ConfigSetting struct, but the value which is stored elsewhere.
	void WriteToIniSection(const char *owner, Section *section) const;

	// If log is true, logs if the setting changed.
	bool RestoreToDefault(char *owner, bool log) const;

	bool SaveSetting() const { return !(flags_ & CfgFlag::DONT_SAVE); }

	std::string_view iniKey_;
	const Type type_;

private:
	CfgFlag flags_;
	DefaultValue default_{};
	u32 offset_;
};

struct ConfigSectionSettings {
	const char *section;
	const ConfigSetting *settings;
	size_t settingsCount;
};
