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

#include "Common/Data/Format/IniFile.h"
#include "Common/Log.h"

#include "Rotary/ConfigSettings.h"

#define STR_VIEW(x) (int)(x).size(), (x).data()

bool ConfigSetting::ReadFromIniSection(char *owner, const Section *section) const {
	switch (type_) {
	case Type::TYPE_BOOL:
	{
		bool *target = (bool *)(owner + offset_);
		if (!section->Get(iniKey_, target, default_.b)) {
			*target = default_.b;
			return false;
		}
		return true;
	}
	case Type::TYPE_INT:
	{
		int *target = (int *)(owner + offset_);
		if (!section->Get(iniKey_, target, default_.i)) {
			*target = default_.i;
			return false;
		}
		return true;
	}
	default:
		_dbg_assert_msg_(false, "ReadFromIniSection(%.*s): Unexpected ini setting type: %d", STR_VIEW(iniKey_), (int)type_);
		return false;
	}
}

void ConfigSetting::WriteToIniSection(const char *owner, Section *section) const {
	if (!SaveSetting()) {
		return;
	}

	switch (type_) {
	case Type::TYPE_BOOL:
		return section->Set(iniKey_, *(const bool *)(owner + offset_));
	case Type::TYPE_INT:
		return section->Set(iniKey_, *(const int *)(owner + offset_));
	default:
		_dbg_assert_msg_(false, "WriteToIniSection(%.*s): Unexpected ini setting type: %d", STR_VIEW(iniKey_), (int)type_);
		return;
	}
}

bool ConfigSetting::RestoreToDefault(char *owner, bool log) const {
	switch (type_) {
	case Type::TYPE_BOOL:
	{
		bool *ptr_b = (bool *)(owner + offset_);
		const bool origValue = *ptr_b;
		*ptr_b = default_.b;
		if (*ptr_b != origValue) {
			if (log) {
				INFO_LOG(Log::Config, "Restored %.*s from %s to default %s", STR_VIEW(iniKey_),
					origValue ? "true" : "false",
					*ptr_b ? "true" : "false");
			}
			return true;
		}
		break;
	}
	case Type::TYPE_INT:
	{
		int *ptr_i = (int *)(owner + offset_);
		const int origValue = *ptr_i;
		*ptr_i = default_.i;
		if (*ptr_i != origValue) {
			if (log) {
				INFO_LOG(Log::Config, "Restored %.*s from %d to default %d", STR_VIEW(iniKey_),
					origValue, *ptr_i);
			}
			return true;
		}
		break;
	}
	default:
		_dbg_assert_msg_(false, "RestoreToDefault(%.*s): Unexpected ini setting type: %d", STR_VIEW(iniKey_), (int)type_);
		break;
	}
	return false;
}
