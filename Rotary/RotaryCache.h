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

#include <cstdint>
#include <map>

#include "Common/UI/View.h"

namespace Rotary {

class FocusArea;

enum class CacheType {
	DISABLED = 1,
	EXPIRED_AFTER_SOME_TIME = 2,
	NEVER_EXPIRE = 3,
};

const char *CacheTypeToString(CacheType type);
bool CacheTypeFromInt(int value, CacheType *type);

struct CachePolicy {
	CachePolicy() {}
	CachePolicy(CacheType t, int64_t periodMs) : type(t), expirationPeriodMs(periodMs) {}

	CacheType type = CacheType::NEVER_EXPIRE;
	// Only used by EXPIRED_AFTER_SOME_TIME, where it must be positive.
	int64_t expirationPeriodMs = 0;

	bool IsValid() const;
};

// Focus history of a focus area. Two independent caches:
//  * the view that was focused when the focus area lost focus,
//  * per nudge direction, the focus area that was nudged to.
// Views are held by handle, so anything stored may have been destroyed by the time it's read back.
// Callers still need to check that what they get can take focus.
class RotaryCache {
public:
	RotaryCache() {}

	// Replaces both policies and drops all history. On an invalid policy, logs and returns false
	// without changing anything.
	bool Init(const CachePolicy &focusHistory, const CachePolicy &focusAreaHistory);

	const CachePolicy &GetFocusHistoryPolicy() const { return focusPolicy_; }
	const CachePolicy &GetFocusAreaHistoryPolicy() const { return focusAreaPolicy_; }

	// nullptr if nothing valid is cached at time now (or the view is gone).
	UI::View *GetFocusedView(int64_t now) const;
	void SaveFocusedView(UI::View *view, int64_t now);

	FocusArea *GetCachedFocusArea(UI::FocusDirection direction, int64_t now) const;
	void SaveFocusArea(UI::FocusDirection direction, FocusArea *target, int64_t now);
	void ClearFocusAreaHistory();

	// Whether anything was ever saved, valid or not. Lets callers tell "expired" from "never stored".
	bool HasFocusedViewEntry() const { return focusHistory_.saved; }
	bool HasFocusAreaEntry(UI::FocusDirection direction) const;

private:
	struct History {
		UI::ViewHandle view;
		int64_t timestamp = 0;
		bool saved = false;
	};

	static bool IsValidHistory(const CachePolicy &policy, const History &history, int64_t now);

	CachePolicy focusPolicy_;
	CachePolicy focusAreaPolicy_;

	History focusHistory_;
	std::map<UI::FocusDirection, History> focusAreaHistory_;
};

}  // namespace Rotary
