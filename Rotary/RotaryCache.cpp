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

#include "Common/Log.h"
#include "Rotary/FocusArea.h"
#include "Rotary/RotaryCache.h"

namespace Rotary {

const char *CacheTypeToString(CacheType type) {
	switch (type) {
	case CacheType::DISABLED: return "disabled";
	case CacheType::EXPIRED_AFTER_SOME_TIME: return "expired after some time";
	case CacheType::NEVER_EXPIRE: return "never expire";
	}
	return "(invalid)";
}

bool CacheTypeFromInt(int value, CacheType *type) {
	switch (value) {
	case (int)CacheType::DISABLED:
	case (int)CacheType::EXPIRED_AFTER_SOME_TIME:
	case (int)CacheType::NEVER_EXPIRE:
		*type = (CacheType)value;
		return true;
	default:
		return false;
	}
}

bool CachePolicy::IsValid() const {
	switch (type) {
	case CacheType::DISABLED:
	case CacheType::NEVER_EXPIRE:
		return true;
	case CacheType::EXPIRED_AFTER_SOME_TIME:
		return expirationPeriodMs > 0;
	}
	return false;
}

bool RotaryCache::Init(const CachePolicy &focusHistory, const CachePolicy &focusAreaHistory) {
	if (!focusHistory.IsValid()) {
		ERROR_LOG(Log::RotaryCache, "Bad focus history cache: type '%s', period %lld ms. The period must be positive for an expiring cache.",
			CacheTypeToString(focusHistory.type), (long long)focusHistory.expirationPeriodMs);
		return false;
	}
	if (!focusAreaHistory.IsValid()) {
		ERROR_LOG(Log::RotaryCache, "Bad focus area history cache: type '%s', period %lld ms. The period must be positive for an expiring cache.",
			CacheTypeToString(focusAreaHistory.type), (long long)focusAreaHistory.expirationPeriodMs);
		return false;
	}
	focusPolicy_ = focusHistory;
	focusAreaPolicy_ = focusAreaHistory;
	focusHistory_ = History();
	focusAreaHistory_.clear();
	return true;
}

bool RotaryCache::IsValidHistory(const CachePolicy &policy, const History &history, int64_t now) {
	if (!history.saved)
		return false;
	switch (policy.type) {
	case CacheType::NEVER_EXPIRE:
		return true;
	case CacheType::EXPIRED_AFTER_SOME_TIME:
		// Exactly at the end of the period counts as expired.
		return now - history.timestamp < policy.expirationPeriodMs;
	default:
		return false;
	}
}

UI::View *RotaryCache::GetFocusedView(int64_t now) const {
	if (!IsValidHistory(focusPolicy_, focusHistory_, now))
		return nullptr;
	return focusHistory_.view.Get();
}

void RotaryCache::SaveFocusedView(UI::View *view, int64_t now) {
	if (focusPolicy_.type == CacheType::DISABLED)
		return;
	focusHistory_.view = UI::ViewHandle(view);
	focusHistory_.timestamp = now;
	focusHistory_.saved = true;
}

FocusArea *RotaryCache::GetCachedFocusArea(UI::FocusDirection direction, int64_t now) const {
	auto iter = focusAreaHistory_.find(direction);
	if (iter == focusAreaHistory_.end() || !IsValidHistory(focusAreaPolicy_, iter->second, now))
		return nullptr;
	UI::View *view = iter->second.view.Get();
	if (!view || !view->IsFocusArea())
		return nullptr;
	return static_cast<FocusArea *>(view);
}

void RotaryCache::SaveFocusArea(UI::FocusDirection direction, FocusArea *target, int64_t now) {
	if (focusAreaPolicy_.type == CacheType::DISABLED)
		return;
	History &history = focusAreaHistory_[direction];
	history.view = UI::ViewHandle(target);
	history.timestamp = now;
	history.saved = true;
}

void RotaryCache::ClearFocusAreaHistory() {
	focusAreaHistory_.clear();
}

bool RotaryCache::HasFocusAreaEntry(UI::FocusDirection direction) const {
	return focusAreaHistory_.find(direction) != focusAreaHistory_.end();
}

}  // namespace Rotary
