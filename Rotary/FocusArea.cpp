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

#include <algorithm>

#include "Common/Data/Format/IniFile.h"
#include "Common/Log.h"
#include "Common/TimeUtil.h"
#include "Common/UI/Window.h"

#include "Rotary/FocusArea.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConfig.h"
#include "Rotary/RotaryConstants.h"

namespace Rotary {

FocusArea::FocusArea(UI::Orientation orientation)
	: LinearLayout(orientation),
	  defaultFocusOverridesHistory_(g_RotaryConfig.bDefaultFocusOverridesHistory),
	  clearFocusAreaHistoryWhenRotating_(g_RotaryConfig.bClearFocusAreaHistoryWhenRotating) {
	if (!rotaryCache_.Init(g_RotaryConfig.GetFocusHistoryPolicy(), g_RotaryConfig.GetFocusAreaHistoryPolicy())) {
		WARN_LOG(Log::FocusArea, "Bad cache config, history never expires");
	}
}

FocusArea::~FocusArea() {
	RemoveFocusChangeListener();
}

static UI::View *FindDescendantByTag(UI::ViewGroup *group, const std::string &tag) {
	UI::View *view = group->FindViewByTag(tag);
	if (view && group->ContainsSubview(view))
		return view;
	return nullptr;
}

bool FocusArea::LoadAttributes(const Section &section) {
	std::string defaultFocusTag;
	std::string shortcutTag;
	std::string shortcutDirectionName;
	section.Get("DefaultFocus", &defaultFocusTag, "");
	section.Get("NudgeShortcut", &shortcutTag, "");
	section.Get("NudgeShortcutDirection", &shortcutDirectionName, "");

	UI::View *defaultFocus = nullptr;
	if (!defaultFocusTag.empty()) {
		defaultFocus = FindDescendantByTag(this, defaultFocusTag);
		if (!defaultFocus) {
			ERROR_LOG(Log::FocusArea, "%s: DefaultFocus '%s' is not inside the focus area", DescribeLog().c_str(), defaultFocusTag.c_str());
			return false;
		}
	}

	if (shortcutTag.empty() != shortcutDirectionName.empty()) {
		ERROR_LOG(Log::FocusArea, "%s: NudgeShortcut and NudgeShortcutDirection must be specified together", DescribeLog().c_str());
		return false;
	}
	UI::View *shortcut = nullptr;
	UI::FocusDirection shortcutDirection = UI::FOCUS_UP;
	if (!shortcutTag.empty()) {
		if (!NudgeDirectionFromString(shortcutDirectionName, &shortcutDirection)) {
			ERROR_LOG(Log::FocusArea, "%s: Unknown NudgeShortcutDirection '%s'", DescribeLog().c_str(), shortcutDirectionName.c_str());
			return false;
		}
		shortcut = FindDescendantByTag(this, shortcutTag);
		if (!shortcut) {
			ERROR_LOG(Log::FocusArea, "%s: NudgeShortcut '%s' is not inside the focus area", DescribeLog().c_str(), shortcutTag.c_str());
			return false;
		}
	}

	static const struct {
		const char *key;
		UI::FocusDirection direction;
	} nudgeKeys[] = {
		{ "NudgeLeft", UI::FOCUS_LEFT },
		{ "NudgeRight", UI::FOCUS_RIGHT },
		{ "NudgeUp", UI::FOCUS_UP },
		{ "NudgeDown", UI::FOCUS_DOWN },
	};
	std::map<UI::FocusDirection, std::string> nudgeTags;
	for (const auto &entry : nudgeKeys) {
		std::string tag;
		if (section.Get(entry.key, &tag, "") && !tag.empty())
			nudgeTags[entry.direction] = tag;
	}

	// Start and end follow the layout direction. The sides fall back to the axis wide offset.
	int horizontal, vertical;
	section.Get("HorizontalBoundOffset", &horizontal, 0);
	section.Get("VerticalBoundOffset", &vertical, 0);
	int start, end, top, bottom;
	section.Get("StartBoundOffset", &start, horizontal);
	section.Get("EndBoundOffset", &end, horizontal);
	section.Get("TopBoundOffset", &top, vertical);
	section.Get("BottomBoundOffset", &bottom, vertical);

	bool overridesHistory, clearHistory;
	section.Get("DefaultFocusOverridesHistory", &overridesHistory, defaultFocusOverridesHistory_);
	section.Get("ClearFocusAreaHistoryWhenRotating", &clearHistory, clearFocusAreaHistoryWhenRotating_);

	// All good, apply.
	defaultFocusView_ = UI::ViewHandle(defaultFocus);
	hasNudgeShortcut_ = shortcut != nullptr;
	nudgeShortcutView_ = UI::ViewHandle(shortcut);
	nudgeShortcutDirection_ = shortcutDirection;

	specifiedNudgeTags_ = nudgeTags;
	specifiedNudgeFocusAreas_.clear();
	nudgeTagsResolved_ = specifiedNudgeTags_.empty();

	rtl_ = IsLayoutRtl();
	leftOffset_ = rtl_ ? end : start;
	rightOffset_ = rtl_ ? start : end;
	topOffset_ = top;
	bottomOffset_ = bottom;

	defaultFocusOverridesHistory_ = overridesHistory;
	clearFocusAreaHistoryWhenRotating_ = clearHistory;
	return true;
}

bool FocusArea::SetDefaultFocus(UI::View *view) {
	if (view && !ContainsSubview(view)) {
		ERROR_LOG(Log::FocusArea, "%s: default focus %s is not inside the focus area", DescribeLog().c_str(), view->DescribeLog().c_str());
		return false;
	}
	defaultFocusView_ = UI::ViewHandle(view);
	return true;
}

bool FocusArea::SetNudgeShortcut(UI::View *shortcut, UI::FocusDirection direction) {
	if (!shortcut || !UI::IsCardinal(direction)) {
		ERROR_LOG(Log::FocusArea, "%s: a nudge shortcut needs both a view and a cardinal direction", DescribeLog().c_str());
		return false;
	}
	if (!ContainsSubview(shortcut)) {
		ERROR_LOG(Log::FocusArea, "%s: nudge shortcut %s is not inside the focus area", DescribeLog().c_str(), shortcut->DescribeLog().c_str());
		return false;
	}
	hasNudgeShortcut_ = true;
	nudgeShortcutView_ = UI::ViewHandle(shortcut);
	nudgeShortcutDirection_ = direction;
	return true;
}

void FocusArea::ClearNudgeShortcut() {
	hasNudgeShortcut_ = false;
	nudgeShortcutView_.Reset();
}

void FocusArea::SetNudgeTargetFocusArea(UI::FocusDirection direction, FocusArea *target) {
	specifiedNudgeTags_.erase(direction);
	if (target)
		specifiedNudgeFocusAreas_[direction] = UI::ViewHandle(target);
	else
		specifiedNudgeFocusAreas_.erase(direction);
}

FocusArea *FocusArea::GetNudgeTargetFocusArea(UI::FocusDirection direction) {
	if (!nudgeTagsResolved_ && window_) {
		UI::View *root = GetRootView();
		for (const auto &iter : specifiedNudgeTags_) {
			UI::View *view = root->FindViewByTag(iter.second);
			if (!view || !view->IsFocusArea()) {
				WARN_LOG(Log::FocusArea, "%s: nudge %s target '%s' is not a focus area, ignoring", DescribeLog().c_str(), UI::FocusDirectionToString(iter.first), iter.second.c_str());
				continue;
			}
			specifiedNudgeFocusAreas_[iter.first] = UI::ViewHandle(view);
		}
		nudgeTagsResolved_ = true;
	}

	auto iter = specifiedNudgeFocusAreas_.find(direction);
	if (iter == specifiedNudgeFocusAreas_.end())
		return nullptr;
	UI::View *view = iter->second.Get();
	return view ? static_cast<FocusArea *>(view) : nullptr;
}

void FocusArea::SetBoundsOffset(int left, int top, int right, int bottom) {
	leftOffset_ = left;
	topOffset_ = top;
	rightOffset_ = right;
	bottomOffset_ = bottom;
}

Bounds FocusArea::GetNudgeBounds() const {
	return bounds_.Inset((float)leftOffset_, (float)topOffset_, (float)rightOffset_, (float)bottomOffset_);
}

FocusArea *FocusArea::GetPreviousFocusArea() const {
	UI::View *view = previousFocusArea_.Get();
	return view && view->IsFocusArea() ? static_cast<FocusArea *>(view) : nullptr;
}

void FocusArea::OnAttachedToWindow() {
	LinearLayout::OnAttachedToWindow();

	nested_ = false;
	for (UI::ViewGroup *parent = GetParent(); parent; parent = parent->GetParent()) {
		if (parent->IsFocusArea()) {
			nested_ = true;
			break;
		}
	}
	if (nested_) {
		if (!nestedReported_) {
			ERROR_LOG(Log::FocusArea, "%s is nested inside another focus area, rotary actions are disabled", DescribeLog().c_str());
			nestedReported_ = true;
		}
		return;
	}

	hasFocus_ = HasFocus();
	listenerToken_ = window_->AddFocusChangeListener([this](UI::View *oldFocus, UI::View *newFocus) {
		OnGlobalFocusChanged(oldFocus, newFocus);
	});
}

void FocusArea::OnDetachedFromWindow() {
	RemoveFocusChangeListener();
	hasFocus_ = false;
	focusedView_.Reset();
	previousFocusArea_.Reset();
	LinearLayout::OnDetachedFromWindow();
}

void FocusArea::RemoveFocusChangeListener() {
	if (listenerToken_ != 0 && window_)
		window_->RemoveFocusChangeListener(listenerToken_);
	listenerToken_ = 0;
}

void FocusArea::OnGlobalFocusChanged(UI::View *oldFocus, UI::View *newFocus) {
	bool hasFocus = HasFocus();
	SaveFocusHistory(hasFocus);
	MaybeUpdatePreviousFocusArea(hasFocus, oldFocus);
	MaybeClearFocusAreaHistory(hasFocus, oldFocus);
	hasFocus_ = hasFocus;
}

void FocusArea::SaveFocusHistory(bool hasFocus) {
	if (hasFocus) {
		focusedView_ = UI::ViewHandle(FindFocus());
		return;
	}
	// Snapshot only when focus leaves, so unrelated changes elsewhere don't wipe it.
	if (hasFocus_) {
		UI::View *lastFocused = focusedView_.Get();
		if (lastFocused)
			rotaryCache_.SaveFocusedView(lastFocused, time_now_ms());
		focusedView_.Reset();
	}
}

void FocusArea::MaybeUpdatePreviousFocusArea(bool hasFocus, UI::View *oldFocus) {
	// Only a move into this area from elsewhere sets it; anything else clears it.
	if (hasFocus_ || !hasFocus || !oldFocus || oldFocus->IsFocusParkingView()) {
		previousFocusArea_.Reset();
		return;
	}
	FocusArea *previous = GetAncestorFocusArea(oldFocus);
	if (!previous)
		WARN_LOG(Log::FocusArea, "No ancestor focus area for %s", oldFocus->DescribeLog().c_str());
	previousFocusArea_ = UI::ViewHandle(previous);
}

void FocusArea::MaybeClearFocusAreaHistory(bool hasFocus, UI::View *oldFocus) {
	if (!clearFocusAreaHistoryWhenRotating_ || !hasFocus || !oldFocus)
		return;
	// Focus moved within this focus area, that is, the user rotated.
	if (GetAncestorFocusArea(oldFocus) != this)
		return;
	rotaryCache_.ClearFocusAreaHistory();
}

bool FocusArea::FocusOnDescendant() {
	UI::View *lastFocused = rotaryCache_.GetFocusedView(time_now_ms());
	if (lastFocused && !ContainsSubview(lastFocused))
		lastFocused = nullptr;

	if (defaultFocusOverridesHistory_) {
		if (AdjustFocus(this, REGULAR_FOCUS) || RequestFocus(lastFocused))
			return true;
	} else {
		if (RequestFocus(lastFocused) || AdjustFocus(this, REGULAR_FOCUS))
			return true;
	}
	// First focusable view, or failing that a scrollable container.
	return AdjustFocus(this, NO_FOCUS);
}

bool FocusArea::MaybeAdjustFocus() {
	if (!window_)
		return false;
	return AdjustFocus(GetRootView(), window_->GetFocusedView());
}

void FocusArea::SaveFocusAreaHistory(UI::FocusDirection direction, FocusArea *sourceFocusArea, FocusArea *targetFocusArea, int64_t now) {
	_assert_msg_(UI::IsCardinal(direction), "Bad nudge direction %d", (int)direction);
	// One way only: skipped when source already remembers where this direction goes.
	if (sourceFocusArea->rotaryCache_.GetCachedFocusArea(direction, now) == nullptr) {
		targetFocusArea->rotaryCache_.SaveFocusArea(UI::Opposite(direction), sourceFocusArea, now);
	}
}

bool FocusArea::NudgeToShortcutView(const UI::ActionBundle *arguments) {
	if (!hasNudgeShortcut_)
		return false;
	UI::FocusDirection direction;
	if (!GetNudgeDirection(arguments, &direction) || direction != nudgeShortcutDirection_)
		return false;
	UI::View *shortcut = nudgeShortcutView_.Get();
	// Already there, let the nudge go to another focus area instead.
	if (!shortcut || shortcut->IsFocused())
		return false;
	return RequestFocus(shortcut);
}

bool FocusArea::NudgeToAnotherFocusArea(const UI::ActionBundle *arguments) {
	UI::FocusDirection direction;
	if (!GetNudgeDirection(arguments, &direction)) {
		WARN_LOG(Log::FocusArea, "%s: nudge to another focus area without a direction", DescribeLog().c_str());
		return false;
	}

	FocusArea *target = GetNudgeTargetFocusArea(direction);
	if (target && target != this && !target->IsNested() && target->FocusOnDescendant())
		return true;

	target = rotaryCache_.GetCachedFocusArea(direction, time_now_ms());
	return target && target != this && !target->IsNested() && target->FocusOnDescendant();
}

bool FocusArea::PerformAction(int action, const UI::ActionBundle *arguments) {
	switch (action) {
	case UI::ACTION_FOCUS:
	case ACTION_NUDGE_SHORTCUT:
	case ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA:
		if (nested_)
			return false;
		break;
	default:
		return LinearLayout::PerformAction(action, arguments);
	}

	switch (action) {
	case UI::ACTION_FOCUS:
	{
		bool hadFocus = hasFocus_;
		if (!FocusOnDescendant())
			return false;
		// The listener has just recorded where focus came from.
		FocusArea *previous = hadFocus ? nullptr : GetPreviousFocusArea();
		UI::FocusDirection direction;
		if (previous && previous != this && GetNudgeDirection(arguments, &direction))
			SaveFocusAreaHistory(direction, previous, this, time_now_ms());
		return true;
	}
	case ACTION_NUDGE_SHORTCUT:
		return NudgeToShortcutView(arguments);
	default:
		return NudgeToAnotherFocusArea(arguments);
	}
}

bool FocusArea::RequestFocusInDescendants() {
	if (window_->IsInTouchMode())
		return LinearLayout::RequestFocusInDescendants();
	return MaybeAdjustFocus();
}

bool FocusArea::RestoreDefaultFocus() {
	return MaybeAdjustFocus();
}

void FocusArea::WindowFocusChanged(bool hasWindowFocus) {
	// Make sure focus starts out somewhere sensible in rotary mode.
	if (hasWindowFocus && window_ && !window_->IsInTouchMode())
		MaybeAdjustFocus();
	LinearLayout::WindowFocusChanged(hasWindowFocus);
}

void FocusArea::Layout() {
	LinearLayout::Layout();
	bool rtl = IsLayoutRtl();
	if (rtl != rtl_) {
		std::swap(leftOffset_, rightOffset_);
		rtl_ = rtl;
	}
}

void FocusArea::GetExtras(UI::ActionBundle *extras) const {
	extras->PutInt(FOCUS_AREA_LEFT_BOUND_OFFSET, leftOffset_);
	extras->PutInt(FOCUS_AREA_RIGHT_BOUND_OFFSET, rightOffset_);
	extras->PutInt(FOCUS_AREA_TOP_BOUND_OFFSET, topOffset_);
	extras->PutInt(FOCUS_AREA_BOTTOM_BOUND_OFFSET, bottomOffset_);
}

}  // namespace Rotary
