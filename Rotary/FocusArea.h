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
#include <string>
#include <string_view>

#include "Common/UI/ViewGroup.h"
#include "Rotary/RotaryCache.h"

class Section;

namespace Rotary {

// A container of focusable views that the rotary controller nudges between. Focus moves
// within a focus area by rotating and between focus areas by nudging.
//
// Remembers the last focused view inside it, and which focus area a nudge in a given
// direction last came from, so that nudging back returns to the same place.
//
// Focus areas must not be nested. A nested one reports it once and ignores rotary actions.
class FocusArea : public UI::LinearLayout {
public:
	FocusArea(UI::Orientation orientation = UI::ORIENT_VERTICAL);
	~FocusArea();

	// Reads the attributes from an ini section, where views are referred to by tag. Views
	// referred to must already have been added. On a bad configuration, nothing is applied and
	// false is returned.
	bool LoadAttributes(const Section &section);

	UI::View *GetDefaultFocusView() const { return defaultFocusView_.Get(); }
	// view must be inside this focus area, or nullptr.
	bool SetDefaultFocus(UI::View *view);

	// Both or neither. Nudging in direction goes to shortcut, unless it already has focus.
	bool SetNudgeShortcut(UI::View *shortcut, UI::FocusDirection direction);
	void ClearNudgeShortcut();
	UI::View *GetNudgeShortcut() const { return nudgeShortcutView_.Get(); }

	// Overrides the cached history when nudging in direction. nullptr removes the override.
	void SetNudgeTargetFocusArea(UI::FocusDirection direction, FocusArea *target);
	FocusArea *GetNudgeTargetFocusArea(UI::FocusDirection direction);

	// In pixels, how much each side shrinks when working out where the focus area is for nudging.
	void SetBoundsOffset(int left, int top, int right, int bottom);
	int GetLeftBoundOffset() const { return leftOffset_; }
	int GetTopBoundOffset() const { return topOffset_; }
	int GetRightBoundOffset() const { return rightOffset_; }
	int GetBottomBoundOffset() const { return bottomOffset_; }
	Bounds GetNudgeBounds() const;

	void SetDefaultFocusOverridesHistory(bool overrides) { defaultFocusOverridesHistory_ = overrides; }
	bool GetDefaultFocusOverridesHistory() const { return defaultFocusOverridesHistory_; }
	void SetClearFocusAreaHistoryWhenRotating(bool clear) { clearFocusAreaHistoryWhenRotating_ = clear; }
	bool GetClearFocusAreaHistoryWhenRotating() const { return clearFocusAreaHistoryWhenRotating_; }

	// Swaps in another cache, mostly so tests can control expiry.
	void SetRotaryCache(const RotaryCache &cache) { rotaryCache_ = cache; }
	RotaryCache &GetRotaryCache() { return rotaryCache_; }

	FocusArea *GetPreviousFocusArea() const;
	bool IsNested() const { return nested_; }

	bool PerformAction(int action, const UI::ActionBundle *arguments) override;
	bool RestoreDefaultFocus() override;
	void WindowFocusChanged(bool hasWindowFocus) override;
	void Layout() override;
	void GetExtras(UI::ActionBundle *extras) const override;

	bool IsFocusArea() const override { return true; }
	std::string DescribeLog() const override { return "FocusArea: " + View::DescribeLog(); }

protected:
	bool RequestFocusInDescendants() override;
	void OnAttachedToWindow() override;
	void OnDetachedFromWindow() override;

private:
	void OnGlobalFocusChanged(UI::View *oldFocus, UI::View *newFocus);
	void SaveFocusHistory(bool hasFocus);
	void MaybeUpdatePreviousFocusArea(bool hasFocus, UI::View *oldFocus);
	void MaybeClearFocusAreaHistory(bool hasFocus, UI::View *oldFocus);

	bool FocusOnDescendant();
	bool MaybeAdjustFocus();
	bool NudgeToShortcutView(const UI::ActionBundle *arguments);
	bool NudgeToAnotherFocusArea(const UI::ActionBundle *arguments);
	void RemoveFocusChangeListener();

	static void SaveFocusAreaHistory(UI::FocusDirection direction, FocusArea *sourceFocusArea, FocusArea *targetFocusArea, int64_t now);

	UI::ViewHandle defaultFocusView_;

	bool hasNudgeShortcut_ = false;
	UI::FocusDirection nudgeShortcutDirection_ = UI::FOCUS_UP;
	UI::ViewHandle nudgeShortcutView_;

	// Tags from the attributes, resolved against the root the first time a nudge needs them.
	std::map<UI::FocusDirection, std::string> specifiedNudgeTags_;
	std::map<UI::FocusDirection, UI::ViewHandle> specifiedNudgeFocusAreas_;
	bool nudgeTagsResolved_ = true;

	int leftOffset_ = 0;
	int topOffset_ = 0;
	int rightOffset_ = 0;
	int bottomOffset_ = 0;
	// Layout direction the left and right offsets currently correspond to.
	bool rtl_ = false;

	bool defaultFocusOverridesHistory_;
	bool clearFocusAreaHistoryWhenRotating_;
	RotaryCache rotaryCache_;

	UI::ViewHandle previousFocusArea_;
	UI::ViewHandle focusedView_;
	bool hasFocus_ = false;

	int listenerToken_ = 0;
	bool nested_ = false;
	bool nestedReported_ = false;

	DISALLOW_COPY_AND_ASSIGN(FocusArea);
};

}  // namespace Rotary
