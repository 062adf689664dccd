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

#include <string>

#include "Common/UI/View.h"

namespace Rotary {

// Invisible 1x1 view that holds focus when nothing else should, one per window.
//
// Put it first in the window, so that when the focused view goes away (removed, hidden, disabled,
// scrolled off screen) the window offers focus to it first. It then passes focus on to the most
// suitable view instead of keeping it, and only keeps it when there's nothing else.
//
// It also takes focus when the window loses focus, so that two windows never both show a
// focused view.
class FocusParkingView : public UI::View {
public:
	FocusParkingView();
	~FocusParkingView();

	// Turn off for windows embedded in other windows. Focus requests then focus this view
	// like any other view.
	void SetShouldRestoreFocus(bool shouldRestoreFocus) { shouldRestoreFocus_ = shouldRestoreFocus; }
	bool ShouldRestoreFocus() const { return shouldRestoreFocus_; }

	bool SetFocus() override;
	bool RestoreDefaultFocus() override;
	bool PerformAction(int action, const UI::ActionBundle *arguments) override;
	void WindowFocusChanged(bool hasWindowFocus) override;

	// Focuses, in order: the scrollable container of the last focused view if that view has
	// left the tree, the best view in the window, this view. Only fails in touch mode, when asked
	// to check for it.
	bool RestoreFocusInRoot(bool checkForTouchMode);

	UI::View *GetLastFocusedView() const { return focusedView_.Get(); }

	bool IsFocusParkingView() const override { return true; }
	std::string DescribeLog() const override { return "FocusParkingView: " + View::DescribeLog(); }

protected:
	void OnAttachedToWindow() override;
	void OnDetachedFromWindow() override;

private:
	void OnGlobalFocusChanged(UI::View *oldFocus, UI::View *newFocus);
	void UpdateFocusedView(UI::View *focusedView);
	bool MaybeFocusOnScrollableContainer();
	void RemoveFocusChangeListener();

	// Not owned, either of them.
	UI::ViewHandle focusedView_;
	UI::ViewHandle scrollableContainer_;

	bool shouldRestoreFocus_ = true;
	int listenerToken_ = 0;

	DISALLOW_COPY_AND_ASSIGN(FocusParkingView);
};

}  // namespace Rotary
