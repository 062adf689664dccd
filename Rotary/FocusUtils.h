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

#include <functional>
#include <vector>

#include "Common/UI/View.h"

namespace UI {
class ViewGroup;
}

namespace Rotary {

class FocusArea;

// How "good" a focused view is, weakest first. AdjustFocus only ever moves focus to something better.
enum FocusLevel {
	NO_FOCUS = 1,
	SCROLLABLE_CONTAINER_FOCUS = 2,
	REGULAR_FOCUS = 3,
	IMPLICIT_DEFAULT_FOCUS = 4,
	DEFAULT_FOCUS = 5,
	FOCUSED_BY_DEFAULT = 6,
};

typedef std::function<bool(UI::View *)> ViewPredicate;

FocusLevel GetFocusLevel(UI::View *view);

// Focuses the best view under root that beats the current focus. Tried in order:
// focused-by-default view, default focus of the first focus area that has a usable one,
// the first focusable view in the first rotary container, the first regular focusable view,
// and finally a scrollable container with nothing focusable inside.
// Returns false if nothing better was found and focused.
bool AdjustFocus(UI::View *root, UI::View *currentFocus);
bool AdjustFocus(UI::View *root, FocusLevel currentLevel);

// Focuses view, leaving touch mode if needed. True if it's already focused.
bool RequestFocus(UI::View *view);

// Focusable (or delegates focus), enabled, shown, non-empty and attached. The parking view
// never qualifies, and a scrollable container only when nothing inside it can take focus.
bool CanTakeFocus(UI::View *view);

FocusArea *GetAncestorFocusArea(UI::View *view);
// Stops at focus areas, scrollable containers never contain one.
UI::ViewGroup *GetAncestorScrollableContainer(UI::View *view);

bool IsRotaryContainer(const UI::View *view);
bool IsScrollableContainer(const UI::View *view);
bool IsFocusDelegatingContainer(const UI::View *view);
bool IsImplicitDefaultFocusView(UI::View *view);

// Pre-order search. Subtrees whose root matches skip are not entered.
UI::View *DepthFirstSearch(UI::View *view, const ViewPredicate &target, const ViewPredicate &skip);

UI::View *FindFirstFocusableDescendant(UI::View *view);
UI::View *FindFocusedByDefaultView(UI::View *view);
UI::View *FindImplicitDefaultFocusView(UI::View *view);
UI::View *FindDefaultFocusView(UI::View *view);

// All views under root (root excluded) that can take focus, in tree order.
void CollectFocusableDescendants(UI::View *root, std::vector<UI::View *> *views);

}  // namespace Rotary
