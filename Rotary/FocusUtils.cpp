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

#include "Common/UI/ViewGroup.h"
#include "Common/Log.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusUtils.h"

namespace Rotary {

static bool IsNotShown(UI::View *view) {
	return !view->IsShown();
}

bool IsRotaryContainer(const UI::View *view) {
	switch (view->GetRotaryRole()) {
	case UI::RotaryRole::CONTAINER:
	case UI::RotaryRole::VERTICALLY_SCROLLABLE:
	case UI::RotaryRole::HORIZONTALLY_SCROLLABLE:
		return true;
	default:
		return false;
	}
}

bool IsScrollableContainer(const UI::View *view) {
	UI::RotaryRole role = view->GetRotaryRole();
	return role == UI::RotaryRole::VERTICALLY_SCROLLABLE || role == UI::RotaryRole::HORIZONTALLY_SCROLLABLE;
}

bool IsFocusDelegatingContainer(const UI::View *view) {
	return view->GetRotaryRole() == UI::RotaryRole::FOCUS_DELEGATING_CONTAINER;
}

UI::View *DepthFirstSearch(UI::View *view, const ViewPredicate &target, const ViewPredicate &skip) {
	if (skip && skip(view))
		return nullptr;
	if (target(view))
		return view;
	if (view->IsViewGroup()) {
		UI::ViewGroup *group = static_cast<UI::ViewGroup *>(view);
		for (int i = 0; i < group->GetNumSubviews(); i++) {
			UI::View *found = DepthFirstSearch(group->GetViewByIndex(i), target, skip);
			if (found)
				return found;
		}
	}
	return nullptr;
}

bool CanTakeFocus(UI::View *view) {
	bool focusable = view->CanBeFocused() || IsFocusDelegatingContainer(view);
	const Bounds &bounds = view->GetBounds();
	return focusable && view->IsEnabled() && view->IsShown()
		&& bounds.w > 0.0f && bounds.h > 0.0f && view->IsAttachedToWindow()
		&& !view->IsFocusParkingView()
		// A scrollable container is only worth focusing when there's nothing in it to focus,
		// so that the controller can scroll it.
		&& (!IsScrollableContainer(view) || FindFirstFocusableDescendant(view) == nullptr);
}

bool RequestFocus(UI::View *view) {
	if (!view || !CanTakeFocus(view))
		return false;
	if (view->IsFocused())
		return true;
	// The action leaves touch mode first, the view may not be focusable in touch mode.
	return view->PerformAction(UI::ACTION_FOCUS, nullptr);
}

FocusArea *GetAncestorFocusArea(UI::View *view) {
	for (UI::View *parent = view->GetParent(); parent; parent = parent->GetParent()) {
		if (parent->IsFocusArea())
			return static_cast<FocusArea *>(parent);
	}
	return nullptr;
}

UI::ViewGroup *GetAncestorScrollableContainer(UI::View *view) {
	if (!view)
		return nullptr;
	for (UI::ViewGroup *parent = view->GetParent(); parent && !parent->IsFocusArea(); parent = parent->GetParent()) {
		if (IsScrollableContainer(parent))
			return parent;
	}
	return nullptr;
}

UI::View *FindFirstFocusableDescendant(UI::View *view) {
	return DepthFirstSearch(view, [view](UI::View *v) {
		return v != view && CanTakeFocus(v);
	}, &IsNotShown);
}

UI::View *FindFocusedByDefaultView(UI::View *view) {
	return DepthFirstSearch(view, [](UI::View *v) {
		return v->IsFocusedByDefault() && CanTakeFocus(v);
	}, &IsNotShown);
}

static UI::View *FindRotaryContainer(UI::View *view) {
	return DepthFirstSearch(view, [](UI::View *v) {
		return IsRotaryContainer(v);
	}, &IsNotShown);
}

UI::View *FindImplicitDefaultFocusView(UI::View *view) {
	UI::View *rotaryContainer = FindRotaryContainer(view);
	return rotaryContainer ? FindFirstFocusableDescendant(rotaryContainer) : nullptr;
}

UI::View *FindDefaultFocusView(UI::View *view) {
	if (!view->IsShown())
		return nullptr;
	if (view->IsFocusArea()) {
		UI::View *defaultFocus = static_cast<FocusArea *>(view)->GetDefaultFocusView();
		if (defaultFocus && CanTakeFocus(defaultFocus))
			return defaultFocus;
	} else if (view->IsViewGroup()) {
		UI::ViewGroup *group = static_cast<UI::ViewGroup *>(view);
		for (int i = 0; i < group->GetNumSubviews(); i++) {
			UI::View *defaultFocus = FindDefaultFocusView(group->GetViewByIndex(i));
			if (defaultFocus)
				return defaultFocus;
		}
	}
	return nullptr;
}

bool IsImplicitDefaultFocusView(UI::View *view) {
	UI::ViewGroup *rotaryContainer = nullptr;
	for (UI::ViewGroup *parent = view->GetParent(); parent; parent = parent->GetParent()) {
		if (IsRotaryContainer(parent)) {
			rotaryContainer = parent;
			break;
		}
	}
	if (!rotaryContainer)
		return false;
	return FindFirstFocusableDescendant(rotaryContainer) == view;
}

static bool IsDefaultFocus(UI::View *view) {
	FocusArea *focusArea = GetAncestorFocusArea(view);
	return focusArea && focusArea->GetDefaultFocusView() == view;
}

FocusLevel GetFocusLevel(UI::View *view) {
	if (!view || view->IsFocusParkingView() || !view->IsShown())
		return NO_FOCUS;
	if (view->IsFocusedByDefault())
		return FOCUSED_BY_DEFAULT;
	if (IsDefaultFocus(view))
		return DEFAULT_FOCUS;
	if (IsImplicitDefaultFocusView(view))
		return IMPLICIT_DEFAULT_FOCUS;
	if (IsScrollableContainer(view))
		return SCROLLABLE_CONTAINER_FOCUS;
	return REGULAR_FOCUS;
}

static bool FocusOnFirstRegularView(UI::View *root) {
	UI::View *focused = DepthFirstSearch(root, [](UI::View *v) {
		return !IsScrollableContainer(v) && CanTakeFocus(v) && RequestFocus(v);
	}, &IsNotShown);
	return focused != nullptr;
}

static bool FocusOnScrollableContainer(UI::View *root) {
	UI::View *container = DepthFirstSearch(root, [](UI::View *v) {
		return IsScrollableContainer(v) && CanTakeFocus(v);
	}, &IsNotShown);
	return RequestFocus(container);
}

bool AdjustFocus(UI::View *root, UI::View *currentFocus) {
	return AdjustFocus(root, GetFocusLevel(currentFocus));
}

bool AdjustFocus(UI::View *root, FocusLevel currentLevel) {
	if (currentLevel < FOCUSED_BY_DEFAULT && RequestFocus(FindFocusedByDefaultView(root)))
		return true;
	if (currentLevel < DEFAULT_FOCUS && RequestFocus(FindDefaultFocusView(root)))
		return true;
	if (currentLevel < IMPLICIT_DEFAULT_FOCUS && RequestFocus(FindImplicitDefaultFocusView(root)))
		return true;
	if (currentLevel < REGULAR_FOCUS && FocusOnFirstRegularView(root))
		return true;
	if (currentLevel < SCROLLABLE_CONTAINER_FOCUS)
		return FocusOnScrollableContainer(root);
	return false;
}

void CollectFocusableDescendants(UI::View *root, std::vector<UI::View *> *views) {
	DepthFirstSearch(root, [root, views](UI::View *v) {
		if (v != root && CanTakeFocus(v))
			views->push_back(v);
		// Keep going, we want them all.
		return false;
	}, &IsNotShown);
}

}  // namespace Rotary
