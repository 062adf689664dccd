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
#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"

#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConstants.h"

namespace Rotary {

FocusParkingView::FocusParkingView() {
	// Has to take focus in touch mode too, see WindowFocusChanged.
	SetFocusableInTouchMode(true);
	SetMeasuredSize(1.0f, 1.0f);
}

FocusParkingView::~FocusParkingView() {
	RemoveFocusChangeListener();
}

void FocusParkingView::OnAttachedToWindow() {
	View::OnAttachedToWindow();
	listenerToken_ = window_->AddFocusChangeListener([this](UI::View *oldFocus, UI::View *newFocus) {
		OnGlobalFocusChanged(oldFocus, newFocus);
	});
}

void FocusParkingView::OnDetachedFromWindow() {
	RemoveFocusChangeListener();
	UpdateFocusedView(nullptr);
	View::OnDetachedFromWindow();
}

void FocusParkingView::RemoveFocusChangeListener() {
	if (listenerToken_ != 0 && window_)
		window_->RemoveFocusChangeListener(listenerToken_);
	listenerToken_ = 0;
}

void FocusParkingView::OnGlobalFocusChanged(UI::View *oldFocus, UI::View *newFocus) {
	UpdateFocusedView(newFocus && newFocus->IsFocusParkingView() ? nullptr : newFocus);
}

void FocusParkingView::UpdateFocusedView(UI::View *focusedView) {
	focusedView_ = UI::ViewHandle(focusedView);
	scrollableContainer_ = UI::ViewHandle(GetAncestorScrollableContainer(focusedView));
}

bool FocusParkingView::SetFocus() {
	if (!shouldRestoreFocus_)
		return View::SetFocus();
	return RestoreFocusInRoot(true);
}

bool FocusParkingView::RestoreDefaultFocus() {
	if (!shouldRestoreFocus_)
		return View::RestoreDefaultFocus();
	return RestoreFocusInRoot(true);
}

bool FocusParkingView::PerformAction(int action, const UI::ActionBundle *arguments) {
	switch (action) {
	case ACTION_RESTORE_DEFAULT_FOCUS:
		return RestoreFocusInRoot(false);
	case UI::ACTION_FOCUS:
		// Not View::PerformAction, that would leave touch mode.
		if (!HasFocus())
			return View::SetFocus();
		return false;
	default:
		return View::PerformAction(action, arguments);
	}
}

void FocusParkingView::WindowFocusChanged(bool hasWindowFocus) {
	if (!hasWindowFocus) {
		// Hide the focus highlight while the window is in the background.
		if (!View::SetFocus())
			WARN_LOG(Log::ParkingView, "Couldn't park focus when the window lost focus");
		// Whatever was focused may be gone by the time the window gets focus back.
		UpdateFocusedView(nullptr);
	} else if (IsFocused()) {
		RestoreFocusInRoot(true);
	}
	View::WindowFocusChanged(hasWindowFocus);
}

bool FocusParkingView::RestoreFocusInRoot(bool checkForTouchMode) {
	if (!window_)
		return false;
	if (checkForTouchMode && window_->IsInTouchMode())
		return false;

	if (MaybeFocusOnScrollableContainer())
		return true;

	if (AdjustFocus(GetRootView(), nullptr))
		return true;

	// Nothing else can take focus, keep it here.
	VERBOSE_LOG(Log::ParkingView, "Nothing to focus, parking");
	return View::SetFocus();
}

bool FocusParkingView::MaybeFocusOnScrollableContainer() {
	UI::View *focusedView = focusedView_.Get();
	UI::View *container = scrollableContainer_.Get();
	if (!focusedView || !container)
		return false;
	// The view was scrolled off screen: it left the window but still belongs to the container.
	if (focusedView->IsAttachedToWindow() || !focusedView->GetParent())
		return false;
	if (!container->IsAttachedToWindow() || !container->IsShown())
		return false;
	DEBUG_LOG(Log::ParkingView, "%s left the window, focusing its container", focusedView->DescribeLog().c_str());
	return container->SetFocus();
}

}  // namespace Rotary
