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
#include <utility>

#include "Common/Log.h"
#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"

#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConstants.h"
#include "Rotary/RotaryController.h"

namespace Rotary {

Bounds GetFocusAreaNudgeBounds(const FocusArea *focusArea) {
	UI::ActionBundle extras;
	focusArea->GetExtras(&extras);
	return focusArea->GetBounds().Inset(
		(float)extras.GetInt(FOCUS_AREA_LEFT_BOUND_OFFSET),
		(float)extras.GetInt(FOCUS_AREA_TOP_BOUND_OFFSET),
		(float)extras.GetInt(FOCUS_AREA_RIGHT_BOUND_OFFSET),
		(float)extras.GetInt(FOCUS_AREA_BOTTOM_BOUND_OFFSET));
}

static bool IsNotShown(UI::View *view) {
	return !view->IsShown();
}

void RotaryController::CollectFocusAreas(std::vector<FocusArea *> *focusAreas) const {
	UI::ViewGroup *root = window_->GetRoot();
	if (!root)
		return;
	DepthFirstSearch(root, [focusAreas](UI::View *v) {
		if (v->IsFocusArea())
			focusAreas->push_back(static_cast<FocusArea *>(v));
		return false;
	}, &IsNotShown);
}

FocusParkingView *RotaryController::FindFocusParkingView() const {
	UI::ViewGroup *root = window_->GetRoot();
	if (!root)
		return nullptr;
	UI::View *view = DepthFirstSearch(root, [](UI::View *v) {
		return v->IsFocusParkingView();
	}, nullptr);
	return static_cast<FocusParkingView *>(view);
}

FocusArea *RotaryController::GetCurrentFocusArea() const {
	UI::View *focused = window_->GetFocusedView();
	if (!focused || focused->IsFocusParkingView())
		return nullptr;
	return GetAncestorFocusArea(focused);
}

bool RotaryController::RestoreDefaultFocus() {
	FocusParkingView *parkingView = FindFocusParkingView();
	if (!parkingView) {
		WARN_LOG(Log::Controller, "No focus parking view in the window");
		return false;
	}
	return parkingView->PerformAction(ACTION_RESTORE_DEFAULT_FOCUS, nullptr);
}

bool RotaryController::Nudge(UI::FocusDirection direction) {
	if (!UI::IsCardinal(direction)) {
		ERROR_LOG(Log::Controller, "Can't nudge %s", UI::FocusDirectionToString(direction));
		return false;
	}

	std::vector<FocusArea *> focusAreas;
	CollectFocusAreas(&focusAreas);

	UI::View *focused = window_->GetFocusedView();
	if (!focused || focused->IsFocusParkingView()) {
		// Nothing to nudge from, just focus something.
		for (FocusArea *focusArea : focusAreas) {
			if (focusArea->PerformAction(UI::ACTION_FOCUS, nullptr))
				return true;
		}
		return false;
	}

	FocusArea *current = GetAncestorFocusArea(focused);
	if (!current) {
		WARN_LOG(Log::Controller, "%s is not in a focus area, can't nudge", focused->DescribeLog().c_str());
		return false;
	}

	UI::ActionBundle arguments;
	arguments.PutInt(NUDGE_DIRECTION, direction);
	if (current->PerformAction(ACTION_NUDGE_SHORTCUT, &arguments)) {
		DEBUG_LOG(Log::Controller, "Nudged %s to shortcut", UI::FocusDirectionToString(direction));
		return true;
	}
	if (current->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &arguments)) {
		DEBUG_LOG(Log::Controller, "Nudged %s to a specified or remembered focus area", UI::FocusDirectionToString(direction));
		return true;
	}

	// Geometric search. Best candidate first, moving on if it refuses focus.
	const Bounds origin = GetFocusAreaNudgeBounds(current);
	std::vector<std::pair<float, FocusArea *>> candidates;
	for (FocusArea *focusArea : focusAreas) {
		if (focusArea == current)
			continue;
		float score = UI::GetDirectionalScore(origin, GetFocusAreaNudgeBounds(focusArea), direction);
		if (score > 0.0f)
			candidates.push_back(std::make_pair(score, focusArea));
	}
	std::stable_sort(candidates.begin(), candidates.end(), [](const std::pair<float, FocusArea *> &a, const std::pair<float, FocusArea *> &b) {
		return a.first > b.first;
	});

	for (const auto &candidate : candidates) {
		if (candidate.second->PerformAction(UI::ACTION_FOCUS, &arguments)) {
			DEBUG_LOG(Log::Controller, "Nudged %s to %s", UI::FocusDirectionToString(direction), candidate.second->DescribeLog().c_str());
			return true;
		}
	}
	VERBOSE_LOG(Log::Controller, "Nothing to nudge to in direction %s", UI::FocusDirectionToString(direction));
	return false;
}

bool RotaryController::Rotate(int count) {
	if (count == 0)
		return false;

	FocusArea *current = GetCurrentFocusArea();
	if (!current)
		return RestoreDefaultFocus();

	std::vector<UI::View *> views;
	CollectFocusableDescendants(current, &views);
	if (views.empty())
		return false;

	UI::View *focused = window_->GetFocusedView();
	auto iter = std::find(views.begin(), views.end(), focused);
	int index;
	if (iter != views.end())
		index = (int)(iter - views.begin());
	else
		index = count > 0 ? -1 : (int)views.size();

	int target = std::max(0, std::min((int)views.size() - 1, index + count));
	if (target == index)
		return false;
	return RequestFocus(views[target]);
}

}  // namespace Rotary
