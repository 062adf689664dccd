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

#include <string_view>

#include "Common/UI/View.h"

// Actions and argument keys shared between the rotary input router and the views it drives.
namespace Rotary {

enum : int {
	// Nudge to the shortcut view of the focus area, if it has one in the nudge direction.
	ACTION_NUDGE_SHORTCUT = 0x01000000,
	// Nudge to a focus area explicitly targeted by, or remembered by, the focused one.
	ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA = 0x02000000,
	// Performed on the focus parking view to move focus somewhere sensible.
	ACTION_RESTORE_DEFAULT_FOCUS = 0x04000000,
};

// Argument of the nudge actions and of ACTION_FOCUS on a focus area. Holds a UI::FocusDirection.
extern const char * const NUDGE_DIRECTION;

// Extras published by focus areas.
extern const char * const FOCUS_AREA_LEFT_BOUND_OFFSET;
extern const char * const FOCUS_AREA_RIGHT_BOUND_OFFSET;
extern const char * const FOCUS_AREA_TOP_BOUND_OFFSET;
extern const char * const FOCUS_AREA_BOTTOM_BOUND_OFFSET;

// Reads the nudge direction out of an action bundle. Fails if it's missing or not one of the four
// cardinal directions.
bool GetNudgeDirection(const UI::ActionBundle *arguments, UI::FocusDirection *direction);

// "left", "right", "up", "down", case insensitive.
bool NudgeDirectionFromString(std::string_view str, UI::FocusDirection *direction);

}  // namespace Rotary
