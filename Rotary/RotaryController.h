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

#include <vector>

#include "Common/UI/View.h"

namespace UI {
class Window;
}

namespace Rotary {

class FocusArea;
class FocusParkingView;

// Turns rotary controller input into actions on the focus areas and the focus parking view
// of a window, the way the input service of the system does.
class RotaryController {
public:
	RotaryController(UI::Window *window) : window_(window) {}

	// Moves focus to another focus area, or to the nudge shortcut of the current one.
	bool Nudge(UI::FocusDirection direction);
	// Moves focus count steps forward (positive) or backward within the current focus area.
	// Stops at the ends.
	bool Rotate(int count);
	// Asks the focus parking view to put focus somewhere sensible.
	bool RestoreDefaultFocus();

	FocusArea *GetCurrentFocusArea() const;

private:
	FocusParkingView *FindFocusParkingView() const;
	void CollectFocusAreas(std::vector<FocusArea *> *focusAreas) const;

	UI::Window *window_;
};

// The bounds the controller uses for a focus area, shrunk by the offsets it publishes.
Bounds GetFocusAreaNudgeBounds(const FocusArea *focusArea);

}  // namespace Rotary
