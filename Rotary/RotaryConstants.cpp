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

#include "Rotary/RotaryConstants.h"
#include "Common/StringUtils.h"

namespace Rotary {

const char * const NUDGE_DIRECTION = "NUDGE_DIRECTION";

const char * const FOCUS_AREA_LEFT_BOUND_OFFSET = "FOCUS_AREA_LEFT_BOUND_OFFSET";
const char * const FOCUS_AREA_RIGHT_BOUND_OFFSET = "FOCUS_AREA_RIGHT_BOUND_OFFSET";
const char * const FOCUS_AREA_TOP_BOUND_OFFSET = "FOCUS_AREA_TOP_BOUND_OFFSET";
const char * const FOCUS_AREA_BOTTOM_BOUND_OFFSET = "FOCUS_AREA_BOTTOM_BOUND_OFFSET";

bool GetNudgeDirection(const UI::ActionBundle *arguments, UI::FocusDirection *direction) {
	if (!arguments || !arguments->Contains(NUDGE_DIRECTION))
		return false;
	int value = arguments->GetInt(NUDGE_DIRECTION, -1);
	switch (value) {
	case UI::FOCUS_UP:
	case UI::FOCUS_DOWN:
	case UI::FOCUS_LEFT:
	case UI::FOCUS_RIGHT:
		*direction = (UI::FocusDirection)value;
		return true;
	default:
		return false;
	}
}

bool NudgeDirectionFromString(std::string_view str, UI::FocusDirection *direction) {
	static const struct {
		const char *name;
		UI::FocusDirection direction;
	} directions[] = {
		{ "left", UI::FOCUS_LEFT },
		{ "right", UI::FOCUS_RIGHT },
		{ "up", UI::FOCUS_UP },
		{ "down", UI::FOCUS_DOWN },
	};
	for (const auto &entry : directions) {
		if (equalsNoCase(str, entry.name)) {
			*direction = entry.direction;
			return true;
		}
	}
	return false;
}

}  // namespace Rotary
