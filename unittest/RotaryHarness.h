#pragma once

#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"

namespace Rotary {
class FocusArea;
class FocusParkingView;
}

// A window whose root starts with a focus parking view. Whatever the test adds to the root
// afterwards is stacked after it, left to right unless asked otherwise.
class TestWindow {
public:
	TestWindow(UI::Orientation orientation = UI::ORIENT_HORIZONTAL);

	// Added to the root, with caches that never expire so that timing doesn't matter.
	Rotary::FocusArea *AddFocusArea(const char *tag, float size = 200.0f);
	// Needs to be called after adding views, they can't take focus with empty bounds.
	void Layout();

	UI::View *Focused() const { return window.GetFocusedView(); }

	UI::Window window;
	UI::LinearLayout *root;
	Rotary::FocusParkingView *parkingView;
};

// A plain focusable view.
UI::View *AddItem(UI::ViewGroup *parent, const char *tag, float size = 50.0f);

void UseNeverExpiringCache(Rotary::FocusArea *focusArea);

// Counts messages in the log ring buffer containing text.
int CountLogMessages(const char *text);
