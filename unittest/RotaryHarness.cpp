#include <cstring>

#include "Common/Log/LogManager.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"

#include "unittest/RotaryHarness.h"

TestWindow::TestWindow(UI::Orientation orientation) {
	root = new UI::LinearLayout(orientation);
	root->SetTag("root");
	window.SetRoot(root);
	parkingView = root->Add(new Rotary::FocusParkingView());
	parkingView->SetTag("parking");
}

Rotary::FocusArea *TestWindow::AddFocusArea(const char *tag, float size) {
	Rotary::FocusArea *focusArea = root->Add(new Rotary::FocusArea(UI::ORIENT_VERTICAL));
	focusArea->SetTag(tag);
	focusArea->SetMeasuredSize(size, size);
	UseNeverExpiringCache(focusArea);
	return focusArea;
}

void TestWindow::Layout() {
	window.Layout(Bounds(0.0f, 0.0f, 1000.0f, 1000.0f));
}

UI::View *AddItem(UI::ViewGroup *parent, const char *tag, float size) {
	UI::View *view = parent->Add(new UI::View());
	view->SetTag(tag);
	view->SetMeasuredSize(size, size);
	return view;
}

void UseNeverExpiringCache(Rotary::FocusArea *focusArea) {
	Rotary::RotaryCache cache;
	Rotary::CachePolicy neverExpire(Rotary::CacheType::NEVER_EXPIRE, 0);
	if (cache.Init(neverExpire, neverExpire))
		focusArea->SetRotaryCache(cache);
}

int CountLogMessages(const char *text) {
	const RingbufferLog *ring = g_logManager.GetRingbuffer();
	int count = 0;
	for (int i = 0; i < ring->GetCount(); i++) {
		if (strstr(ring->TextAt(i), text))
			count++;
	}
	return count;
}
