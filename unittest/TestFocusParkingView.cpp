#include <cstdio>
#include <string>

#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConstants.h"

#include "unittest/RotaryHarness.h"
#include "unittest/UnitTest.h"

using namespace Rotary;

static bool TestParksWhenNothingElse() {
	{
		TestWindow tw;
		tw.Layout();
		EXPECT_TRUE(tw.parkingView->IsFocusableInTouchMode());
		EXPECT_TRUE(tw.parkingView->ShouldRestoreFocus());
		EXPECT_EQ_STR(tw.parkingView->Tag(), std::string("parking"));
		EXPECT_TRUE(tw.parkingView->PerformAction(ACTION_RESTORE_DEFAULT_FOCUS, nullptr));
		EXPECT_TRUE(tw.Focused() == tw.parkingView);
	}

	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	UI::View *disabled = AddItem(area, "disabled");
	disabled->SetEnabled(false);
	AddItem(area, "hidden")->SetVisibility(UI::V_INVISIBLE);
	tw.Layout();

	EXPECT_TRUE(tw.parkingView->PerformAction(ACTION_RESTORE_DEFAULT_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	// Asking again changes nothing, and still succeeds.
	EXPECT_TRUE(tw.parkingView->RestoreFocusInRoot(false));
	EXPECT_TRUE(tw.Focused() == tw.parkingView);

	disabled->SetEnabled(true);
	EXPECT_TRUE(tw.parkingView->PerformAction(ACTION_RESTORE_DEFAULT_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == disabled);
	return true;
}

static bool TestFocusedViewRemoved() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("R1");
	UI::View *e1 = AddItem(area, "E1");
	UI::View *e2 = AddItem(area, "E2");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(e1));
	EXPECT_TRUE(tw.parkingView->GetLastFocusedView() == e1);
	area->RemoveSubview(e1);
	EXPECT_TRUE(tw.Focused() == e2);
	EXPECT_TRUE(tw.parkingView->GetLastFocusedView() == e2);
	return true;
}

static bool TestFocusedViewDisabledOrHidden() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("R1");
	UI::View *e1 = AddItem(area, "E1");
	UI::View *e2 = AddItem(area, "E2");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(e1));
	e1->SetEnabled(false);
	EXPECT_TRUE(tw.Focused() == e2);

	// Nothing left, so focus goes to the parking view rather than nowhere.
	e2->SetVisibility(UI::V_GONE);
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(tw.parkingView->GetLastFocusedView() == nullptr);

	e1->SetEnabled(true);
	EXPECT_TRUE(RequestFocus(e1));
	area->SetVisibility(UI::V_INVISIBLE);
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	return true;
}

static bool TestScrolledOffScreen() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("R1");
	UI::LinearLayout *list = area->Add(new UI::LinearLayout(UI::ORIENT_VERTICAL));
	list->SetFocusable(true);
	list->SetRotaryRole(UI::RotaryRole::VERTICALLY_SCROLLABLE);
	list->SetMeasuredSize(200.0f, 300.0f);
	UI::View *item1 = AddItem(list, "item1");
	UI::View *item2 = AddItem(list, "item2");
	AddItem(area, "below");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(item1));
	list->RecycleSubview(item1);
	EXPECT_TRUE(list->IsRecycled(item1));
	// The list gets focus, so that rotating can scroll it.
	EXPECT_TRUE(tw.Focused() == list);

	// Not scrolled off, just removed for good: the list is left alone.
	EXPECT_TRUE(RequestFocus(item2));
	list->RemoveSubview(item2);
	EXPECT_TRUE(tw.Focused() != list);
	EXPECT_TRUE(tw.Focused() != nullptr);
	return true;
}

static bool TestShouldRestoreFocus() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	UI::View *a1 = AddItem(area, "a1");
	tw.Layout();

	EXPECT_TRUE(tw.parkingView->SetFocus());
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_TRUE(tw.parkingView->RestoreDefaultFocus());
	EXPECT_TRUE(tw.Focused() == a1);

	tw.parkingView->SetShouldRestoreFocus(false);
	EXPECT_FALSE(tw.parkingView->ShouldRestoreFocus());
	EXPECT_TRUE(tw.parkingView->SetFocus());
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(tw.parkingView->RestoreDefaultFocus());
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	return true;
}

static bool TestFocusAction() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	UI::View *a1 = AddItem(area, "a1");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(a1));
	tw.window.SetTouchMode(true);
	EXPECT_TRUE(tw.parkingView->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(tw.window.IsInTouchMode());
	EXPECT_FALSE(tw.parkingView->PerformAction(UI::ACTION_FOCUS, nullptr));

	// No restoring while in touch mode, unless asked to explicitly.
	EXPECT_FALSE(tw.parkingView->RestoreFocusInRoot(true));
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(tw.parkingView->PerformAction(ACTION_RESTORE_DEFAULT_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == a1);
	return true;
}

static bool TestWindowFocus() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	AddItem(area, "a1");
	UI::View *a2 = AddItem(area, "a2");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(a2));
	tw.window.SetWindowFocus(false);
	EXPECT_FALSE(tw.window.HasWindowFocus());
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(tw.parkingView->GetLastFocusedView() == nullptr);

	tw.window.SetWindowFocus(true);
	EXPECT_TRUE(tw.window.HasWindowFocus());
	EXPECT_TRUE(tw.Focused() != tw.parkingView);
	EXPECT_TRUE(area->HasFocus());

	// Touch mode keeps the parking view focused.
	tw.window.SetWindowFocus(false);
	tw.window.SetTouchMode(true);
	tw.window.SetWindowFocus(true);
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	return true;
}

bool TestFocusParkingView() {
	RET(TestParksWhenNothingElse());
	RET(TestFocusedViewRemoved());
	RET(TestFocusedViewDisabledOrHidden());
	RET(TestScrolledOffScreen());
	RET(TestShouldRestoreFocus());
	RET(TestFocusAction());
	RET(TestWindowFocus());
	return true;
}
