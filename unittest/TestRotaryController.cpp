#include <cstdio>

#include "Common/TimeUtil.h"
#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryController.h"

#include "unittest/RotaryHarness.h"
#include "unittest/UnitTest.h"

using namespace Rotary;

static bool TestNudgeAcrossFocusAreas() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	FocusArea *areaC = tw.AddFocusArea("C");
	UI::View *c1 = AddItem(areaC, "c1");
	tw.Layout();
	RotaryController controller(&tw.window);

	EXPECT_FALSE(controller.Nudge(UI::FOCUS_NEXT));
	EXPECT_TRUE(controller.GetCurrentFocusArea() == nullptr);

	// Nothing focused yet, the first focus area takes it.
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_TRUE(controller.GetCurrentFocusArea() == areaA);

	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == b1);
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == c1);
	EXPECT_FALSE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == c1);
	EXPECT_FALSE(controller.Nudge(UI::FOCUS_UP));

	EXPECT_TRUE(controller.Nudge(UI::FOCUS_LEFT));
	EXPECT_TRUE(tw.Focused() == b1);
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_LEFT));
	EXPECT_TRUE(tw.Focused() == a1);

	// Only the forward moves were recorded, each in the target.
	const int64_t now = time_now_ms();
	EXPECT_TRUE(areaB->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, now) == areaA);
	EXPECT_TRUE(areaC->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, now) == areaB);
	EXPECT_FALSE(areaA->GetRotaryCache().HasFocusAreaEntry(UI::FOCUS_RIGHT));
	EXPECT_FALSE(areaB->GetRotaryCache().HasFocusAreaEntry(UI::FOCUS_RIGHT));
	return true;
}

static bool TestNudgeBackToRememberedFocusArea() {
	// B sits below A and C, closer to C. Going back up from B should still land in A.
	TestWindow tw(UI::ORIENT_VERTICAL);
	EXPECT_EQ_INT(tw.root->GetOrientation(), UI::ORIENT_VERTICAL);
	UI::LinearLayout *top = tw.root->Add(new UI::LinearLayout(UI::ORIENT_HORIZONTAL));
	top->SetMeasuredSize(1000.0f, 200.0f);
	FocusArea *areaA = top->Add(new FocusArea());
	areaA->SetMeasuredSize(400.0f, 200.0f);
	UseNeverExpiringCache(areaA);
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaC = top->Add(new FocusArea());
	areaC->SetMeasuredSize(600.0f, 200.0f);
	UseNeverExpiringCache(areaC);
	AddItem(areaC, "c1");
	FocusArea *areaB = tw.AddFocusArea("B", 200.0f);
	areaB->SetClearFocusAreaHistoryWhenRotating(false);
	AddItem(areaB, "b1");
	UI::View *b2 = AddItem(areaB, "b2");
	tw.Layout();
	RotaryController controller(&tw.window);

	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_DOWN));
	EXPECT_TRUE(controller.GetCurrentFocusArea() == areaB);
	EXPECT_TRUE(RequestFocus(b2));
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_UP));
	EXPECT_TRUE(tw.Focused() == a1);

	// Once the history is gone, geometry decides.
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_DOWN));
	areaB->GetRotaryCache().ClearFocusAreaHistory();
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_UP));
	EXPECT_TRUE(controller.GetCurrentFocusArea() == areaC);
	return true;
}

static bool TestNudgeShortcutThenOtherArea() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	AddItem(areaA, "a2");
	UI::View *a3 = AddItem(areaA, "a3");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	EXPECT_TRUE(areaA->SetNudgeShortcut(a3, UI::FOCUS_RIGHT));
	tw.Layout();
	RotaryController controller(&tw.window);

	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == a3);
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == b1);
	return true;
}

static bool TestBoundsOffsetsAffectNudge() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	AddItem(areaB, "b1");
	FocusArea *areaC = tw.AddFocusArea("C");
	UI::View *c1 = AddItem(areaC, "c1");
	tw.Layout();
	RotaryController controller(&tw.window);

	const Bounds &bounds = areaB->GetBounds();
	areaB->SetBoundsOffset(10, 20, 30, 40);
	EXPECT_TRUE(GetFocusAreaNudgeBounds(areaB) == Bounds(bounds.x + 10, bounds.y + 20, bounds.w - 40, bounds.h - 60));

	// Shrunk to nothing, B is skipped.
	areaB->SetBoundsOffset((int)bounds.w, 0, 0, 0);
	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(controller.Nudge(UI::FOCUS_RIGHT));
	EXPECT_TRUE(tw.Focused() == c1);
	return true;
}

static bool TestRotate() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	UI::View *disabled = AddItem(areaA, "disabled");
	disabled->SetEnabled(false);
	UI::View *a3 = AddItem(areaA, "a3");
	FocusArea *areaB = tw.AddFocusArea("B");
	AddItem(areaB, "b1");
	tw.Layout();
	RotaryController controller(&tw.window);

	EXPECT_FALSE(controller.Rotate(0));
	// Nothing focused, the parking view picks something.
	EXPECT_TRUE(controller.Rotate(1));
	EXPECT_TRUE(tw.Focused() == a1);

	EXPECT_TRUE(controller.Rotate(1));
	EXPECT_TRUE(tw.Focused() == a2);
	EXPECT_TRUE(controller.Rotate(1));
	EXPECT_TRUE(tw.Focused() == a3);
	// No wrapping around, and no leaving the focus area.
	EXPECT_FALSE(controller.Rotate(1));
	EXPECT_TRUE(tw.Focused() == a3);
	EXPECT_TRUE(controller.Rotate(-10));
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_FALSE(controller.Rotate(-1));
	return true;
}

bool TestRotaryController() {
	RET(TestNudgeAcrossFocusAreas());
	RET(TestNudgeBackToRememberedFocusArea());
	RET(TestNudgeShortcutThenOtherArea());
	RET(TestBoundsOffsetsAffectNudge());
	RET(TestRotate());
	return true;
}
