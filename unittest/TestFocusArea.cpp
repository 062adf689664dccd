#include <cstdio>
#include <sstream>
#include <string>

#include "Common/Data/Format/IniFile.h"
#include "Common/Log/LogManager.h"
#include "Common/TimeUtil.h"
#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConstants.h"

#include "unittest/RotaryHarness.h"
#include "unittest/UnitTest.h"

using namespace Rotary;

static UI::ActionBundle NudgeArguments(UI::FocusDirection direction) {
	UI::ActionBundle arguments;
	arguments.PutInt(NUDGE_DIRECTION, direction);
	return arguments;
}

static bool TestDefaultFocusOverridesHistory() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	EXPECT_TRUE(areaA->SetDefaultFocus(a1));
	tw.Layout();

	// a2 gets remembered when focus leaves the area.
	EXPECT_TRUE(RequestFocus(a2));
	EXPECT_TRUE(RequestFocus(b1));
	EXPECT_TRUE(areaA->GetRotaryCache().GetFocusedView(time_now_ms()) == a2);

	areaA->SetDefaultFocusOverridesHistory(true);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == a1);

	EXPECT_TRUE(RequestFocus(a2));
	EXPECT_TRUE(RequestFocus(b1));
	areaA->SetDefaultFocusOverridesHistory(false);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == a2);
	return true;
}

static bool TestHistorySurvivesUnrelatedChanges() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	UI::View *b2 = AddItem(areaB, "b2");
	tw.Layout();
	areaA->SetDefaultFocusOverridesHistory(false);

	EXPECT_TRUE(RequestFocus(a2));
	EXPECT_TRUE(RequestFocus(b1));
	EXPECT_TRUE(RequestFocus(b2));
	EXPECT_TRUE(areaA->GetRotaryCache().GetFocusedView(time_now_ms()) == a2);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == a2);
	return true;
}

static bool TestRemovedViewInHistory() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	tw.Layout();
	areaA->SetDefaultFocusOverridesHistory(false);

	EXPECT_TRUE(RequestFocus(a2));
	EXPECT_TRUE(RequestFocus(b1));
	areaA->RemoveSubview(a2);
	EXPECT_TRUE(areaA->GetRotaryCache().GetFocusedView(time_now_ms()) == nullptr);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == a1);
	return true;
}

static bool TestFocusAreaHistoryIsOneWay() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	AddItem(areaB, "b1");
	tw.Layout();

	const int64_t now = time_now_ms();
	EXPECT_TRUE(RequestFocus(a1));
	UI::ActionBundle right = NudgeArguments(UI::FOCUS_RIGHT);
	EXPECT_TRUE(areaB->PerformAction(UI::ACTION_FOCUS, &right));
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == areaA);
	EXPECT_TRUE(areaB->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, time_now_ms()) == areaA);
	EXPECT_FALSE(areaA->GetRotaryCache().HasFocusAreaEntry(UI::FOCUS_RIGHT));

	// Going back the same way is not recorded, B already knows where left goes.
	UI::ActionBundle left = NudgeArguments(UI::FOCUS_LEFT);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, &left));
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_FALSE(areaA->GetRotaryCache().HasFocusAreaEntry(UI::FOCUS_RIGHT));

	// Nudging back through the history.
	EXPECT_TRUE(areaB->PerformAction(UI::ACTION_FOCUS, &right));
	EXPECT_TRUE(areaB->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &left));
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_FALSE(areaA->GetRotaryCache().HasFocusAreaEntry(UI::FOCUS_RIGHT));
	EXPECT_TRUE(areaB->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, now) == areaA);
	return true;
}

static bool TestPreviousFocusArea() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	UI::View *b2 = AddItem(areaB, "b2");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(RequestFocus(b1));
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == areaA);

	// Moving within B forgets where it came from.
	EXPECT_TRUE(RequestFocus(b2));
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == nullptr);

	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(areaA->GetPreviousFocusArea() == areaB);
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == nullptr);

	// Coming from the parking view there is no previous area.
	EXPECT_TRUE(RequestFocus(b1));
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == areaA);
	EXPECT_TRUE(tw.parkingView->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == tw.parkingView);
	EXPECT_TRUE(areaB->GetPreviousFocusArea() == nullptr);
	EXPECT_TRUE(areaA->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(areaA->GetPreviousFocusArea() == nullptr);
	return true;
}

static bool TestClearHistoryWhenRotating() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	UI::View *b2 = AddItem(areaB, "b2");
	tw.Layout();
	UI::ActionBundle right = NudgeArguments(UI::FOCUS_RIGHT);

	areaB->SetClearFocusAreaHistoryWhenRotating(false);
	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(areaB->PerformAction(UI::ACTION_FOCUS, &right));
	EXPECT_TRUE(tw.Focused() == b1);
	EXPECT_TRUE(RequestFocus(b2));
	EXPECT_TRUE(areaB->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, time_now_ms()) == areaA);

	areaB->SetClearFocusAreaHistoryWhenRotating(true);
	EXPECT_TRUE(RequestFocus(b1));
	EXPECT_TRUE(areaB->GetRotaryCache().GetCachedFocusArea(UI::FOCUS_LEFT, time_now_ms()) == nullptr);
	UI::ActionBundle left = NudgeArguments(UI::FOCUS_LEFT);
	EXPECT_FALSE(areaB->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &left));
	EXPECT_TRUE(tw.Focused() == b1);
	return true;
}

static bool TestNudgeShortcut() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	AddItem(areaA, "a2");
	UI::View *a3 = AddItem(areaA, "a3");
	tw.Layout();

	EXPECT_FALSE(areaA->SetNudgeShortcut(a3, UI::FOCUS_NEXT));
	EXPECT_FALSE(areaA->SetNudgeShortcut(tw.parkingView, UI::FOCUS_DOWN));
	EXPECT_TRUE(areaA->SetNudgeShortcut(a3, UI::FOCUS_DOWN));
	EXPECT_TRUE(RequestFocus(a1));

	UI::ActionBundle up = NudgeArguments(UI::FOCUS_UP);
	UI::ActionBundle down = NudgeArguments(UI::FOCUS_DOWN);
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_SHORTCUT, nullptr));
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_SHORTCUT, &up));
	EXPECT_TRUE(areaA->PerformAction(ACTION_NUDGE_SHORTCUT, &down));
	EXPECT_TRUE(tw.Focused() == a3);
	// Already there, let the nudge go elsewhere.
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_SHORTCUT, &down));

	areaA->ClearNudgeShortcut();
	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_SHORTCUT, &down));
	return true;
}

static bool TestNudgeTargets() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	FocusArea *areaC = tw.AddFocusArea("C");
	UI::View *c1 = AddItem(areaC, "c1");
	tw.Layout();

	UI::ActionBundle right = NudgeArguments(UI::FOCUS_RIGHT);
	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, nullptr));
	EXPECT_FALSE(areaA->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &right));

	areaA->SetNudgeTargetFocusArea(UI::FOCUS_RIGHT, areaC);
	EXPECT_TRUE(areaA->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &right));
	EXPECT_TRUE(tw.Focused() == c1);

	// The specified one can't take focus, so the history is used.
	EXPECT_TRUE(RequestFocus(a1));
	c1->SetEnabled(false);
	areaA->GetRotaryCache().SaveFocusArea(UI::FOCUS_RIGHT, areaB, time_now_ms());
	EXPECT_TRUE(areaA->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &right));
	EXPECT_TRUE(tw.Focused() == b1);

	areaA->SetNudgeTargetFocusArea(UI::FOCUS_RIGHT, nullptr);
	EXPECT_TRUE(areaA->GetNudgeTargetFocusArea(UI::FOCUS_RIGHT) == nullptr);
	return true;
}

static bool TestLoadAttributes() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	FocusArea *areaB = tw.AddFocusArea("B");
	UI::View *b1 = AddItem(areaB, "b1");
	tw.Layout();

	std::istringstream in(
		"[A]\n"
		"DefaultFocus = a2\n"
		"NudgeShortcut = a1\n"
		"NudgeShortcutDirection = up\n"
		"NudgeRight = B\n"
		"NudgeLeft = b1  # not a focus area\n"
		"StartBoundOffset = 10\n"
		"EndBoundOffset = 20\n"
		"VerticalBoundOffset = 5\n"
		"DefaultFocusOverridesHistory = False\n"
		"[MissingDirection]\n"
		"NudgeShortcut = a1\n"
		"[BadDirection]\n"
		"NudgeShortcut = a1\n"
		"NudgeShortcutDirection = diagonal\n"
		"[NotInside]\n"
		"DefaultFocus = b1\n");
	IniFile ini;
	EXPECT_TRUE(ini.Load(in));

	EXPECT_FALSE(areaA->LoadAttributes(*ini.GetSection("MissingDirection")));
	EXPECT_FALSE(areaA->LoadAttributes(*ini.GetSection("BadDirection")));
	EXPECT_FALSE(areaA->LoadAttributes(*ini.GetSection("NotInside")));
	EXPECT_TRUE(areaA->GetNudgeShortcut() == nullptr);
	EXPECT_TRUE(areaA->GetDefaultFocusView() == nullptr);

	EXPECT_TRUE(areaA->LoadAttributes(*ini.GetSection("A")));
	EXPECT_TRUE(areaA->GetDefaultFocusView() == a2);
	EXPECT_TRUE(areaA->GetNudgeShortcut() == a1);
	EXPECT_FALSE(areaA->GetDefaultFocusOverridesHistory());
	EXPECT_EQ_INT(areaA->GetLeftBoundOffset(), 10);
	EXPECT_EQ_INT(areaA->GetRightBoundOffset(), 20);
	EXPECT_EQ_INT(areaA->GetTopBoundOffset(), 5);
	EXPECT_EQ_INT(areaA->GetBottomBoundOffset(), 5);

	// Tags are looked up the first time they're needed.
	EXPECT_TRUE(areaA->GetNudgeTargetFocusArea(UI::FOCUS_RIGHT) == areaB);
	EXPECT_TRUE(areaA->GetNudgeTargetFocusArea(UI::FOCUS_LEFT) == nullptr);
	EXPECT_TRUE(RequestFocus(a1));
	UI::ActionBundle right = NudgeArguments(UI::FOCUS_RIGHT);
	EXPECT_TRUE(areaA->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &right));
	EXPECT_TRUE(tw.Focused() == b1);
	return true;
}

static bool TestBoundsOffsets() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	AddItem(areaA, "a1");
	tw.Layout();

	Section section("A");
	section.Set("StartBoundOffset", 10);
	section.Set("HorizontalBoundOffset", 3);
	section.Set("TopBoundOffset", 7);
	EXPECT_TRUE(areaA->LoadAttributes(section));
	EXPECT_EQ_INT(areaA->GetLeftBoundOffset(), 10);
	EXPECT_EQ_INT(areaA->GetRightBoundOffset(), 3);
	EXPECT_EQ_INT(areaA->GetTopBoundOffset(), 7);
	EXPECT_EQ_INT(areaA->GetBottomBoundOffset(), 0);

	UI::ActionBundle extras;
	areaA->GetExtras(&extras);
	EXPECT_EQ_INT((int)extras.Size(), 4);
	EXPECT_EQ_INT(extras.GetInt(FOCUS_AREA_LEFT_BOUND_OFFSET), 10);
	EXPECT_EQ_INT(extras.GetInt(FOCUS_AREA_RIGHT_BOUND_OFFSET), 3);
	EXPECT_EQ_INT(extras.GetInt(FOCUS_AREA_TOP_BOUND_OFFSET), 7);
	EXPECT_EQ_INT(extras.GetInt(FOCUS_AREA_BOTTOM_BOUND_OFFSET), 0);

	// Flipping the layout direction mirrors left and right.
	tw.root->SetLayoutDirection(UI::LayoutDirection::RTL);
	tw.Layout();
	EXPECT_EQ_INT(areaA->GetLeftBoundOffset(), 3);
	EXPECT_EQ_INT(areaA->GetRightBoundOffset(), 10);
	tw.Layout();
	EXPECT_EQ_INT(areaA->GetLeftBoundOffset(), 3);

	// Loaded under RTL, start is on the right.
	EXPECT_TRUE(areaA->LoadAttributes(section));
	EXPECT_EQ_INT(areaA->GetLeftBoundOffset(), 3);
	EXPECT_EQ_INT(areaA->GetRightBoundOffset(), 10);

	areaA->SetBoundsOffset(1, 2, 3, 4);
	Bounds nudgeBounds = areaA->GetNudgeBounds();
	const Bounds &bounds = areaA->GetBounds();
	EXPECT_TRUE(nudgeBounds == Bounds(bounds.x + 1, bounds.y + 2, bounds.w - 4, bounds.h - 6));
	return true;
}

static bool TestNestedFocusArea() {
	g_logManager.ClearRingbuffer();
	TestWindow tw;
	FocusArea *outer = tw.AddFocusArea("outer");
	FocusArea *inner = outer->Add(new FocusArea());
	inner->SetMeasuredSize(100.0f, 100.0f);
	UI::View *item = AddItem(inner, "item");
	tw.Layout();

	EXPECT_TRUE(inner->IsNested());
	EXPECT_FALSE(outer->IsNested());
	EXPECT_FALSE(inner->PerformAction(UI::ACTION_FOCUS, nullptr));
	UI::ActionBundle down = NudgeArguments(UI::FOCUS_DOWN);
	EXPECT_FALSE(inner->PerformAction(ACTION_NUDGE_SHORTCUT, &down));
	EXPECT_FALSE(inner->PerformAction(ACTION_NUDGE_TO_ANOTHER_FOCUS_AREA, &down));
	EXPECT_TRUE(tw.Focused() == nullptr);

	// The outer one still works.
	EXPECT_TRUE(outer->PerformAction(UI::ACTION_FOCUS, nullptr));
	EXPECT_TRUE(tw.Focused() == item);

	// Reported once, not on every attach.
	outer->RecycleSubview(inner);
	EXPECT_TRUE(outer->ReattachSubview(inner));
	EXPECT_TRUE(inner->IsNested());
	EXPECT_EQ_INT(CountLogMessages("is nested inside another focus area"), 1);
	return true;
}

static bool TestListenerLifetime() {
	TestWindow tw;
	// The parking view listens too.
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 1);
	FocusArea *areaA = tw.AddFocusArea("A");
	FocusArea *areaB = tw.AddFocusArea("B");
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 3);

	tw.root->RecycleSubview(areaA);
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 2);
	EXPECT_TRUE(tw.root->ReattachSubview(areaA));
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 3);

	tw.root->RemoveSubview(areaB);
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 2);
	tw.root->RemoveSubview(areaA);
	EXPECT_EQ_INT((int)tw.window.GetNumFocusChangeListeners(), 1);
	return true;
}

static bool TestRestoreDefaultFocus() {
	TestWindow tw;
	FocusArea *areaA = tw.AddFocusArea("A");
	UI::View *a1 = AddItem(areaA, "a1");
	UI::View *a2 = AddItem(areaA, "a2");
	tw.Layout();

	EXPECT_TRUE(RequestFocus(a1));
	EXPECT_TRUE(areaA->SetDefaultFocus(a2));
	// A regular view is focused, the default focus is stronger.
	EXPECT_TRUE(areaA->RestoreDefaultFocus());
	EXPECT_TRUE(tw.Focused() == a2);
	EXPECT_FALSE(areaA->RestoreDefaultFocus());

	// In touch mode, asking the area for focus just offers it to the children.
	tw.window.ClearFocus();
	tw.parkingView->SetShouldRestoreFocus(false);
	EXPECT_TRUE(tw.parkingView->PerformAction(UI::ACTION_FOCUS, nullptr));
	tw.window.SetTouchMode(true);
	a1->SetFocusableInTouchMode(true);
	EXPECT_TRUE(areaA->SetFocus());
	EXPECT_TRUE(tw.Focused() == a1);
	EXPECT_TRUE(tw.window.IsInTouchMode());
	return true;
}

bool TestFocusArea() {
	RET(TestDefaultFocusOverridesHistory());
	RET(TestHistorySurvivesUnrelatedChanges());
	RET(TestRemovedViewInHistory());
	RET(TestFocusAreaHistoryIsOneWay());
	RET(TestPreviousFocusArea());
	RET(TestClearHistoryWhenRotating());
	RET(TestNudgeShortcut());
	RET(TestNudgeTargets());
	RET(TestLoadAttributes());
	RET(TestBoundsOffsets());
	RET(TestNestedFocusArea());
	RET(TestListenerLifetime());
	RET(TestRestoreDefaultFocus());
	return true;
}
