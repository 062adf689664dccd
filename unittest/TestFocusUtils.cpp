#include <cstdio>
#include <vector>

#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Rotary/FocusArea.h"
#include "Rotary/FocusParkingView.h"
#include "Rotary/FocusUtils.h"
#include "Rotary/RotaryConstants.h"

#include "unittest/RotaryHarness.h"
#include "unittest/UnitTest.h"

using namespace Rotary;

static bool TestDirections() {
	const UI::FocusDirection cardinal[] = { UI::FOCUS_LEFT, UI::FOCUS_RIGHT, UI::FOCUS_UP, UI::FOCUS_DOWN };
	for (UI::FocusDirection d : cardinal) {
		EXPECT_TRUE(UI::IsCardinal(d));
		EXPECT_TRUE(UI::Opposite(d) != d);
		EXPECT_EQ_INT(UI::Opposite(UI::Opposite(d)), d);
	}
	EXPECT_EQ_INT(UI::Opposite(UI::FOCUS_LEFT), UI::FOCUS_RIGHT);
	EXPECT_EQ_INT(UI::Opposite(UI::FOCUS_UP), UI::FOCUS_DOWN);
	EXPECT_FALSE(UI::IsCardinal(UI::FOCUS_NEXT));
	EXPECT_EQ_INT(UI::Opposite(UI::FOCUS_NEXT), UI::FOCUS_PREV);
	EXPECT_EQ_INT(UI::Opposite(UI::FOCUS_PREV), UI::FOCUS_NEXT);
	EXPECT_FALSE(UI::IsCardinal(UI::FOCUS_PREV));

	UI::FocusDirection direction;
	EXPECT_TRUE(NudgeDirectionFromString("Left", &direction));
	EXPECT_EQ_INT(direction, UI::FOCUS_LEFT);
	EXPECT_FALSE(NudgeDirectionFromString("sideways", &direction));

	UI::ActionBundle arguments;
	EXPECT_FALSE(GetNudgeDirection(&arguments, &direction));
	EXPECT_FALSE(GetNudgeDirection(nullptr, &direction));
	arguments.PutInt(NUDGE_DIRECTION, UI::FOCUS_NEXT);
	EXPECT_FALSE(GetNudgeDirection(&arguments, &direction));
	arguments.PutInt(NUDGE_DIRECTION, UI::FOCUS_DOWN);
	EXPECT_TRUE(GetNudgeDirection(&arguments, &direction));
	EXPECT_EQ_INT(direction, UI::FOCUS_DOWN);
	return true;
}

static bool TestFocusListeners() {
	TestWindow tw;
	UI::View *a = AddItem(tw.root, "a");
	UI::View *b = AddItem(tw.root, "b");
	tw.Layout();

	std::vector<std::pair<UI::View *, UI::View *>> changes;
	int token = tw.window.AddFocusChangeListener([&](UI::View *oldFocus, UI::View *newFocus) {
		// The transfer has already happened.
		if (tw.window.GetFocusedView() == newFocus)
			changes.push_back(std::make_pair(oldFocus, newFocus));
	});

	EXPECT_TRUE(a->SetFocus());
	EXPECT_TRUE(b->SetFocus());
	EXPECT_EQ_INT((int)changes.size(), 2);
	EXPECT_TRUE(changes[0].first == nullptr && changes[0].second == a);
	EXPECT_TRUE(changes[1].first == a && changes[1].second == b);
	EXPECT_TRUE(b->IsFocused());
	EXPECT_TRUE(tw.root->HasFocus());
	EXPECT_TRUE(tw.root->GetFocusedChild() == b);

	tw.window.RemoveFocusChangeListener(token);
	tw.window.RemoveFocusChangeListener(token);
	EXPECT_TRUE(a->SetFocus());
	EXPECT_EQ_INT((int)changes.size(), 2);

	// Not attached, can't be focused.
	UI::View detached;
	EXPECT_FALSE(detached.SetFocus());
	return true;
}

static bool TestViewHandle() {
	UI::View *view = new UI::View();
	UI::ViewHandle handle(view);
	UI::ViewHandle copy = handle;
	EXPECT_TRUE(handle.Get() == view);
	EXPECT_TRUE(copy == handle);
	delete view;
	EXPECT_TRUE(handle.IsNull());
	EXPECT_TRUE(copy.Get() == nullptr);

	UI::ViewHandle empty;
	EXPECT_TRUE(empty.IsNull());
	return true;
}

static bool TestCanTakeFocus() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	UI::LinearLayout *list = area->Add(new UI::LinearLayout(UI::ORIENT_VERTICAL));
	list->SetFocusable(true);
	list->SetRotaryRole(UI::RotaryRole::VERTICALLY_SCROLLABLE);
	list->SetMeasuredSize(200.0f, 300.0f);
	UI::View *item = AddItem(list, "item");
	UI::View *unsized = AddItem(area, "unsized", 0.0f);
	tw.Layout();

	EXPECT_TRUE(CanTakeFocus(item));
	// Has something focusable inside.
	EXPECT_FALSE(CanTakeFocus(list));
	EXPECT_FALSE(CanTakeFocus(tw.parkingView));
	EXPECT_FALSE(CanTakeFocus(unsized));
	EXPECT_FALSE(CanTakeFocus(area));

	EXPECT_TRUE(GetAncestorScrollableContainer(item) == list);
	EXPECT_TRUE(GetAncestorScrollableContainer(list) == nullptr);
	EXPECT_TRUE(GetAncestorFocusArea(item) == area);

	item->SetEnabled(false);
	EXPECT_FALSE(CanTakeFocus(item));
	EXPECT_TRUE(CanTakeFocus(list));
	item->SetEnabled(true);
	list->SetVisibility(UI::V_INVISIBLE);
	EXPECT_FALSE(CanTakeFocus(item));
	return true;
}

static bool TestFocusLevels() {
	TestWindow tw;
	FocusArea *area = tw.AddFocusArea("area");
	UI::View *regular = AddItem(area, "regular");
	UI::LinearLayout *container = area->Add(new UI::LinearLayout(UI::ORIENT_VERTICAL));
	container->SetRotaryRole(UI::RotaryRole::CONTAINER);
	container->SetMeasuredSize(200.0f, 200.0f);
	UI::View *implicitDefault = AddItem(container, "implicit");
	UI::View *defaultFocus = AddItem(area, "default");
	UI::View *byDefault = AddItem(area, "byDefault");
	byDefault->SetFocusedByDefault(true);
	EXPECT_TRUE(area->SetDefaultFocus(defaultFocus));
	tw.Layout();

	EXPECT_EQ_INT(GetFocusLevel(nullptr), NO_FOCUS);
	EXPECT_EQ_INT(GetFocusLevel(tw.parkingView), NO_FOCUS);
	EXPECT_EQ_INT(GetFocusLevel(regular), REGULAR_FOCUS);
	EXPECT_EQ_INT(GetFocusLevel(implicitDefault), IMPLICIT_DEFAULT_FOCUS);
	EXPECT_EQ_INT(GetFocusLevel(defaultFocus), DEFAULT_FOCUS);
	EXPECT_EQ_INT(GetFocusLevel(byDefault), FOCUSED_BY_DEFAULT);

	// Strongest first, and only if stronger than what's focused.
	EXPECT_TRUE(AdjustFocus(tw.root, (UI::View *)nullptr));
	EXPECT_TRUE(tw.Focused() == byDefault);
	EXPECT_FALSE(AdjustFocus(tw.root, byDefault));

	byDefault->SetEnabled(false);
	EXPECT_TRUE(tw.Focused() != byDefault);
	EXPECT_TRUE(AdjustFocus(tw.root, NO_FOCUS));
	EXPECT_TRUE(tw.Focused() == defaultFocus);

	defaultFocus->SetVisibility(UI::V_GONE);
	EXPECT_TRUE(AdjustFocus(tw.root, NO_FOCUS));
	EXPECT_TRUE(tw.Focused() == implicitDefault);

	container->SetVisibility(UI::V_GONE);
	EXPECT_TRUE(AdjustFocus(tw.root, NO_FOCUS));
	EXPECT_TRUE(tw.Focused() == regular);

	std::vector<UI::View *> views;
	CollectFocusableDescendants(area, &views);
	EXPECT_EQ_INT((int)views.size(), 1);
	EXPECT_TRUE(views[0] == regular);
	return true;
}

bool TestFocusUtils() {
	RET(TestDirections());
	RET(TestFocusListeners());
	RET(TestViewHandle());
	RET(TestCanTakeFocus());
	RET(TestFocusLevels());
	return true;
}
