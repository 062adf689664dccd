#include <cstdio>

#include "Common/UI/View.h"
#include "Rotary/FocusArea.h"
#include "Rotary/RotaryCache.h"

#include "unittest/UnitTest.h"

using namespace Rotary;

static bool TestExpiryBoundary() {
	const int64_t period = 1000;
	const int64_t savedAt = 5000;
	RotaryCache cache;
	CachePolicy expiring(CacheType::EXPIRED_AFTER_SOME_TIME, period);
	EXPECT_TRUE(cache.Init(expiring, expiring));

	UI::View view;
	FocusArea focusArea;
	EXPECT_FALSE(cache.HasFocusedViewEntry());
	cache.SaveFocusedView(&view, savedAt);
	cache.SaveFocusArea(UI::FOCUS_LEFT, &focusArea, savedAt);
	EXPECT_TRUE(cache.HasFocusedViewEntry());

	EXPECT_TRUE(cache.GetFocusedView(savedAt + period - 1) == &view);
	EXPECT_TRUE(cache.GetFocusedView(savedAt + period) == nullptr);
	EXPECT_TRUE(cache.GetFocusedView(savedAt + period + 1) == nullptr);

	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_LEFT, savedAt + period - 1) == &focusArea);
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_LEFT, savedAt + period) == nullptr);
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_LEFT, savedAt + period + 1) == nullptr);
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_RIGHT, savedAt) == nullptr);

	// Expired is not the same as never stored.
	EXPECT_TRUE(cache.HasFocusedViewEntry());
	EXPECT_TRUE(cache.HasFocusAreaEntry(UI::FOCUS_LEFT));
	EXPECT_FALSE(cache.HasFocusAreaEntry(UI::FOCUS_RIGHT));

	// Saving again restarts the period.
	cache.SaveFocusedView(&view, savedAt + 2 * period);
	EXPECT_TRUE(cache.GetFocusedView(savedAt + 3 * period - 1) == &view);
	return true;
}

static bool TestDisabledAndNeverExpire() {
	UI::View view;
	FocusArea focusArea;

	RotaryCache cache;
	EXPECT_TRUE(cache.Init(CachePolicy(CacheType::DISABLED, 0), CachePolicy(CacheType::NEVER_EXPIRE, 0)));
	cache.SaveFocusedView(&view, 0);
	cache.SaveFocusArea(UI::FOCUS_UP, &focusArea, 0);
	EXPECT_TRUE(cache.GetFocusedView(0) == nullptr);
	EXPECT_FALSE(cache.HasFocusedViewEntry());
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_UP, 1000000000LL) == &focusArea);

	cache.ClearFocusAreaHistory();
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_UP, 0) == nullptr);
	EXPECT_FALSE(cache.HasFocusAreaEntry(UI::FOCUS_UP));
	return true;
}

static bool TestInvalidPolicy() {
	UI::View view;
	RotaryCache cache;
	CachePolicy neverExpire(CacheType::NEVER_EXPIRE, 0);
	EXPECT_TRUE(cache.Init(neverExpire, neverExpire));
	cache.SaveFocusedView(&view, 0);

	EXPECT_FALSE(cache.Init(CachePolicy(CacheType::EXPIRED_AFTER_SOME_TIME, 0), neverExpire));
	EXPECT_FALSE(cache.Init(neverExpire, CachePolicy(CacheType::EXPIRED_AFTER_SOME_TIME, -5)));
	// Left alone.
	EXPECT_TRUE(cache.GetFocusHistoryPolicy().type == CacheType::NEVER_EXPIRE);
	EXPECT_TRUE(cache.GetFocusedView(0) == &view);

	CacheType type;
	EXPECT_TRUE(CacheTypeFromInt(2, &type));
	EXPECT_TRUE(type == CacheType::EXPIRED_AFTER_SOME_TIME);
	EXPECT_FALSE(CacheTypeFromInt(0, &type));
	EXPECT_FALSE(CacheTypeFromInt(4, &type));
	return true;
}

static bool TestDestroyedView() {
	RotaryCache cache;
	CachePolicy neverExpire(CacheType::NEVER_EXPIRE, 0);
	EXPECT_TRUE(cache.Init(neverExpire, neverExpire));

	UI::View *view = new UI::View();
	FocusArea *focusArea = new FocusArea();
	cache.SaveFocusedView(view, 0);
	cache.SaveFocusArea(UI::FOCUS_DOWN, focusArea, 0);
	delete view;
	delete focusArea;
	EXPECT_TRUE(cache.GetFocusedView(0) == nullptr);
	EXPECT_TRUE(cache.GetCachedFocusArea(UI::FOCUS_DOWN, 0) == nullptr);

	// A new view never picks up a stale handle.
	UI::View other;
	EXPECT_TRUE(cache.GetFocusedView(0) == nullptr);
	return true;
}

bool TestRotaryCache() {
	RET(TestExpiryBoundary());
	RET(TestDisabledAndNeverExpire());
	RET(TestInvalidPolicy());
	RET(TestDestroyedView());
	return true;
}
