#pragma once

// Minimal retained view tree for focus navigation.

// Works very similarly to Android: views are attached to a Window, exactly one view in the
// window holds focus, and interested parties can listen to global focus changes.
// There's no drawing here, layouts simply hand out bounds.

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Common/Math/geom2d.h"
#include "Common/Common.h"
#include "Common/Log.h"

// I don't generally like namespaces but I think we do need one for UI, so many potentially-clashing names.
namespace UI {

class View;
class ViewGroup;
class Window;

enum Visibility {
	V_VISIBLE,
	V_INVISIBLE,  // Keeps position, but can't be interacted with
	V_GONE,  // Does not participate in layout
};

enum FocusDirection {
	FOCUS_UP,
	FOCUS_DOWN,
	FOCUS_LEFT,
	FOCUS_RIGHT,
	FOCUS_NEXT,
	FOCUS_PREV,
};

inline FocusDirection Opposite(FocusDirection d) {
	switch (d) {
	case FOCUS_UP: return FOCUS_DOWN;
	case FOCUS_DOWN: return FOCUS_UP;
	case FOCUS_LEFT: return FOCUS_RIGHT;
	case FOCUS_RIGHT: return FOCUS_LEFT;
	case FOCUS_PREV: return FOCUS_NEXT;
	case FOCUS_NEXT: return FOCUS_PREV;
	}
	_dbg_assert_msg_(false, "Bad focus direction %d", (int)d);
	return d;
}

// Only these take part in nudging between focus areas.
inline bool IsCardinal(FocusDirection d) {
	return d == FOCUS_UP || d == FOCUS_DOWN || d == FOCUS_LEFT || d == FOCUS_RIGHT;
}

const char *FocusDirectionToString(FocusDirection d);

// Point on the edge of bounds that faces dir.
Point2D FocusPositionOf(const Bounds &bounds, FocusDirection dir);

enum Orientation {
	ORIENT_HORIZONTAL,
	ORIENT_VERTICAL,
};

enum class LayoutDirection {
	INHERIT,
	LTR,
	RTL,
};

// How a container behaves under the rotary controller. Scrollable containers are
// only focused when nothing else can be.
enum class RotaryRole {
	NONE,
	CONTAINER,
	VERTICALLY_SCROLLABLE,
	HORIZONTALLY_SCROLLABLE,
	FOCUS_DELEGATING_CONTAINER,
};

enum FocusFlags {
	FF_LOSTFOCUS = 1,
	FF_GOTFOCUS = 2
};

// Generic actions any view understands. Rotary specific ones live in Rotary/RotaryConstants.h.
enum : int {
	ACTION_FOCUS = 0x00000001,
};

// Small key/int map passed along with actions, also used to publish extras.
class ActionBundle {
public:
	void PutInt(std::string_view key, int value) {
		values_[std::string(key)] = value;
	}
	int GetInt(std::string_view key, int defaultValue = 0) const {
		auto iter = values_.find(key);
		return iter != values_.end() ? iter->second : defaultValue;
	}
	bool Contains(std::string_view key) const {
		return values_.find(key) != values_.end();
	}
	size_t Size() const { return values_.size(); }
	void Clear() { values_.clear(); }

private:
	std::map<std::string, int, std::less<>> values_;
};

// Weak reference to a view. Goes null when the view is destroyed, so it is safe to
// keep one around in long lived caches.
class ViewHandle {
public:
	ViewHandle() {}
	ViewHandle(const View *view);

	View *Get() const;
	void Reset() { id_ = 0; }
	bool IsNull() const { return Get() == nullptr; }

	bool operator ==(const ViewHandle &other) const { return id_ == other.id_; }
	bool operator !=(const ViewHandle &other) const { return id_ != other.id_; }

private:
	uint32_t id_ = 0;
};

class View {
public:
	View();
	virtual ~View();

	virtual std::string DescribeLog() const;

	virtual void FocusChanged(int focusFlags) {}
	virtual void WindowFocusChanged(bool hasWindowFocus) {}

	// Containers position their children here.
	virtual void Layout() {}

	// Called when the layout is done.
	void SetBounds(Bounds bounds) { bounds_ = bounds; }
	const Bounds &GetBounds() const { return bounds_; }

	// Preferred size, used by the stacking layouts.
	void SetMeasuredSize(float w, float h) {
		measuredWidth_ = w;
		measuredHeight_ = h;
	}
	float GetMeasuredWidth() const { return measuredWidth_; }
	float GetMeasuredHeight() const { return measuredHeight_; }

	// Asks the window to focus this view. Fails if the view can't currently hold focus.
	virtual bool SetFocus();
	// Re-establish a sensible focus inside this view. By default that's just SetFocus.
	virtual bool RestoreDefaultFocus();
	// Returns true if the action was handled.
	virtual bool PerformAction(int action, const ActionBundle *arguments);

	// True if this exact view is focused.
	bool IsFocused() const;
	// True if this view or something inside it is focused.
	virtual bool HasFocus() const;

	bool CanBeFocused() const { return focusable_; }
	void SetFocusable(bool focusable);
	bool IsFocusableInTouchMode() const { return focusableInTouchMode_; }
	void SetFocusableInTouchMode(bool focusable) { focusableInTouchMode_ = focusable; }

	bool IsFocusedByDefault() const { return focusedByDefault_; }
	void SetFocusedByDefault(bool focusedByDefault) { focusedByDefault_ = focusedByDefault; }

	RotaryRole GetRotaryRole() const { return rotaryRole_; }
	void SetRotaryRole(RotaryRole role) { rotaryRole_ = role; }

	void SetEnabled(bool enabled);
	bool IsEnabled() const { return enabled_; }

	void SetVisibility(Visibility visibility);
	Visibility GetVisibility() const { return visibility_; }
	// Attached, and this view and all its ancestors are visible.
	bool IsShown() const;

	void SetLayoutDirection(LayoutDirection direction) { layoutDirection_ = direction; }
	// Resolves INHERIT through the parents, LTR at the root.
	bool IsLayoutRtl() const;

	const std::string &Tag() const { return tag_; }
	void SetTag(std::string_view str) { tag_ = str; }

	ViewGroup *GetParent() const { return parent_; }
	Window *GetWindow() const { return window_; }
	bool IsAttachedToWindow() const { return window_ != nullptr; }
	// Topmost ancestor, or this view itself if it has no parent.
	View *GetRootView();

	// Fake RTTI
	virtual bool IsViewGroup() const { return false; }
	virtual bool IsFocusArea() const { return false; }
	virtual bool IsFocusParkingView() const { return false; }
	virtual bool ContainsSubview(const View *view) const { return false; }

	virtual View *FindViewByTag(std::string_view tag);

	// Extra information published to whoever drives navigation (a focus area publishes its bounds offsets).
	virtual void GetExtras(ActionBundle *extras) const {}

	// Only called by the owning ViewGroup and the Window.
	virtual void DispatchAttachedToWindow(Window *window);
	virtual void DispatchDetachedFromWindow();
	virtual void DispatchWindowFocusChanged(bool hasWindowFocus);
	void SetParent(ViewGroup *parent) { parent_ = parent; }

protected:
	virtual void OnAttachedToWindow() {}
	virtual void OnDetachedFromWindow() {}

	std::string tag_;
	Visibility visibility_ = V_VISIBLE;
	LayoutDirection layoutDirection_ = LayoutDirection::INHERIT;

	float measuredWidth_ = 0.0f;
	float measuredHeight_ = 0.0f;

	// Outputs of layout. X/Y are absolute screen coordinates.
	Bounds bounds_{};

	ViewGroup *parent_ = nullptr;
	Window *window_ = nullptr;

private:
	friend class ViewHandle;

	bool focusable_ = true;
	bool focusableInTouchMode_ = false;
	bool focusedByDefault_ = false;
	bool enabled_ = true;
	RotaryRole rotaryRole_ = RotaryRole::NONE;

	uint32_t handleId_;

	static std::unordered_map<uint32_t, View *> liveViews_;
	static uint32_t nextHandleId_;

	DISALLOW_COPY_AND_ASSIGN(View);
};

}  // namespace UI
