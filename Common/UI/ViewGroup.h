#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Common/Math/geom2d.h"
#include "Common/UI/View.h"

namespace UI {

class ViewGroup : public View {
public:
	ViewGroup();
	~ViewGroup();

	// By default, a container leaves its children where they are and just recurses.
	void Layout() override;

	// Takes ownership! DO NOT add a view to multiple parents!
	template <class T>
	T *Add(T *view) {
		AddView(view);
		return view;
	}

	// Detaches and deletes the view.
	virtual void RemoveSubview(View *view);
	// Detaches the view but keeps it around, still pointing at this group, so that it
	// can be put back with ReattachSubview. Mirrors list item recycling.
	void RecycleSubview(View *view);
	bool ReattachSubview(View *view);
	bool IsRecycled(const View *view) const;

	// Focuses the first child that accepts it, unless the group is focusable itself.
	bool SetFocus() override;
	bool HasFocus() const override;
	// The direct child that is or contains the focused view.
	View *GetFocusedChild() const;
	// The focused view if it's inside this group (or the group itself).
	View *FindFocus() const;

	bool IsViewGroup() const override { return true; }
	bool ContainsSubview(const View *view) const override;
	View *FindViewByTag(std::string_view tag) override;

	View *GetViewByIndex(int index) { return views_[index]; }
	int GetNumSubviews() const { return (int)views_.size(); }
	virtual void Clear();

	std::string DescribeLog() const override { return "ViewGroup: " + View::DescribeLog(); }

	void DispatchAttachedToWindow(Window *window) override;
	void DispatchDetachedFromWindow() override;
	void DispatchWindowFocusChanged(bool hasWindowFocus) override;

protected:
	// Called by SetFocus when the group itself didn't take focus.
	virtual bool RequestFocusInDescendants();

	void AddView(View *view);
	// Common part of Remove/Recycle. Returns false if the view isn't a child.
	bool DetachSubview(View *view, bool keepParent);

	std::vector<View *> views_;
	std::vector<View *> recycled_;
};

// Stacks its visible children along one axis, in order, using their measured sizes.
// The cross axis fills the layout.
class LinearLayout : public ViewGroup {
public:
	LinearLayout(Orientation orientation) : orientation_(orientation) {}

	void Layout() override;
	Orientation GetOrientation() const { return orientation_; }
	std::string DescribeLog() const override { return (orientation_ == ORIENT_HORIZONTAL ? "LinearLayoutHoriz: " : "LinearLayoutVert: ") + View::DescribeLog(); }

protected:
	Orientation orientation_;
};

// Returns how good a candidate destination is when moving from origin in direction.
// Zero means it's not a candidate at all. Higher is better.
float GetDirectionalScore(const Bounds &origin, const Bounds &destination, FocusDirection direction);

}  // namespace UI
