#include <algorithm>
#include <cmath>

#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Common/Log.h"

namespace UI {

ViewGroup::ViewGroup() {
	// Containers hand focus to their children unless told otherwise.
	SetFocusable(false);
}

ViewGroup::~ViewGroup() {
	// Tear down the view hierarchy.
	Clear();
	for (View *view : recycled_)
		delete view;
	recycled_.clear();
}

void ViewGroup::AddView(View *view) {
	_assert_msg_(view->GetParent() == nullptr, "View %s already has a parent", view->DescribeLog().c_str());
	views_.push_back(view);
	view->SetParent(this);
	if (window_)
		view->DispatchAttachedToWindow(window_);
}

bool ViewGroup::DetachSubview(View *view, bool keepParent) {
	auto iter = std::find(views_.begin(), views_.end(), view);
	if (iter == views_.end()) {
		WARN_LOG(Log::UI, "DetachSubview: %s is not a child of %s", view->DescribeLog().c_str(), DescribeLog().c_str());
		return false;
	}
	views_.erase(iter);
	Window *window = window_;
	if (window)
		view->DispatchDetachedFromWindow();
	if (!keepParent)
		view->SetParent(nullptr);
	// Moves focus on if it was somewhere in the subtree we just took out.
	if (window)
		window->ValidateFocus();
	return true;
}

void ViewGroup::RemoveSubview(View *view) {
	if (DetachSubview(view, false))
		delete view;
}

void ViewGroup::RecycleSubview(View *view) {
	if (DetachSubview(view, true))
		recycled_.push_back(view);
}

bool ViewGroup::ReattachSubview(View *view) {
	auto iter = std::find(recycled_.begin(), recycled_.end(), view);
	if (iter == recycled_.end())
		return false;
	recycled_.erase(iter);
	views_.push_back(view);
	if (window_)
		view->DispatchAttachedToWindow(window_);
	return true;
}

bool ViewGroup::IsRecycled(const View *view) const {
	return std::find(recycled_.begin(), recycled_.end(), view) != recycled_.end();
}

void ViewGroup::Clear() {
	std::vector<View *> views;
	views.swap(views_);
	Window *window = window_;
	for (View *view : views) {
		if (window)
			view->DispatchDetachedFromWindow();
		view->SetParent(nullptr);
	}
	if (window)
		window->ValidateFocus();
	for (View *view : views)
		delete view;
}

void ViewGroup::Layout() {
	for (View *view : views_) {
		if (view->GetVisibility() != V_GONE)
			view->Layout();
	}
}

bool ViewGroup::SetFocus() {
	if (CanBeFocused() && View::SetFocus())
		return true;
	if (!window_ || !IsEnabled() || !IsShown())
		return false;
	return RequestFocusInDescendants();
}

bool ViewGroup::RequestFocusInDescendants() {
	for (size_t i = 0; i < views_.size(); i++) {
		if (views_[i]->SetFocus())
			return true;
	}
	return false;
}

bool ViewGroup::HasFocus() const {
	return FindFocus() != nullptr;
}

View *ViewGroup::GetFocusedChild() const {
	View *focused = window_ ? window_->GetFocusedView() : nullptr;
	if (!focused || focused == this)
		return nullptr;
	for (View *view : views_) {
		if (view == focused || view->ContainsSubview(focused))
			return view;
	}
	return nullptr;
}

View *ViewGroup::FindFocus() const {
	View *focused = window_ ? window_->GetFocusedView() : nullptr;
	if (!focused)
		return nullptr;
	if (focused == this || ContainsSubview(focused))
		return focused;
	return nullptr;
}

bool ViewGroup::ContainsSubview(const View *view) const {
	for (const View *subview : views_) {
		if (subview == view || subview->ContainsSubview(view))
			return true;
	}
	return false;
}

View *ViewGroup::FindViewByTag(std::string_view tag) {
	if (View *found = View::FindViewByTag(tag))
		return found;
	for (View *view : views_) {
		if (View *found = view->FindViewByTag(tag))
			return found;
	}
	return nullptr;
}

void ViewGroup::DispatchAttachedToWindow(Window *window) {
	View::DispatchAttachedToWindow(window);
	for (View *view : views_)
		view->DispatchAttachedToWindow(window);
}

void ViewGroup::DispatchDetachedFromWindow() {
	for (View *view : views_)
		view->DispatchDetachedFromWindow();
	View::DispatchDetachedFromWindow();
}

void ViewGroup::DispatchWindowFocusChanged(bool hasWindowFocus) {
	View::DispatchWindowFocusChanged(hasWindowFocus);
	// Copy, a handler may add or remove views.
	std::vector<View *> views = views_;
	for (View *view : views) {
		if (view->GetParent() == this)
			view->DispatchWindowFocusChanged(hasWindowFocus);
	}
}

void LinearLayout::Layout() {
	const Bounds &bounds = bounds_;
	const bool mirror = orientation_ == ORIENT_HORIZONTAL && IsLayoutRtl();

	float pos = orientation_ == ORIENT_HORIZONTAL ? bounds.x : bounds.y;
	for (size_t i = 0; i < views_.size(); i++) {
		View *view = views_[i];
		if (view->GetVisibility() == V_GONE)
			continue;

		Bounds itemBounds;
		if (orientation_ == ORIENT_HORIZONTAL) {
			itemBounds.x = pos;
			itemBounds.y = bounds.y;
			itemBounds.w = view->GetMeasuredWidth();
			itemBounds.h = bounds.h;
			if (mirror)
				itemBounds.x = bounds.x2() - (pos - bounds.x) - itemBounds.w;
		} else {
			itemBounds.x = bounds.x;
			itemBounds.y = pos;
			itemBounds.w = bounds.w;
			itemBounds.h = view->GetMeasuredHeight();
		}

		view->SetBounds(itemBounds);
		view->Layout();

		pos += (orientation_ == ORIENT_HORIZONTAL ? itemBounds.w : itemBounds.h);
	}
}

// Returns the percentage the smaller one overlaps the bigger one.
static float HorizontalOverlap(const Bounds &a, const Bounds &b) {
	if (a.x2() < b.x || b.x2() < a.x)
		return 0.0f;
	// okay they do overlap. Let's clip.
	float maxMin = std::max(a.x, b.x);
	float minMax = std::min(a.x2(), b.x2());
	float minW = std::min(a.w, b.w);
	float overlap = minMax - maxMin;
	if (overlap < 0.0f || minW <= 0.0f)
		return 0.0f;
	else
		return std::min(1.0f, overlap / minW);
}

// Returns the percentage the smaller one overlaps the bigger one.
static float VerticalOverlap(const Bounds &a, const Bounds &b) {
	if (a.y2() < b.y || b.y2() < a.y)
		return 0.0f;
	float maxMin = std::max(a.y, b.y);
	float minMax = std::min(a.y2(), b.y2());
	float minH = std::min(a.h, b.h);
	float overlap = minMax - maxMin;
	if (overlap < 0.0f || minH <= 0.0f)
		return 0.0f;
	else
		return std::min(1.0f, overlap / minH);
}

float GetDirectionalScore(const Bounds &origin, const Bounds &destination, FocusDirection direction) {
	if (!IsCardinal(direction)) {
		ERROR_LOG(Log::UI, "Invalid focus direction %s", FocusDirectionToString(direction));
		return 0.0f;
	}
	if (destination.Empty())
		return 0.0f;

	Point2D originPos = FocusPositionOf(origin, direction);
	Point2D destPos = FocusPositionOf(destination, Opposite(direction));

	float dx = destPos.x - originPos.x;
	float dy = destPos.y - originPos.y;

	float distance = sqrtf(dx*dx + dy*dy);
	if (distance == 0.0f) {
		distance = 0.001f;
	}
	float overlap = 0.0f;
	float dirX = dx / distance;
	float dirY = dy / distance;

	bool wrongDirection = false;
	float horizOverlap = HorizontalOverlap(origin, destination);
	float vertOverlap = VerticalOverlap(origin, destination);
	if (horizOverlap == 1.0f && vertOverlap == 1.0f) {
		// One contains the other, there's no direction to speak of.
		return 0.0f;
	}
	float originSize = 0.0f;
	switch (direction) {
	case FOCUS_LEFT:
		overlap = vertOverlap;
		originSize = origin.w;
		wrongDirection = dirX > 0.0f;
		break;
	case FOCUS_UP:
		overlap = horizOverlap;
		originSize = origin.h;
		wrongDirection = dirY > 0.0f;
		break;
	case FOCUS_RIGHT:
		overlap = vertOverlap;
		originSize = origin.w;
		wrongDirection = dirX < 0.0f;
		break;
	case FOCUS_DOWN:
		overlap = horizOverlap;
		originSize = origin.h;
		wrongDirection = dirY < 0.0f;
		break;
	default:
		break;
	}

	// At large distances, ignore overlap.
	if (distance > 2.0f * originSize)
		overlap = 0.0f;

	if (wrongDirection) {
		return 0.0f;
	} else {
		return 10.0f / std::max(1.0f, distance) + overlap * 2.0f;
	}
}

}  // namespace UI
