#include <algorithm>

#include "Common/UI/View.h"
#include "Common/UI/ViewGroup.h"
#include "Common/UI/Window.h"
#include "Common/StringUtils.h"
#include "Common/Log.h"

namespace UI {

std::unordered_map<uint32_t, View *> View::liveViews_;
uint32_t View::nextHandleId_ = 1;

const char *FocusDirectionToString(FocusDirection d) {
	switch (d) {
	case FOCUS_UP: return "up";
	case FOCUS_DOWN: return "down";
	case FOCUS_LEFT: return "left";
	case FOCUS_RIGHT: return "right";
	case FOCUS_NEXT: return "next";
	case FOCUS_PREV: return "prev";
	}
	return "(invalid)";
}

ViewHandle::ViewHandle(const View *view) {
	id_ = view ? view->handleId_ : 0;
}

View *ViewHandle::Get() const {
	if (id_ == 0)
		return nullptr;
	auto iter = View::liveViews_.find(id_);
	return iter != View::liveViews_.end() ? iter->second : nullptr;
}

View::View() {
	handleId_ = nextHandleId_++;
	liveViews_[handleId_] = this;
}

View::~View() {
	liveViews_.erase(handleId_);
	if (window_)
		window_->ForgetView(this);
}

std::string View::DescribeLog() const {
	if (!tag_.empty())
		return StringFromFormat("%s %0.1f,%0.1f %0.1fx%0.1f", tag_.c_str(), bounds_.x, bounds_.y, bounds_.w, bounds_.h);
	return StringFromFormat("%0.1f,%0.1f %0.1fx%0.1f", bounds_.x, bounds_.y, bounds_.w, bounds_.h);
}

Point2D FocusPositionOf(const Bounds &bounds, FocusDirection dir) {
	// The +2/-2 is some extra fudge factor to cover for views sitting right next to each other.
	// Distance zero yields strange results otherwise.
	switch (dir) {
	case FOCUS_LEFT: return Point2D(bounds.x + 2, bounds.centerY());
	case FOCUS_RIGHT: return Point2D(bounds.x2() - 2, bounds.centerY());
	case FOCUS_UP: return Point2D(bounds.centerX(), bounds.y + 2);
	case FOCUS_DOWN: return Point2D(bounds.centerX(), bounds.y2() - 2);

	default:
		return bounds.Center();
	}
}

bool View::SetFocus() {
	if (!window_ || !focusable_ || !enabled_ || !IsShown())
		return false;
	if (window_->IsInTouchMode() && !focusableInTouchMode_)
		return false;
	return window_->SetFocusedView(this);
}

bool View::RestoreDefaultFocus() {
	return SetFocus();
}

bool View::PerformAction(int action, const ActionBundle *arguments) {
	switch (action) {
	case ACTION_FOCUS:
		if (HasFocus())
			return false;
		// Focusing by action leaves touch mode, just like a key press would.
		if (window_)
			window_->SetTouchMode(false);
		return SetFocus();
	default:
		return false;
	}
}

bool View::IsFocused() const {
	return window_ && window_->GetFocusedView() == this;
}

bool View::HasFocus() const {
	return IsFocused();
}

void View::SetFocusable(bool focusable) {
	focusable_ = focusable;
	if (!focusable && window_)
		window_->ValidateFocus();
}

void View::SetEnabled(bool enabled) {
	enabled_ = enabled;
	if (!enabled && window_)
		window_->ValidateFocus();
}

void View::SetVisibility(Visibility visibility) {
	visibility_ = visibility;
	if (visibility != V_VISIBLE && window_)
		window_->ValidateFocus();
}

bool View::IsShown() const {
	if (!window_)
		return false;
	for (const View *v = this; v; v = v->parent_) {
		if (v->visibility_ != V_VISIBLE)
			return false;
	}
	return true;
}

bool View::IsLayoutRtl() const {
	for (const View *v = this; v; v = v->parent_) {
		if (v->layoutDirection_ != LayoutDirection::INHERIT)
			return v->layoutDirection_ == LayoutDirection::RTL;
	}
	return false;
}

View *View::GetRootView() {
	View *v = this;
	while (v->parent_)
		v = v->parent_;
	return v;
}

View *View::FindViewByTag(std::string_view tag) {
	if (!tag.empty() && tag_ == tag)
		return this;
	return nullptr;
}

void View::DispatchAttachedToWindow(Window *window) {
	_dbg_assert_(window_ == nullptr);
	window_ = window;
	OnAttachedToWindow();
}

void View::DispatchDetachedFromWindow() {
	OnDetachedFromWindow();
	window_ = nullptr;
}

void View::DispatchWindowFocusChanged(bool hasWindowFocus) {
	WindowFocusChanged(hasWindowFocus);
}

}  // namespace UI
