#include <algorithm>

#include "Common/UI/Window.h"
#include "Common/UI/ViewGroup.h"
#include "Common/Log.h"

namespace UI {

Window::Window() {}

Window::~Window() {
	listeners_.clear();
	focused_ = nullptr;
	if (root_) {
		root_->DispatchDetachedFromWindow();
		delete root_;
		root_ = nullptr;
	}
}

void Window::SetRoot(ViewGroup *root) {
	if (root_) {
		if (focused_) {
			View *oldFocus = focused_;
			focused_ = nullptr;
			oldFocus->FocusChanged(FF_LOSTFOCUS);
			NotifyFocusChanged(oldFocus, nullptr);
		}
		root_->DispatchDetachedFromWindow();
		delete root_;
	}
	root_ = root;
	if (root_) {
		_assert_msg_(root_->GetParent() == nullptr, "The root of a window can't have a parent");
		root_->DispatchAttachedToWindow(this);
	}
}

void Window::Layout(const Bounds &bounds) {
	if (!root_)
		return;
	root_->SetBounds(bounds);
	root_->Layout();
}

bool Window::SetFocusedView(View *view) {
	if (!view || view->GetWindow() != this) {
		ERROR_LOG(Log::UI, "SetFocusedView: %s is not attached to this window", view ? view->DescribeLog().c_str() : "(null)");
		return false;
	}
	if (view == focused_)
		return true;

	View *oldFocus = focused_;
	focused_ = view;
	if (oldFocus)
		oldFocus->FocusChanged(FF_LOSTFOCUS);
	view->FocusChanged(FF_GOTFOCUS);
	DEBUG_LOG(Log::UI, "Focus: %s -> %s", oldFocus ? oldFocus->DescribeLog().c_str() : "(none)", view->DescribeLog().c_str());
	NotifyFocusChanged(oldFocus, view);
	return true;
}

void Window::ClearFocus() {
	if (focused_)
		DropFocus();
}

void Window::ValidateFocus() {
	if (!focused_)
		return;
	if (focused_->IsAttachedToWindow() && focused_->CanBeFocused() && focused_->IsEnabled() && focused_->IsShown())
		return;
	DropFocus();
}

void Window::DropFocus() {
	View *lost = focused_;
	focused_ = nullptr;
	lost->FocusChanged(FF_LOSTFOCUS);
	// Give the tree a chance to pick something else first. Listeners only get to see
	// the cleared state if nothing took focus.
	if (!root_ || !root_->SetFocus())
		NotifyFocusChanged(lost, nullptr);
}

void Window::ForgetView(View *view) {
	if (focused_ == view)
		focused_ = nullptr;
}

void Window::SetWindowFocus(bool hasWindowFocus) {
	if (hasWindowFocus_ == hasWindowFocus)
		return;
	hasWindowFocus_ = hasWindowFocus;
	if (root_)
		root_->DispatchWindowFocusChanged(hasWindowFocus);
}

int Window::AddFocusChangeListener(FocusChangeListener listener) {
	int token = nextListenerToken_++;
	listeners_.push_back(ListenerEntry{ token, listener });
	return token;
}

void Window::RemoveFocusChangeListener(int token) {
	for (auto iter = listeners_.begin(); iter != listeners_.end(); ++iter) {
		if (iter->token == token) {
			listeners_.erase(iter);
			return;
		}
	}
}

void Window::NotifyFocusChanged(View *oldFocus, View *newFocus) {
	// Listeners may add or remove listeners, so work on a copy and skip any that went away.
	std::vector<ListenerEntry> listeners = listeners_;
	for (const ListenerEntry &entry : listeners) {
		auto stillThere = std::find_if(listeners_.begin(), listeners_.end(), [&](const ListenerEntry &e) {
			return e.token == entry.token;
		});
		if (stillThere != listeners_.end())
			entry.listener(oldFocus, newFocus);
	}
}

}  // namespace UI
