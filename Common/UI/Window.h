#pragma once

#include <functional>
#include <vector>

#include "Common/Math/geom2d.h"
#include "Common/UI/View.h"

namespace UI {

class ViewGroup;

typedef std::function<void(View *oldFocus, View *newFocus)> FocusChangeListener;

// Owns a view tree and tracks which view in it has focus. There's at most one focused
// view per window. Also keeps the touch mode and window focus state that views consult.
class Window {
public:
	Window();
	~Window();

	// Takes ownership of the root, deleting any previous one.
	void SetRoot(ViewGroup *root);
	ViewGroup *GetRoot() const { return root_; }

	// Lays out the whole tree inside bounds.
	void Layout(const Bounds &bounds);

	View *GetFocusedView() const { return focused_; }
	// Moves focus to view, which must be attached to this window. Notifies listeners.
	bool SetFocusedView(View *view);
	// Drops focus from the focused view and lets the root pick a new one.
	void ClearFocus();
	// Call when something happened that might stop the focused view from holding focus
	// (removed, disabled, hidden). Moves focus elsewhere if needed.
	void ValidateFocus();
	// A view is being destroyed. No notifications, it's too late for that.
	void ForgetView(View *view);

	bool IsInTouchMode() const { return touchMode_; }
	void SetTouchMode(bool touchMode) { touchMode_ = touchMode; }

	bool HasWindowFocus() const { return hasWindowFocus_; }
	// Dispatched to every view in the tree.
	void SetWindowFocus(bool hasWindowFocus);

	// Returns a token for removal. Listeners are called in registration order.
	int AddFocusChangeListener(FocusChangeListener listener);
	// Unknown tokens are ignored.
	void RemoveFocusChangeListener(int token);
	size_t GetNumFocusChangeListeners() const { return listeners_.size(); }

private:
	struct ListenerEntry {
		int token;
		FocusChangeListener listener;
	};

	void NotifyFocusChanged(View *oldFocus, View *newFocus);
	void DropFocus();

	ViewGroup *root_ = nullptr;
	View *focused_ = nullptr;
	bool touchMode_ = false;
	bool hasWindowFocus_ = true;

	std::vector<ListenerEntry> listeners_;
	int nextListenerToken_ = 1;

	DISALLOW_COPY_AND_ASSIGN(Window);
};

}  // namespace UI
