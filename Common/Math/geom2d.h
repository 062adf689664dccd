#pragma once

struct Point2D {
	Point2D() : x(0.0f), y(0.0f) {}
	Point2D(float x_, float y_) : x(x_), y(y_) {}

	float x;
	float y;
};

// Resolved bounds on screen after layout.
struct Bounds {
	Bounds() : x(0.0f), y(0.0f), w(0.0f), h(0.0f) {}
	Bounds(float x_, float y_, float w_, float h_) : x(x_), y(y_), w(w_), h(h_) {}

	bool Empty() const {
		return w <= 0.0f || h <= 0.0f;
	}

	float x2() const { return x + w; }
	float y2() const { return y + h; }
	float centerX() const { return x + w * 0.5f; }
	float centerY() const { return y + h * 0.5f; }
	Point2D Center() const {
		return Point2D(centerX(), centerY());
	}
	Bounds Inset(float left, float top, float right, float bottom) const {
		return Bounds(x + left, y + top, w - left - right, h - top - bottom);
	}

	bool operator ==(const Bounds &other) const {
		return x == other.x && y == other.y && w == other.w && h == other.h;
	}

	float x;
	float y;
	float w;
	float h;
};
