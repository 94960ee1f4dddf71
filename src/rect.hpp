#pragma once
/*
 * BoundingRect
 *
 * Purpose: immutable region math used by every paint call.
 * Convention: half-open on bottom/right; (y, x) inside iff top<=y<bottom && left<=x<right.
 */
#include <string>

struct BoundingRect {
  int top = 0;
  int bottom = 0;
  int left = 0;
  int right = 0;

  int width() const { return right - left; }
  int height() const { return bottom - top; }
  bool empty() const { return width() <= 0 || height() <= 0; }
  bool contains(int y, int x) const { return y >= top && y < bottom && x >= left && x < right; }
  BoundingRect offset(int dy, int dx) const { return BoundingRect{top + dy, bottom + dy, left + dx, right + dx}; }
  // Clamps each edge against the opposing extremes of `bounds`. May come out
  // zero-sized, never negative.
  BoundingRect clip(const BoundingRect& bounds) const;
  std::string to_string() const;

  bool operator==(const BoundingRect& o) const {
    return top == o.top && bottom == o.bottom && left == o.left && right == o.right;
  }
};
