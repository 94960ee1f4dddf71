#include "rect.hpp"
#include <algorithm>

BoundingRect BoundingRect::clip(const BoundingRect& bounds) const {
  BoundingRect r;
  r.top = std::min(std::max(top, bounds.top), bounds.bottom);
  r.bottom = std::max(std::min(bottom, bounds.bottom), bounds.top);
  r.left = std::min(std::max(left, bounds.left), bounds.right);
  r.right = std::max(std::min(right, bounds.right), bounds.left);
  // an inverted input stays inverted after the clamps; collapse it
  if (r.bottom < r.top) r.bottom = r.top;
  if (r.right < r.left) r.right = r.left;
  return r;
}

std::string BoundingRect::to_string() const {
  return "BoundingRect(top=" + std::to_string(top) + ", bottom=" + std::to_string(bottom) +
         ", left=" + std::to_string(left) + ", right=" + std::to_string(right) + ")";
}
