#include "rect.hpp"
#include <cassert>

int main() {
  BoundingRect r{1, 5, 1, 11};
  assert(r.width() == 10);
  assert(r.height() == 4);
  assert(!r.empty());
  assert(r.contains(1, 1));
  assert(r.contains(4, 10));
  assert(!r.contains(5, 1));
  assert(!r.contains(1, 11));

  assert((r.offset(2, 3) == BoundingRect{3, 7, 4, 14}));

  BoundingRect screen{1, 25, 1, 81};
  assert(r.clip(screen) == r);
  assert((BoundingRect{-3, 5, -10, 100}.clip(screen) == BoundingRect{1, 5, 1, 81}));
  assert((BoundingRect{1, 5, 1, 10}.clip(BoundingRect{3, 20, 1, 80}) == BoundingRect{3, 5, 1, 10}));

  // disjoint inputs come out zero-sized, not inverted
  BoundingRect below = BoundingRect{30, 40, 1, 10}.clip(screen);
  assert(below.empty());
  assert(below.height() == 0);
  BoundingRect above = BoundingRect{1, 3, 1, 10}.clip(BoundingRect{5, 10, 1, 80});
  assert(above.empty() && above.height() == 0);
  BoundingRect inverted = BoundingRect{10, 2, 1, 10}.clip(screen);
  assert(inverted.height() == 0 && inverted.width() >= 0);

  // clipping twice changes nothing, and the result stays inside the bounds
  const BoundingRect bounds[] = {screen, BoundingRect{3, 20, 1, 80}, BoundingRect{5, 5, 2, 2}};
  const BoundingRect rects[] = {r, BoundingRect{-3, 5, -10, 100}, BoundingRect{30, 40, 1, 10},
                                BoundingRect{1, 3, 1, 10}, BoundingRect{10, 2, 1, 10},
                                BoundingRect{4, 8, 90, 70}, BoundingRect{}, BoundingRect{-5, -1, -5, -1}};
  for (const BoundingRect& b : bounds) {
    for (const BoundingRect& x : rects) {
      BoundingRect once = x.clip(b);
      assert(once.clip(b) == once);
      assert(once.height() >= 0 && once.width() >= 0);
      assert(once.top >= b.top && once.bottom <= b.bottom);
      assert(once.left >= b.left && once.right <= b.right);
    }
  }

  assert(BoundingRect{}.empty());
  assert(r.to_string() == "BoundingRect(top=1, bottom=5, left=1, right=11)");
  return 0;
}
