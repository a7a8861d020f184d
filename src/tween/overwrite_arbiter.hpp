/// @file overwrite_arbiter.hpp
/// @brief Hook for resolving conflicts between tweens driving the same property

#pragma once

namespace tweenflow {

class Tweener;

/// Notified when a Tweener starts driving its properties and when it is killed.
/// Conflict resolution policy lives entirely in the implementation.
class OverwriteArbiter {
  public:
    virtual ~OverwriteArbiter() = default;

    virtual void add(Tweener& tweener) = 0;
    virtual void remove(Tweener& tweener) = 0;
};

} // namespace tweenflow
