#pragma once
#include <atomic>
#include <memory>

// Shared "discard received files" flag. Copies refer to the same cell, so the
// toggle and every capture session observe one value.
class DiscardPolicy {
public:
    explicit DiscardPolicy(bool discard = false)
        : flag_(std::make_shared<std::atomic<bool>>(discard)) {}

    bool discard() const { return flag_->load(std::memory_order_relaxed); }
    void set_discard(bool discard) { flag_->store(discard, std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
