// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/test/context.hpp"

namespace weave::test {

block_guard::block_guard(context* ctx, block* blk) noexcept
  : ctx_(ctx), blk_(blk), uncaught_(std::uncaught_exceptions()) {
  // nop
}

block_guard::~block_guard() {
  if (blk_ == nullptr)
    return;
  // Never re-run a block that failed a requirement.
  if (std::uncaught_exceptions() > uncaught_)
    blk_->abort();
  else
    blk_->leave();
  ctx_->pop();
}

context::context(block* root) {
  stack_.push_back(root);
}

std::string context::path() const {
  std::string result;
  for (auto* blk : stack_) {
    if (!result.empty())
      result += " / ";
    result += blk->description();
  }
  return result;
}

block_guard context::enter(std::string_view type, std::string_view description,
                           int line) {
  auto* parent = current();
  auto* child = parent->get_or_add_child(type, description, line);
  if (!parent->try_enter(child))
    return {this, nullptr};
  stack_.push_back(child);
  return {this, child};
}

} // namespace weave::test
