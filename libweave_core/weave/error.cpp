// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#include "weave/error.hpp"

#include "weave/deep_to_string.hpp"

namespace weave {

namespace {

const std::vector<std::string> empty_context;

} // namespace

// -- constructors, destructors, and assignment operators ----------------------

error::error(const error& x) : data_(x ? new data(*x.data_) : nullptr) {
  // nop
}

error& error::operator=(const error& x) {
  if (this == &x) {
    // nop
  } else if (x) {
    if (data_ == nullptr)
      data_.reset(new data(*x.data_));
    else
      *data_ = *x.data_;
  } else {
    data_.reset();
  }
  return *this;
}

error::error(sec code) : error(code, std::vector<std::string>{}) {
  // nop
}

error::error(sec code, std::vector<std::string> context)
  : data_(code != sec::none ? new data{code, std::move(context)} : nullptr) {
  // nop
}

// -- properties ---------------------------------------------------------------

const std::vector<std::string>& error::context() const noexcept {
  return data_ ? data_->context : empty_context;
}

std::string_view error::what() const noexcept {
  if (data_ == nullptr || data_->context.size() != 1)
    return {};
  return data_->context.front();
}

// -- free functions -----------------------------------------------------------

std::string to_string(const error& x) {
  if (!x)
    return "none";
  auto result = to_string(x.code());
  auto& ctx = x.context();
  if (!ctx.empty()) {
    result += '(';
    result += deep_to_string(ctx.front());
    for (size_t index = 1; index < ctx.size(); ++index) {
      result += ", ";
      result += deep_to_string(ctx[index]);
    }
    result += ')';
  }
  return result;
}

} // namespace weave
