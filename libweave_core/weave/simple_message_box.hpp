// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include "weave/error.hpp"
#include "weave/logging_receiver.hpp"
#include "weave/logging_sender.hpp"
#include "weave/runtime_request.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace weave {

/// A built message box with one receiving end for messages of type `In` and
/// one sending end for messages of type `Out`.
template <class In, class Out>
class simple_message_box {
public:
  // -- member types -----------------------------------------------------------

  using input_type = In;

  using output_type = Out;

  // -- constructors, destructors, and assignment operators --------------------

  simple_message_box(logging_receiver<In> input, logging_sender<Out> output)
    : input_(std::move(input)), output_(std::move(output)) {
    // nop
  }

  simple_message_box(simple_message_box&&) noexcept = default;

  simple_message_box& operator=(simple_message_box&&) noexcept = default;

  // -- properties -------------------------------------------------------------

  const std::string& name() const noexcept {
    return input_.name();
  }

  bool shutdown_requested() const noexcept {
    return input_.shutdown_requested();
  }

  /// Returns the sending end of this box.
  const logging_sender<Out>& output() const noexcept {
    return output_;
  }

  // -- messaging --------------------------------------------------------------

  /// Sends `msg` to the output route of this box. Always succeeds if the box
  /// has no output route.
  error send(Out msg) {
    return output_.send(std::move(msg));
  }

  /// @copydoc logging_receiver::recv
  std::optional<In> recv() {
    return input_.recv();
  }

  /// @copydoc logging_receiver::recv_for
  template <class Rep, class Period>
  std::optional<In> recv_for(std::chrono::duration<Rep, Period> timeout) {
    return input_.recv_for(timeout);
  }

  /// @copydoc logging_receiver::try_recv
  std::optional<std::variant<In, runtime_request>> try_recv() {
    return input_.try_recv();
  }

  /// @copydoc logging_receiver::recv_signal
  std::optional<runtime_request> recv_signal() {
    return input_.recv_signal();
  }

  // -- interruption -----------------------------------------------------------

  /// @copydoc logging_receiver::interrupter
  auto interrupter() const noexcept {
    return input_.interrupter();
  }

  /// @copydoc logging_receiver::interrupted
  bool interrupted() const {
    return input_.interrupted();
  }

private:
  logging_receiver<In> input_;
  logging_sender<Out> output_;
};

} // namespace weave
