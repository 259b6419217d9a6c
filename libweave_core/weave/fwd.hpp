// This file is part of Weave, the actor wiring layer. See the file LICENSE in
// the main distribution directory for license terms and copyright.

#pragma once

#include <cstdint>

namespace weave {

// -- classes ------------------------------------------------------------------

class error;
class logger;
class runtime_request_sink;
class server_config;

// -- structs ------------------------------------------------------------------

struct no_config;
struct no_message;

// -- enums --------------------------------------------------------------------

enum class runtime_request : uint8_t;
enum class sec : uint8_t;

// -- templates ----------------------------------------------------------------

template <class>
class dyn_sender;

template <class>
class expected;

template <class>
class logging_receiver;

template <class>
class logging_sender;

template <class>
class sender;

template <class Derived, class Product>
class builder;

template <class Derived, class Product>
class infallible_builder;

template <class M, class Config>
class message_sink;

template <class M, class Config>
class message_source;

template <class Request, class Response, class Config>
class service_consumer;

template <class Request, class Response, class Config>
class service_provider;

template <class In, class Out>
class simple_message_box;

template <class In, class Out>
class simple_message_box_builder;

template <class Request, class Response>
class concurrent_server_message_box;

template <class Request, class Response>
class server_message_box_builder;

} // namespace weave

namespace weave::async {

class consumer;

enum class read_result;

template <class>
class bounded_queue;

template <class>
class queue_receiver;

template <class>
class queue_sender;

} // namespace weave::async
