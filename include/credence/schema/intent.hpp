#pragma once
#include <credence/schema/primitives.hpp>
#include <credence/schema/scope_type.hpp>

#include <json/value.h>

#include <string>

namespace credence::schema {

template <uint16_t Version>
struct intent_request;

template <>
struct intent_request<1> final {
  std::string schema;
  std::string idempotency_key;
  std::string agent_id;
  std::string scope_type;
  std::string scope_id;
  sats_t max_sats{};
  timestamp_milliseconds_t exp{};
  Json::Value policy_context;
};

using intent_request_t = intent_request<1>;

/// Declared willingness of an agent to spend. Immutable once stored.
template <uint16_t Version>
struct intent;

template <>
struct intent<1> final {
  uint16_t version{1};
  std::string intent_id;
  std::string idempotency_key;
  std::string agent_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  sats_t max_sats{};
  timestamp_milliseconds_t exp{};
  timestamp_milliseconds_t created_at{};
};

using intent_t = intent<1>;

}  // namespace credence::schema
