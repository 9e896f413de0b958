#pragma once

#include <optional>
#include <string>

#include <google/protobuf/message.h>

namespace warden::util {

/*
  JSON text <-> protobuf message, used for the events.payload and
  updates.meta columns. Field names keep their proto spelling so the
  stored text reads like the schema.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws std::runtime_error on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

template <typename T>
T ParseJsonOr(const std::optional<std::string>& json) {
  T message;
  if (json && !json->empty()) {
    FromJson(*json, &message);
  }
  return message;
}

} // namespace warden::util
