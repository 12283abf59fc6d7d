#pragma once

#include <chrono>

#include "google/protobuf/duration.pb.h"

namespace expiringdict::util {

/*
  Expiry stamps are whole epoch seconds taken from the sqlite clock, so
  lifespans are whole seconds too.
*/
using Lifespan = std::chrono::seconds;

Lifespan FromProto(const google::protobuf::Duration& d);

} // namespace expiringdict::util
