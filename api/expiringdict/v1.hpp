#pragma once

#include "internal/core/connection.hpp"
#include "internal/core/options.hpp"
#include "internal/core/session.hpp"
#include "internal/serializer/codecs.hpp"
#include "internal/serializer/compressed_serializer.hpp"
#include "internal/serializer/value.hpp"
#include "internal/util/errors.hpp"

namespace expiringdict::v1 {
using ::expiringdict::core::Connection;
using ::expiringdict::core::Order;
using ::expiringdict::core::Scope;
using ::expiringdict::core::Session;
using ::expiringdict::core::SessionOptions;
using ::expiringdict::db::sqlite::TransactionMode;
using namespace ::expiringdict::serializer;
using namespace ::expiringdict::util;
}
