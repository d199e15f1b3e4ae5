#pragma once

/// @file warden_result.hpp
/// @brief WardenResult<T> type alias for infrastructure-fault reporting.

#include "warden/core/result.hpp"
#include "warden/foundation/warden_error.hpp"

namespace warden::foundation {

/// Result type specialized with WardenError.
///
/// Example:
/// @code
///   WardenResult<std::optional<Account>> findById(AccountId id) const {
///       if (!connected_) {
///           return WardenResult<std::optional<Account>>::err(
///               WardenError(ErrorCode::DirectoryUnavailable, "store offline"));
///       }
///       return WardenResult<std::optional<Account>>::ok(lookup(id));
///   }
/// @endcode
template <typename T>
using WardenResult = warden::Result<T, WardenError>;

}  // namespace warden::foundation
