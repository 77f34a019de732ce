#ifndef CACHET_ERROR_H
#define CACHET_ERROR_H

#include <cstddef>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/string_view.h>

namespace cachet {

/// @brief Build the status returned when a configuration is rejected.
/// @param reason Human-readable description of the violated rule.
/// @return An `InvalidArgument` status carrying `reason`.
inline absl::Status make_invalid_config(std::string_view reason)
{
    return absl::InvalidArgumentError(absl::StrCat("invalid cache configuration: ", absl::string_view(reason.data(), reason.size())));
}

/// @brief Build the status returned when an insert is refused for lack of room.
/// @details Only caches running without an eviction policy can refuse an insert.
/// @param max_size The configured capacity that was reached.
/// @return A `ResourceExhausted` status.
inline absl::Status make_capacity_exceeded(size_t max_size)
{
    return absl::ResourceExhaustedError(absl::StrCat("cache capacity exceeded: ", max_size, " entries and no eviction policy"));
}

/// @brief Whether a status reports a rejected configuration.
inline bool is_invalid_config(const absl::Status& status)
{
    return absl::IsInvalidArgument(status);
}

/// @brief Whether a status reports an insert refused for lack of room.
inline bool is_capacity_exceeded(const absl::Status& status)
{
    return absl::IsResourceExhausted(status);
}

}  // namespace cachet

#endif
