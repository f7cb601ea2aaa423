#pragma once

#include <string>
#include <string_view>

namespace traitstream::decode {

// Rewrite a legacy "type.nestlabs.com/" prefix to "type.googleapis.com/". Other tags are returned
// unchanged, so normalizing is idempotent.
[[nodiscard]] std::string normalize_type_url(std::string_view typeUrl);

[[nodiscard]] bool is_legacy_type_url(std::string_view typeUrl) noexcept;

} // namespace traitstream::decode
