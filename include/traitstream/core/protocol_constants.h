#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace traitstream {

// Type URL prefixes carried in trait payloads
inline constexpr std::string_view kLegacyTypePrefix = "type.nestlabs.com/";
inline constexpr std::string_view kCanonicalTypePrefix = "type.googleapis.com/";

// Trait assumed for untyped get operations that carry the legacy field-7 slot
inline constexpr std::string_view kPrimaryLockTraitType = "weave.trait.security.BoltLockTrait";
inline constexpr int kUntypedLockStateField = 7;

// Length prefix framing
inline constexpr std::size_t kMaxVarintBytes = 10;
inline constexpr std::size_t kMinPrefixBytes = 5;
inline constexpr std::size_t kDefaultCatalogThreshold = 20000;       // 20KB
inline constexpr std::size_t kDefaultMaxBufferBytes = 4 * 1024 * 1024; // 4MB

// Session timing
inline constexpr auto kDefaultRetryDelay = std::chrono::milliseconds(10000);
inline constexpr auto kDefaultStreamTimeout = std::chrono::milliseconds(600000); // 10min
inline constexpr auto kDefaultKeepaliveInterval = std::chrono::milliseconds(60);

// Observe request
inline constexpr unsigned kObserveProtocolVersion = 2;
inline constexpr std::string_view kDefaultUserAgent =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/120.0.0.0 Safari/537.36";
inline constexpr std::string_view kDefaultGrpcBase = "https://grpc-web.production.nest.com";
inline constexpr std::string_view kObserveEndpoint = "/nestlabs.gateway.v2.GatewayService/Observe";

} // namespace traitstream
