#include <traitstream/core/protocol_constants.h>
#include <traitstream/decode/type_url.h>

namespace traitstream::decode {

bool is_legacy_type_url(std::string_view typeUrl) noexcept {
    return typeUrl.starts_with(kLegacyTypePrefix);
}

std::string normalize_type_url(std::string_view typeUrl) {
    if (!is_legacy_type_url(typeUrl)) {
        return std::string(typeUrl);
    }
    std::string out;
    out.reserve(kCanonicalTypePrefix.size() + typeUrl.size() - kLegacyTypePrefix.size());
    out.append(kCanonicalTypePrefix);
    out.append(typeUrl.substr(kLegacyTypePrefix.size()));
    return out;
}

} // namespace traitstream::decode
