#pragma once

#include <string_view>
#include <vector>

#include <traitstream/core/types.h>
#include <traitstream/decode/trait_record.h>

namespace traitstream::decode {

struct TraitContext {
    std::string_view objectId;
    std::string_view typeTag;
};

using TraitDecodeFn = Result<TraitFields> (*)(const TraitContext&, ByteSpan);

// One entry of the ordered dispatch table. A tag matches when it contains `contains` and none of
// `excludes`. Families sharing a stem list their longer variants first.
struct TraitRule {
    TraitKind kind;
    std::string_view contains;
    std::vector<std::string_view> excludes;
    TraitDecodeFn decode;

    [[nodiscard]] bool matches(std::string_view typeTag) const noexcept;
};

class TraitDispatcher {
public:
    TraitDispatcher();
    explicit TraitDispatcher(std::vector<TraitRule> rules);

    // First rule matching the canonical tag, or nullptr.
    [[nodiscard]] const TraitRule* match(std::string_view typeTag) const noexcept;

    [[nodiscard]] TraitKind classify(std::string_view typeTag) const noexcept;

    // Decode a payload into a record. Never throws: unpack failures are reported through
    // TraitRecord::error with decoded=false, and unknown tags yield decoded=false without error.
    [[nodiscard]] TraitRecord decode(std::string_view objectId, std::string_view typeTag,
                                     ByteSpan raw) const;

    [[nodiscard]] const std::vector<TraitRule>& rules() const noexcept { return rules_; }

    static const std::vector<TraitRule>& default_rules();

private:
    std::vector<TraitRule> rules_;
};

} // namespace traitstream::decode
