#include "trait_decoders.h"

#include <nest/trait/structure.pb.h>
#include <nest/trait/user.pb.h>

#include <traitstream/schema/schema_registry.h>

#include "field_helpers.h"

namespace traitstream::decode::traits {

using namespace detail;

namespace {

// "structure.<id>" -> "<id>". Anything without a second segment has no structure id.
TraitValue second_segment(const std::string& composite) {
    auto first = composite.find('.');
    if (first == std::string::npos) {
        return std::monostate{};
    }
    auto second = composite.find('.', first + 1);
    auto segment = composite.substr(first + 1, second == std::string::npos
                                                   ? std::string::npos
                                                   : second - first - 1);
    return non_empty(segment);
}

} // namespace

Result<TraitFields> decode_structure_info(const TraitContext&, ByteSpan raw) {
    auto parsed = schema::unpack_trait<nest::trait::structure::StructureInfoTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }
    const auto& t = parsed.value();

    TraitFields f;
    f["legacy_id"] = non_empty(t.legacy_id());
    f["ssid"] = non_empty(t.ssid());
    f["structure_id"] = second_segment(t.legacy_id());
    return f;
}

Result<TraitFields> decode_user_info(const TraitContext& ctx, ByteSpan raw) {
    auto parsed = schema::unpack_trait<nest::trait::user::UserInfoTrait>(raw);
    if (!parsed) {
        return parsed.error();
    }

    TraitFields f;
    f["user_id"] = non_empty(std::string(ctx.objectId));
    return f;
}

} // namespace traitstream::decode::traits
