#include <gtest/gtest.h>

#include <string>

#include <traitstream/decode/type_url.h>

namespace traitstream::tests::decode {

using traitstream::decode::is_legacy_type_url;
using traitstream::decode::normalize_type_url;

TEST(TypeUrlTest, RewritesLegacyPrefix) {
    EXPECT_EQ(normalize_type_url("type.nestlabs.com/weave.trait.security.BoltLockTrait"),
              "type.googleapis.com/weave.trait.security.BoltLockTrait");
}

TEST(TypeUrlTest, LeavesCanonicalAndForeignTagsAlone) {
    const std::string canonical = "type.googleapis.com/nest.trait.user.UserInfoTrait";
    EXPECT_EQ(normalize_type_url(canonical), canonical);
    EXPECT_EQ(normalize_type_url("example.org/Foo"), "example.org/Foo");
    EXPECT_EQ(normalize_type_url(""), "");
}

TEST(TypeUrlTest, NormalizingIsIdempotent) {
    for (const std::string tag : {"type.nestlabs.com/a.b.CTrait", "type.googleapis.com/a.b.CTrait",
                                  "nestlabs.com/a"}) {
        const auto once = normalize_type_url(tag);
        EXPECT_EQ(normalize_type_url(once), once) << tag;
        EXPECT_FALSE(is_legacy_type_url(once)) << tag;
    }
}

TEST(TypeUrlTest, LegacyPrefixMustBeLeading) {
    EXPECT_TRUE(is_legacy_type_url("type.nestlabs.com/X"));
    EXPECT_FALSE(is_legacy_type_url("foo/type.nestlabs.com/X"));
    EXPECT_EQ(normalize_type_url("foo/type.nestlabs.com/X"), "foo/type.nestlabs.com/X");
}

} // namespace traitstream::tests::decode
