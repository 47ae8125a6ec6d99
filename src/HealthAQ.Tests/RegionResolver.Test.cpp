#include "pch.h"

#include "HealthAQ/errors.h"
#include "HealthAQ/region_resolver.h"

#include <algorithm>

namespace {

haq::RegionResolver create_resolver() {
    return haq::RegionResolver{{"Vietnam", "Thailand", "Germany", "India", "Cambodia"}};
}

} // anonymous namespace

TEST(TestHealthAQ_RegionResolver, NormalizeRegionNames) {
    using namespace haq;

    ASSERT_EQ("Southeast Asia", RegionResolver::normalize("air in south-east asia").value());
    ASSERT_EQ("Southeast Asia", RegionResolver::normalize("Southeast Asian countries").value());
    ASSERT_EQ("South Asia", RegionResolver::normalize("South Asian cities").value());
    ASSERT_EQ("ASEAN", RegionResolver::normalize("rank ASEAN members").value());
    ASSERT_EQ("Europe", RegionResolver::normalize("EU trend").value());
    ASSERT_EQ("South America", RegionResolver::normalize("Latin American air").value());
    ASSERT_EQ("Global", RegionResolver::normalize("worldwide ranking").value());
    ASSERT_FALSE(RegionResolver::normalize("pm2.5 in thailand").has_value());
}

TEST(TestHealthAQ_RegionResolver, ResolveAvailableMembers) {
    auto resolver = create_resolver();

    auto members = resolver.resolve("Southeast Asian");
    ASSERT_EQ(3u, members.size());
    ASSERT_EQ("Cambodia", members[0]);
    ASSERT_EQ("Thailand", members[1]);
    ASSERT_EQ("Vietnam", members[2]);

    ASSERT_EQ(members, resolver.resolve("ASEAN"));
    ASSERT_EQ(std::vector<std::string>{"Germany"}, resolver.resolve("European"));
    ASSERT_EQ(std::vector<std::string>{"India"}, resolver.resolve("South Asia"));
}

TEST(TestHealthAQ_RegionResolver, ResolveGlobalScope) {
    auto resolver = create_resolver();

    ASSERT_EQ(5u, resolver.resolve("Global").size());
    ASSERT_EQ(resolver.available(), resolver.resolve(std::optional<std::string>{}));
    ASSERT_EQ("Cambodia", resolver.available().front());
}

TEST(TestHealthAQ_RegionResolver, ResolveUnknownRegionThrows) {
    auto resolver = create_resolver();

    ASSERT_THROW(resolver.resolve("Atlantis"), haq::UnknownRegionError);
    ASSERT_THROW(resolver.resolve("Antarctica"), haq::UnknownRegionError);
    try {
        resolver.resolve("Atlantis");
        FAIL() << "Expected UnknownRegionError";
    } catch (const haq::UnknownRegionError &ex) {
        ASSERT_EQ(haq::ErrorKind::unknown_region, ex.kind());
        ASSERT_EQ("Atlantis", ex.region());
        ASSERT_EQ(13u, ex.supported().size());
    }
}

TEST(TestHealthAQ_RegionResolver, ResolveRegionWithoutDataThrows) {
    auto resolver = create_resolver();

    ASSERT_THROW(resolver.resolve("African"), haq::UnknownRegionError);
    ASSERT_THROW(resolver.resolve("Caribbean"), haq::UnknownRegionError);
}

TEST(TestHealthAQ_RegionResolver, StaticMemberTable) {
    using namespace haq;

    ASSERT_EQ(11u, RegionResolver::members("ASEAN").size());
    ASSERT_EQ(3u, RegionResolver::members("North America").size());
    ASSERT_THROW(RegionResolver::members("Narnia"), UnknownRegionError);

    auto regions = RegionResolver::supported_regions();
    ASSERT_EQ(13u, regions.size());
    ASSERT_EQ("ASEAN", regions.front());
    ASSERT_TRUE(std::is_sorted(regions.cbegin(), regions.cend()));
}

TEST(TestHealthAQ_RegionResolver, SeasonalRegionLookup) {
    using namespace haq;

    ASSERT_EQ("Southeast Asia", RegionResolver::seasonal_region("Thailand").value());
    ASSERT_EQ("South Asia", RegionResolver::seasonal_region("India").value());
    ASSERT_EQ("East Asia", RegionResolver::seasonal_region("China").value());
    ASSERT_FALSE(RegionResolver::seasonal_region("Germany").has_value());
}
