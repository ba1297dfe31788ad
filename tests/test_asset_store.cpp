#include <gtest/gtest.h>
#include <stdexcept>

#include "errors.hpp"
#include "network/assetstore.hpp"
#include "test_support.hpp"

using namespace attribution;
using attribution::test::makePoint;
using attribution::test::square;

class InMemoryAssetStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.addZone({"14-14", square(0, 0, 1000)});
        store_.insert(makePoint(1, "Manhole", 100, 100));
        store_.insert(makePoint(2, "Manhole", 200, 200));
        store_.insert(makePoint(3, "Cleanout", 100, 100));
    }

    InMemoryAssetStore store_;
};

TEST_F(InMemoryAssetStoreTest, DuplicateIdsRejected)
{
    EXPECT_THROW(store_.insert(makePoint(1, "Manhole", 0, 0)), std::invalid_argument);
}

TEST_F(InMemoryAssetStoreTest, SelectIsOrderedById)
{
    const auto manholes = store_.select([](const Asset& a) { return a.category == "Manhole"; });
    ASSERT_EQ(manholes.size(), 2u);
    EXPECT_EQ(manholes[0].id, 1u);
    EXPECT_EQ(manholes[1].id, 2u);
    EXPECT_EQ(store_.select({}).size(), 3u);
}

TEST_F(InMemoryAssetStoreTest, PointsAtFiltersByCategory)
{
    EXPECT_EQ(store_.pointsAt({100, 100}, {"Manhole"}, 0.0).size(), 1u);
    EXPECT_EQ(store_.pointsAt({100, 100}, {"Manhole", "Cleanout"}, 0.0).size(), 2u);
    EXPECT_TRUE(store_.pointsAt({100.5, 100}, {"Manhole"}, 0.0).empty());
    EXPECT_EQ(store_.pointsAt({100.5, 100}, {"Manhole"}, 1.0).size(), 1u);
}

TEST_F(InMemoryAssetStoreTest, UpdateFillsFieldsAndStampsEditor)
{
    AssetUpdate u;
    u.id = 1;
    u.spatialId = "0101-00-0000";
    u.facilityId = "1414001";
    u.lastEditor = "ATTRIBUTOR";
    store_.update(u);

    const auto a = store_.find(1);
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->spatialId, std::optional<std::string>("0101-00-0000"));
    EXPECT_EQ(a->facilityId, std::optional<std::string>("1414001"));
    EXPECT_EQ(a->lastEditor, "ATTRIBUTOR");
    EXPECT_EQ(store_.facilityIds({"Manhole"}), (std::vector<std::string>{"1414001"}));
}

TEST_F(InMemoryAssetStoreTest, SetOnceFieldsCannotChange)
{
    AssetUpdate u;
    u.id = 1;
    u.spatialId = "A";
    store_.update(u);

    u.spatialId = "B";
    EXPECT_THROW(store_.update(u), std::logic_error);

    // same value again is a no-op and does not restamp the editor
    u.spatialId = "A";
    u.lastEditor = "SOMEONE";
    store_.update(u);
    EXPECT_EQ(store_.find(1)->lastEditor, "");
}

TEST_F(InMemoryAssetStoreTest, FacilityIdNeedsSpatialId)
{
    AssetUpdate u;
    u.id = 1;
    u.facilityId = "1414001";
    EXPECT_THROW(store_.update(u), std::logic_error);
    EXPECT_FALSE(store_.find(1)->facilityId.has_value());
}

TEST_F(InMemoryAssetStoreTest, DuplicateFacilityIdWithinCategory)
{
    AssetUpdate u;
    u.id = 1;
    u.spatialId = "S1";
    u.facilityId = "1414001";
    store_.update(u);

    AssetUpdate dup;
    dup.id = 2;
    dup.spatialId = "S2";
    dup.facilityId = "1414001";
    try {
        store_.update(dup);
        FAIL() << "expected DuplicateFacilityId";
    } catch (const DuplicateFacilityId& e) {
        EXPECT_EQ(e.facilityId(), "1414001");
    }
    // all-or-nothing: the spatial id of the rejected update was not written
    EXPECT_FALSE(store_.find(2)->spatialId.has_value());

    // another category is another namespace
    AssetUpdate other;
    other.id = 3;
    other.spatialId = "S3";
    other.facilityId = "1414001";
    EXPECT_NO_THROW(store_.update(other));
}

TEST_F(InMemoryAssetStoreTest, SurveyNodesAt)
{
    store_.addSurveyNode({10, {100, 100}, 512.5});
    store_.addSurveyNode({11, {300, 300}, 500.0});
    const auto nodes = store_.surveyNodesAt({100, 100}, 0.0);
    ASSERT_EQ(nodes.size(), 1u);
    EXPECT_EQ(nodes.front().id, 10u);
    EXPECT_THROW(store_.addSurveyNode({10, {0, 0}, 0.0}), std::invalid_argument);
}

TEST_F(InMemoryAssetStoreTest, ZonesContaining)
{
    EXPECT_EQ(store_.zonesContaining({100, 100}), (std::vector<std::string>{"14-14"}));
}
