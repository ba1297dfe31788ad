#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "io/runlock.hpp"
#include "io/storeyaml.hpp"

using namespace attribution;

namespace {

const char* kStore = R"(
zones:
  - { code: "14-14", ring: [[0, 0], [1000, 0], [1000, 1000], [0, 1000]] }
survey_nodes:
  - { id: 900, x: 100.5, y: 100.5, z: 612.25 }
assets:
  - id: 1
    category: Manhole
    geometry: [[100.5, 100.5]]
    owner: 1
    water_type: SS
    stage: 0
    last_editor: ""
  - id: 3
    category: GravityMain
    geometry: [[100.5, 100.5], [200, 200]]
    owner: 1
    water_type: SS
    stage: 0
    last_editor: ATTRIBUTOR
    spatial_start: "0100-00-0000"
    from_mh: "1414001"
)";

} // namespace

class StoreYamlTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("attribution_store_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::filesystem::create_directories(dir_);
        path_ = (dir_ / "store.yml").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::string           path_;
};

TEST_F(StoreYamlTest, ReadsAllSections)
{
    const InMemoryAssetStore store = readStore(YAML::Load(kStore));
    EXPECT_EQ(store.zones().size(), 1u);
    EXPECT_EQ(store.surveyNodes().size(), 1u);
    ASSERT_EQ(store.assets().size(), 2u);

    const Asset& mh = store.assets().at(1);
    EXPECT_EQ(mh.category, "Manhole");
    EXPECT_EQ(mh.geometry.vertices.size(), 1u);
    EXPECT_EQ(mh.waterType, "SS");
    EXPECT_FALSE(mh.spatialId.has_value());

    const Asset& main = store.assets().at(3);
    EXPECT_EQ(main.geometry.vertices.size(), 2u);
    EXPECT_EQ(main.spatialStart, std::optional<std::string>("0100-00-0000"));
    EXPECT_EQ(main.endpointFrom, std::optional<std::string>("1414001"));
    EXPECT_FALSE(main.endpointTo.has_value());
}

TEST_F(StoreYamlTest, SaveAndLoadKeepDerivedFields)
{
    InMemoryAssetStore store = readStore(YAML::Load(kStore));
    AssetUpdate u;
    u.id = 1;
    u.point = cv::Point2d(100.5, 100.5);
    u.spatialId = "0100-00-0000";
    u.facilityId = "1414001";
    u.elevation = 612.25;
    u.lastEditor = "ATTRIBUTOR";
    store.update(u);

    saveStore(store, path_);
    EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp"));

    const InMemoryAssetStore loaded = loadStore(path_);
    const Asset& mh = loaded.assets().at(1);
    EXPECT_EQ(mh.facilityId, std::optional<std::string>("1414001"));
    EXPECT_EQ(mh.spatialId, std::optional<std::string>("0100-00-0000"));
    EXPECT_EQ(mh.elevation, std::optional<double>(612.25));
    ASSERT_TRUE(mh.point.has_value());
    EXPECT_DOUBLE_EQ(mh.point->x, 100.5);
    EXPECT_EQ(mh.lastEditor, "ATTRIBUTOR");
    EXPECT_EQ(loaded.zones().front().code, "14-14");
    EXPECT_EQ(loaded.facilityIds({"Manhole"}), (std::vector<std::string>{"1414001"}));
}

TEST_F(StoreYamlTest, BrokenFilesAreStoreUnavailable)
{
    EXPECT_THROW(loadStore((dir_ / "missing.yml").string()), StoreUnavailable);

    {
        std::ofstream f(path_);
        f << "assets:\n  - { id: 1, category: Manhole }\n  - { id: 1, category: Manhole }\n";
    }
    EXPECT_THROW(loadStore(path_), StoreUnavailable);

    EXPECT_THROW(readStore(YAML::Load("zones:\n  - { code: A, ring: [[0, 0], [1, 1]] }\n")),
                 StoreUnavailable);
    EXPECT_THROW(readStore(YAML::Load("assets:\n  - { id: 1, category: Manhole, geometry: [[1, 2, 3]] }\n")),
                 StoreUnavailable);
    EXPECT_THROW(readStore(YAML::Load("[1, 2]")), StoreUnavailable);
}

TEST_F(StoreYamlTest, RunLockIsExclusive)
{
    const std::string lockPath = path_ + ".lock";
    RunLock first(lockPath);
    ASSERT_TRUE(first.tryLock());

    // flock locks belong to the open file description, so a second open conflicts
    RunLock second(lockPath);
    EXPECT_FALSE(second.tryLock());

    first.unlock();
    EXPECT_TRUE(second.tryLock());
    EXPECT_TRUE(second.locked());
}

TEST_F(StoreYamlTest, RunLockReleasesAfterLoggerIsReplaced)
{
    const std::string lockPath = path_ + ".lock";
    {
        RunLock held(lockPath);
        ASSERT_TRUE(held.tryLock());

        LoggingConfig quiet;
        quiet.level = "error";
        logging::init(quiet);
    }

    RunLock next(lockPath);
    EXPECT_TRUE(next.tryLock());
}
