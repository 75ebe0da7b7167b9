#include "core/pipeline_runner.hpp"
#include "core/shot_list_io.hpp"
#include "fake_generators.hpp"
#include "test_base.hpp"

class PipelineRunnerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.setWorkingDir((workDir() / "run").string());
        config_.setMaxConcurrency(4);
        config_.setLogLevel("WARN");

        shots_ = {makeCameraShot(0, 0), makeChildShot(1, 1, 0, 0, VariationType::LARGE)};
        shots_[1].is_parent_fully_covers_child = false;
        shots_[1].missing_info = "the keeper's lantern";
    }

    std::unique_ptr<PipelineRunner> makeRunner(int max_attempts = 2)
    {
        return std::make_unique<PipelineRunner>(config_, fakes_.suite(max_attempts));
    }

    PipelineConfig config_;
    FakeGenerators fakes_;
    std::vector<Shot> shots_;
};

TEST_F(PipelineRunnerTest, RunCachesTreeAndWritesManifest)
{
    auto runner = makeRunner();
    RunReport report = runner->run(shots_);

    ASSERT_TRUE(report.succeeded());
    CacheStore &cache = runner->cache();
    ASSERT_TRUE(cache.exists(CacheKey::cameraTree()));
    ASSERT_TRUE(cache.exists(CacheKey::runManifest()));

    CameraTree saved = CameraTree::fromJson(cache.loadJson(CacheKey::cameraTree()));
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved.cameras()[1].parent_cam_idx, 0);

    nlohmann::json manifest = cache.loadJson(CacheKey::runManifest());
    EXPECT_TRUE(manifest["succeeded"].get<bool>());
    EXPECT_FALSE(manifest["stopped"].get<bool>());
    EXPECT_EQ(manifest["counts"]["generated"].get<size_t>(), 5u);
    EXPECT_TRUE(manifest["failed_tasks"].empty());

    ASSERT_EQ(manifest["shots"].size(), 2u);
    const auto &shot0 = manifest["shots"][0];
    EXPECT_TRUE(shot0["last_frame"].is_null());
    EXPECT_EQ(shot0["first_frame"]["path"].get<std::string>(), "shots/0/first_frame.png");

    const auto &shot1 = manifest["shots"][1];
    EXPECT_EQ(shot1["camera"].get<int>(), 1);
    EXPECT_EQ(shot1["video"]["path"].get<std::string>(), "shots/1/video.mp4");
    EXPECT_EQ(shot1["last_frame"]["sha256"].get<std::string>(),
              cache.digest(CacheKey::frame(1, ArtifactKind::LAST_FRAME)));
}

TEST_F(PipelineRunnerTest, SecondRunReusesEverything)
{
    makeRunner()->run(shots_);
    size_t calls_after_first = fakes_.log->count();

    RunReport report = makeRunner()->run(shots_);
    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.cached, 5u);
    EXPECT_EQ(report.generated, 0u);
    EXPECT_EQ(fakes_.log->count(), calls_after_first);
}

TEST_F(PipelineRunnerTest, StaleCameraTreeIsRebuilt)
{
    auto runner = makeRunner();
    nlohmann::json stale = nlohmann::json::array();
    stale.push_back({{"idx", 0}, {"active_shot_idxs", {0, 1, 9}}});
    runner->cache().saveJson(CacheKey::cameraTree(), stale);

    CameraTree tree = runner->loadOrBuildCameraTree(shots_);
    EXPECT_EQ(tree.size(), 2u);
    EXPECT_EQ(CameraTree::fromJson(runner->cache().loadJson(CacheKey::cameraTree())).size(), 2u);
}

TEST_F(PipelineRunnerTest, CorruptCameraTreeIsRebuilt)
{
    auto runner = makeRunner();
    writeFile("run/camera_tree.json", "[{\"idx\": 0,");

    CameraTree tree = runner->loadOrBuildCameraTree(shots_);
    EXPECT_EQ(tree.size(), 2u);
    EXPECT_NO_THROW(tree.validate(shots_));
}

TEST_F(PipelineRunnerTest, CachedTreeWinsOverHints)
{
    auto runner = makeRunner();
    // Both shots on one camera; consistent with the shots, so it is reused as-is
    nlohmann::json single = nlohmann::json::array();
    single.push_back({{"idx", 0}, {"active_shot_idxs", {0, 1}}});
    runner->cache().saveJson(CacheKey::cameraTree(), single);

    EXPECT_EQ(runner->loadOrBuildCameraTree(shots_).size(), 1u);
}

TEST_F(PipelineRunnerTest, EmptyShotListIsRejected)
{
    auto runner = makeRunner();
    EXPECT_THROW(runner->run({}), ValidationError);
}

TEST_F(PipelineRunnerTest, RunFromFileLoadsShotList)
{
    nlohmann::json doc;
    doc["shots"] = nlohmann::json::array();
    for (const auto &shot : shots_)
    {
        doc["shots"].push_back(ShotListIO::shotToJson(shot));
    }
    auto path = writeFile("shots.json", doc.dump(2));

    RunReport report = makeRunner()->runFromFile(path.string(), RunTarget::FRAMES);
    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(fakes_.log->countContaining("video motion of shot"), 0u);
    EXPECT_EQ(fakes_.log->countContaining("image shot 1/last_frame"), 1u);
}

TEST_F(PipelineRunnerTest, PlanListsCamerasAndCacheState)
{
    auto runner = makeRunner();
    std::string plan = runner->describePlan(shots_);

    EXPECT_NE(plan.find("camera 0: shots 0\n"), std::string::npos);
    EXPECT_NE(plan.find("camera 1: shots 1 (parent camera 0, shot 0, first_frame)"), std::string::npos);
    EXPECT_NE(plan.find("[pending] shot 1/last_frame <- shot 1/first_frame"), std::string::npos);
    EXPECT_EQ(fakes_.log->count(), 0u);

    runner->run(shots_);
    plan = runner->describePlan(shots_);
    EXPECT_NE(plan.find("[cached]  shot 0/first_frame"), std::string::npos);
    EXPECT_EQ(plan.find("[pending]"), std::string::npos);
}

TEST_F(PipelineRunnerTest, FailedTasksAreListedInManifest)
{
    fakes_.log->setHook([](const std::string &call)
                        {
        if (call == "image shot 1/first_frame")
            throw TransientRemoteError("image service unavailable"); });

    auto runner = makeRunner(2);
    RunReport report = runner->run(shots_);
    EXPECT_FALSE(report.succeeded());

    nlohmann::json manifest = runner->cache().loadJson(CacheKey::runManifest());
    EXPECT_FALSE(manifest["succeeded"].get<bool>());
    EXPECT_EQ(manifest["counts"]["failed"].get<size_t>(), 3u);

    bool saw_root_failure = false;
    for (const auto &failure : manifest["failed_tasks"])
    {
        if (failure["shot"] == 1 && failure["kind"] == "first_frame")
        {
            saw_root_failure = true;
            EXPECT_EQ(failure["error_kind"].get<std::string>(), "TransientRemoteError");
        }
        else
        {
            EXPECT_EQ(failure["error_kind"].get<std::string>(), "DependencyFailedError");
        }
    }
    EXPECT_TRUE(saw_root_failure);

    // Shot 0 is independent of the failure and still complete
    EXPECT_TRUE(manifest["shots"][0]["video"].is_object());
    EXPECT_TRUE(manifest["shots"][1]["video"].is_null());
}

TEST_F(PipelineRunnerTest, DiskFailureIsRecordedInManifest)
{
    fakes_.log->setHook([](const std::string &call)
                        {
        if (call == "image shot 0/first_frame")
            throw FatalIOError("No space left on device"); });

    auto runner = makeRunner();
    RunReport report = runner->run(shots_);

    EXPECT_TRUE(report.fatal);
    EXPECT_EQ(report.generated, 0u);
    nlohmann::json manifest = runner->cache().loadJson(CacheKey::runManifest());
    EXPECT_FALSE(manifest["succeeded"].get<bool>());
    EXPECT_EQ(manifest["fatal_error"].get<std::string>(), "No space left on device");
    EXPECT_EQ(fakes_.log->countContaining("image shot 1"), 0u);
}

TEST_F(PipelineRunnerTest, StopBeforeRunLeavesEverythingNotRun)
{
    auto runner = makeRunner();
    runner->requestStop();
    RunReport report = runner->run(shots_);

    EXPECT_TRUE(report.stopped);
    EXPECT_EQ(report.not_run, 5u);
    EXPECT_EQ(fakes_.log->count(), 0u);
    EXPECT_TRUE(runner->cache().loadJson(CacheKey::runManifest())["stopped"].get<bool>());
}

TEST_F(PipelineRunnerTest, BuildGeneratorsResolvesConfiguredProviders)
{
    GeneratorSuite suite = PipelineRunner::buildGenerators(config_, GeneratorRegistry::withBuiltins());
    EXPECT_NO_THROW(suite.validate());
    EXPECT_EQ(suite.video_guard->serviceName(), "video_generator");

    PipelineConfig unknown = PipelineConfig::fromString("text_generator: {provider: gpt-next}");
    EXPECT_THROW(PipelineRunner::buildGenerators(unknown, GeneratorRegistry::withBuiltins()), ConfigError);
}

TEST_F(PipelineRunnerTest, OfflineProvidersCompleteWholeRun)
{
    GeneratorSuite suite = PipelineRunner::buildGenerators(config_, GeneratorRegistry::withBuiltins());
    PipelineRunner runner(config_, suite);
    RunReport report = runner.run(shots_);

    EXPECT_TRUE(report.succeeded());
    EXPECT_TRUE(runner.cache().exists(CacheKey::newCameraImage(0, 1)));
    EXPECT_TRUE(runner.cache().exists(CacheKey::selectorOutput(1, ArtifactKind::LAST_FRAME)));
}
