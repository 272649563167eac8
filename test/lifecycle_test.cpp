#include <gtest/gtest.h>
#include "shikaku/service/lifecycle.hpp"
#include "shikaku/utils/errors.hpp"
#include "test_utils.hpp"
#include <cstdlib>

using namespace shikaku;

namespace {

// A dataset tree with three breeds, sorted gir < holstein < sahiwal, and the
// color classifier that maps red, green and blue onto them in that order.
struct ServiceFixture {
    test::TempDir dir;
    ShikakuConfig config;

    explicit ServiceFixture(size_t num_classes = 3) {
        std::string model_dir = dir.make_dir("model");
        test::save_model(test::make_mean_color_classifier(test::color_weights(), 3), model_dir,
                         "cattle_classifier");

        const char* breeds[] = {"sahiwal", "gir", "holstein", "jersey"};
        for (size_t i = 0; i < num_classes; ++i) {
            dir.make_dir(std::string("dataset/train/") + breeds[i]);
        }

        config.model_dir = model_dir;
        config.model_xml = "cattle_classifier.xml";
        config.dataset_dir = dir.str() + "/dataset/train";
    }
};

} // namespace

TEST(LifecycleTest, StartsUninitialized) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    EXPECT_EQ(lifecycle.state(), ServiceState::Uninitialized);
    EXPECT_EQ(lifecycle.num_classes(), 0u);
    EXPECT_FALSE(lifecycle.context());
    EXPECT_THROW(lifecycle.predict(test::red_png()), ModelNotLoaded);
}

TEST(LifecycleTest, SuccessfulStartIsReady) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    ASSERT_TRUE(lifecycle.start());

    EXPECT_EQ(lifecycle.state(), ServiceState::Ready);
    EXPECT_EQ(lifecycle.num_classes(), 3u);
    EXPECT_EQ(lifecycle.class_names(), (LabelSet{"gir", "holstein", "sahiwal"}));

    auto context = lifecycle.context();
    ASSERT_TRUE(context);
    EXPECT_EQ(context->model->num_classes(), context->labels.size());
}

TEST(LifecycleTest, PredictRunsFullPipeline) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    ASSERT_TRUE(lifecycle.start());

    TopKResult red = lifecycle.predict(test::red_png());
    ASSERT_EQ(red.predictions.size(), 3u);
    EXPECT_EQ(red.primary().breed, "gir");
    EXPECT_GT(red.primary().confidence, 99.0);
    EXPECT_EQ(red.top_class_index, 0);

    EXPECT_EQ(lifecycle.predict(test::green_png()).primary().breed, "holstein");
    EXPECT_EQ(lifecycle.predict(test::blue_png()).primary().breed, "sahiwal");
    EXPECT_EQ(lifecycle.predict(test::blue_png(), 1).predictions.size(), 1u);
}

TEST(LifecycleTest, CorruptUploadKeepsServiceReady) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    ASSERT_TRUE(lifecycle.start());

    EXPECT_THROW(lifecycle.predict("definitely not a jpeg"), DecodeError);
    EXPECT_EQ(lifecycle.state(), ServiceState::Ready);
    EXPECT_EQ(lifecycle.predict(test::red_png()).primary().breed, "gir");
}

TEST(LifecycleTest, MissingModelFails) {
    ServiceFixture fixture;
    fixture.config.model_xml = "missing.xml";
    LifecycleManager lifecycle(fixture.config);

    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
    EXPECT_NE(lifecycle.failure_reason().find("missing.xml"), std::string::npos);
    EXPECT_EQ(lifecycle.num_classes(), 0u);
    EXPECT_THROW(lifecycle.predict(test::red_png()), ModelNotLoaded);

    // A failed service does not retry on its own
    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
}

TEST(LifecycleTest, EmptyDatasetFails) {
    ServiceFixture fixture(0);
    fixture.dir.make_dir("dataset/train");
    LifecycleManager lifecycle(fixture.config);

    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
    EXPECT_NE(lifecycle.failure_reason().find("No class directories"), std::string::npos);
}

TEST(LifecycleTest, ClassCountMismatchFails) {
    ServiceFixture fixture(4);
    LifecycleManager lifecycle(fixture.config);

    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
    EXPECT_NE(lifecycle.failure_reason().find("4 class directories"), std::string::npos);
}

TEST(LifecycleTest, InputSizeMismatchFails) {
    ServiceFixture fixture;
    test::save_model(test::make_mean_color_classifier(test::color_weights(), 3, false, true, 96),
                     fixture.config.model_dir, "cattle_classifier");
    LifecycleManager lifecycle(fixture.config);

    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
    EXPECT_NE(lifecycle.failure_reason().find("does not match"), std::string::npos);
    EXPECT_THROW(lifecycle.predict(test::red_png()), ModelNotLoaded);
}

TEST(LifecycleTest, StaticInputMatchingImageSizeStarts) {
    ServiceFixture fixture;
    test::save_model(test::make_mean_color_classifier(test::color_weights(), 3, false, true, 96),
                     fixture.config.model_dir, "cattle_classifier");
    fixture.config.image_size = 96;
    LifecycleManager lifecycle(fixture.config);

    ASSERT_TRUE(lifecycle.start()) << lifecycle.failure_reason();
    EXPECT_EQ(lifecycle.predict(test::green_png()).primary().breed, "holstein");
}

TEST(LifecycleTest, UnknownInterpolationFails) {
    ServiceFixture fixture;
    fixture.config.resize_interpolation = "sinc";
    LifecycleManager lifecycle(fixture.config);
    EXPECT_FALSE(lifecycle.start());
    EXPECT_EQ(lifecycle.state(), ServiceState::Failed);
}

TEST(LifecycleTest, StopReleasesContext) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    ASSERT_TRUE(lifecycle.start());

    auto in_flight = lifecycle.context();
    lifecycle.stop();

    EXPECT_EQ(lifecycle.state(), ServiceState::ShuttingDown);
    EXPECT_FALSE(lifecycle.context());
    EXPECT_THROW(lifecycle.predict(test::red_png()), ModelNotLoaded);

    // A request that already holds the context can still finish
    ProbabilityVector p = in_flight->engine->execute(preprocess_image(test::red_png()));
    EXPECT_EQ(p.size(), 3u);
}

TEST(LifecycleTest, StartIsOneTime) {
    ServiceFixture fixture;
    LifecycleManager lifecycle(fixture.config);
    ASSERT_TRUE(lifecycle.start());
    auto first = lifecycle.context();
    ASSERT_TRUE(lifecycle.start());
    EXPECT_EQ(lifecycle.context(), first);
}

TEST(LifecycleTest, StateNames) {
    EXPECT_STREQ(to_string(ServiceState::Uninitialized), "uninitialized");
    EXPECT_STREQ(to_string(ServiceState::Ready), "ready");
    EXPECT_STREQ(to_string(ServiceState::Failed), "failed");
    EXPECT_STREQ(to_string(ServiceState::ShuttingDown), "shutting_down");
}

// Regression check against a real trained model. Set SHIKAKU_REFERENCE_MODEL
// to the IR .xml, SHIKAKU_REFERENCE_DATASET to the training directory and
// SHIKAKU_REFERENCE_IMAGE to a photo of a gir cow.
TEST(LifecycleTest, ReferenceGirImage) {
    const char* model = std::getenv("SHIKAKU_REFERENCE_MODEL");
    const char* dataset = std::getenv("SHIKAKU_REFERENCE_DATASET");
    const char* image = std::getenv("SHIKAKU_REFERENCE_IMAGE");
    if (model == nullptr || dataset == nullptr || image == nullptr) {
        GTEST_SKIP() << "reference model not configured";
    }

    ShikakuConfig config;
    config.model_dir = "";
    config.model_xml = model;
    config.dataset_dir = dataset;

    LifecycleManager lifecycle(config);
    ASSERT_TRUE(lifecycle.start()) << lifecycle.failure_reason();

    TopKResult result = lifecycle.predict(test::read_text(image));
    EXPECT_EQ(result.primary().breed, "gir");
    EXPECT_GT(result.primary().confidence, 50.0);
}
