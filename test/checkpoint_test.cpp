#include <filesystem>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include <torch/torch.h>

#include "../include/Ugp.h"

namespace SaveLoad = Ugp::Common::SaveLoad;

namespace {
    std::filesystem::path scratch_directory() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        auto path = std::filesystem::temp_directory_path()
                    / (std::string("ugp_checkpoint_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
        return path;
    }

    torch::Tensor inducing(std::int64_t m) {
        return torch::linspace(-2.0, 2.0, m, torch::kFloat64).unsqueeze(1);
    }

    // Moves every parameter away from its initial value.
    void perturb(torch::nn::Module& module, double amount) {
        torch::NoGradGuard no_grad;
        for (auto& parameter : module.parameters()) {
            parameter.add_(amount);
        }
    }
}

TEST(CheckpointTest, RoundTripReproducesPredictions) {
    const auto directory = scratch_directory();
    auto x = torch::linspace(-3.0, 3.0, 11, torch::kFloat64).unsqueeze(1);

    Ugp::Model trained(inducing(5));
    perturb(trained, 0.3);
    auto optimizer = Ugp::Optimizer::build_optimizer(trained, Ugp::Optimizer::Adam());
    const auto path = SaveLoad::save(directory / "model.ckpt", trained, optimizer.get(), 42, nullptr);
    EXPECT_EQ(path.filename(), "model.ckpt-42");

    Ugp::Model restored(inducing(5));
    auto restored_optimizer = Ugp::Optimizer::build_optimizer(restored, Ugp::Optimizer::Adam());
    const auto report = SaveLoad::restore(path, restored, restored_optimizer.get(), false, nullptr);
    EXPECT_EQ(report.step, 42);
    EXPECT_TRUE(report.complete());
    EXPECT_TRUE(report.optimizer_restored);

    auto [expected_mean, expected_var] = trained.predict(x);
    auto [mean, var] = restored.predict(x);
    EXPECT_TRUE(torch::equal(mean, expected_mean));
    EXPECT_TRUE(torch::equal(var, expected_var));

    std::filesystem::remove_all(directory);
}

TEST(CheckpointTest, LatestCheckpointFollowsTheIndex) {
    const auto directory = scratch_directory();
    Ugp::Model model(inducing(3));
    (void)SaveLoad::save(directory / "model.ckpt", model, nullptr, 5, nullptr);
    (void)SaveLoad::save(directory / "model.ckpt", model, nullptr, 10, nullptr);

    auto latest = SaveLoad::latest_checkpoint(directory);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->filename(), "model.ckpt-10");

    // Without the index the highest step wins.
    std::filesystem::remove(directory / SaveLoad::kIndexFile);
    latest = SaveLoad::latest_checkpoint(directory);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->filename(), "model.ckpt-10");

    std::filesystem::remove_all(directory);
}

TEST(CheckpointTest, MissingCheckpointIsEmpty) {
    const auto directory = scratch_directory();
    EXPECT_FALSE(SaveLoad::latest_checkpoint(directory).has_value());
    EXPECT_FALSE(SaveLoad::latest_checkpoint(directory / "absent").has_value());

    Ugp::Model model(inducing(3));
    EXPECT_THROW(SaveLoad::restore(directory / "model.ckpt-1", model, nullptr, true, nullptr), std::runtime_error);
    std::filesystem::remove_all(directory);
}

TEST(CheckpointTest, PartialRestoreWarns) {
    const auto directory = scratch_directory();
    Ugp::Model variational(inducing(4));
    const auto path = SaveLoad::save(directory / "model.ckpt", variational, nullptr, 3, nullptr);

    // Same kernel and likelihood, but no variational parameters.
    Ugp::Model exact(inducing(4), {.inference = Ugp::Inference::Exact()});
    perturb(exact, 0.5);
    std::ostringstream log;
    const auto report = SaveLoad::restore(path, exact, nullptr, true, &log);
    EXPECT_FALSE(report.complete());
    EXPECT_TRUE(report.missing.empty());
    EXPECT_FALSE(report.unexpected.empty());
    EXPECT_NE(log.str().find("partially"), std::string::npos);

    // The shared parameters were restored.
    EXPECT_TRUE(torch::equal(exact.kernel()->sf(), variational.kernel()->sf()));

    EXPECT_THROW(SaveLoad::restore(path, exact, nullptr, false, nullptr), std::runtime_error);
    std::filesystem::remove_all(directory);
}

TEST(CheckpointTest, MissingOptimizerStateWarnsWhenPartial) {
    const auto directory = scratch_directory();
    Ugp::Model model(inducing(3));
    const auto path = SaveLoad::save(directory / "model.ckpt", model, nullptr, 1, nullptr);

    auto optimizer = Ugp::Optimizer::build_optimizer(model, Ugp::Optimizer::Adam());
    std::ostringstream log;
    const auto report = SaveLoad::restore(path, model, optimizer.get(), true, &log);
    EXPECT_FALSE(report.optimizer_restored);
    EXPECT_NE(log.str().find("Optimizer state not restored"), std::string::npos);
    EXPECT_THROW(SaveLoad::restore(path, model, optimizer.get(), false, nullptr), std::runtime_error);

    std::filesystem::remove_all(directory);
}

TEST(CheckpointTest, ShapeMismatchIsFatal) {
    const auto directory = scratch_directory();
    Ugp::Model small(inducing(3));
    const auto path = SaveLoad::save(directory / "model.ckpt", small, nullptr, 2, nullptr);

    Ugp::Model large(inducing(6));
    EXPECT_THROW(SaveLoad::restore(path, large, nullptr, true, nullptr), std::runtime_error);
    std::filesystem::remove_all(directory);
}
