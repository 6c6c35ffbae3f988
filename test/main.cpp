#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <torch/torch.h>
#include "../include/Ugp.h"

// Sine regression: 1-D sin(x) + noise, sparse variational GP with 10 inducing points.
// Usage: ugp_sine_demo [config.json]
int main(int argc, char** argv) {
    try {
        Ugp::Common::Config::Settings settings{};
        settings.training.batch_size = 50;
        settings.training.eval_epochs = 10;
        settings.training.train_steps = 200;
        settings.training.learning_rate = 0.05;
        settings.training.model_name = "sine";
        settings.training.plot = true;
        settings.model.iso = true;
        settings.model.noise_variance = 0.1;
        if (argc > 1) {
            settings = Ugp::Common::Config::load(argv[1]);
        }

        torch::manual_seed(static_cast<std::uint64_t>(settings.training.seed));
        const int64_t N = 50;
        const int64_t M = 10;

        auto x = torch::linspace(-3.0, 3.0, N, torch::kFloat64).unsqueeze(1);
        auto y = torch::sin(x) + 0.1 * torch::randn({N, 1}, torch::kFloat64);
        auto xt = torch::linspace(-5.0, 5.0, 101, torch::kFloat64).unsqueeze(1);

        Ugp::Data::Task task{};
        task.name = "sine";
        task.train = Ugp::Data::Dataset(x, y, {.shuffle = true, .seed = settings.training.seed});
        task.test = Ugp::Data::Dataset(xt, torch::sin(xt));
        task.xtest = xt;
        task.inducing_inputs = torch::linspace(-3.0, 3.0, M, torch::kFloat64).unsqueeze(1);
        task.metrics = {Ugp::Metric::RootMeanSquaredError, Ugp::Metric::MeanAbsoluteError};

        const auto model_options = Ugp::Common::Config::to_model_options(settings.model, settings.training, 1, 1);
        auto model = Ugp::Training::train_gp(task, model_options, settings.training,
            [](const torch::Tensor& inputs, const torch::Tensor&, const torch::Tensor& var,
               const std::filesystem::path& out_dir) {
                std::cout << "Predicted " << inputs.size(0) << " points, mean variance "
                          << var.mean().item<double>() << ", checkpoints in " << out_dir << std::endl;
            });

        auto [mean, var] = model->predict(torch::tensor({{0.0}, {4.5}}, torch::kFloat64));
        std::cout << "f(0.0) = " << mean[0][0].item<double>() << " +/- " << std::sqrt(var[0][0].item<double>()) << std::endl;
        std::cout << "f(4.5) = " << mean[1][0].item<double>() << " +/- " << std::sqrt(var[1][0].item<double>()) << std::endl;
    } catch (const std::exception& error) {
        std::cerr << "ugp_sine_demo: " << error.what() << std::endl;
        return 1;
    }
    return 0;
}
