#include<cmath>
#include<stdexcept>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Bijection/BlockAutoregressiveNetwork.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Standard.hpp"
#include"../../include/Train/Objective.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    Objective::Objective(std::shared_ptr<Distribution> distribution, double learningRate, double maxGradNorm) :
        distribution(std::move(distribution)),
        maxGradNorm(maxGradNorm)
    {
        if (!this->distribution)
        {
            throw std::invalid_argument("Objective requires a distribution.");
        }
        if (learningRate <= 0 || maxGradNorm <= 0)
        {
            throw std::invalid_argument("learningRate and maxGradNorm must be positive.");
        }
        auto parameters = this->distribution->parameters();
        if (parameters.empty())
        {
            throw std::invalid_argument("Objective requires a distribution with trainable parameters.");
        }
        optimizer = std::make_unique<torch::optim::Adam>(parameters, torch::optim::AdamOptions(learningRate));
    }

    Objective::~Objective()
    {
    }

    std::vector<UpdateDatum> Objective::step(const torch::Tensor &loss)
    {
        optimizer->zero_grad();
        loss.backward();
        auto gradientNorm = torch::nn::utils::clip_grad_norm_(distribution->parameters(), maxGradNorm);
        optimizer->step();

        auto lossValue = loss.item<double>();
        spdlog::debug("Objective step: loss {:.6f}, gradient norm {:.6f}", lossValue, gradientNorm);
        if (!std::isfinite(lossValue))
        {
            spdlog::warn("Non-finite loss {} in objective step", lossValue);
        }
        return {{"loss", static_cast<float>(lossValue)},
                {"gradient_norm", static_cast<float>(gradientNorm)}};
    }

    VariationalObjective::VariationalObjective(std::shared_ptr<Distribution> distribution,
                                               LogDensity target,
                                               Key key,
                                               double learningRate,
                                               int64_t samplesPerStep,
                                               double maxGradNorm) :
        Objective(std::move(distribution), learningRate, maxGradNorm),
        target(std::move(target)),
        key(key),
        samplesPerStep(samplesPerStep)
    {
        if (!this->target)
        {
            throw std::invalid_argument("VariationalObjective requires a target density.");
        }
        if (samplesPerStep < 1)
        {
            throw std::invalid_argument("samplesPerStep must be at least 1.");
        }
    }

    torch::Tensor VariationalObjective::loss(const Key &key)
    {
        auto [samples, approximateDensity] = distribution->sampleAndLogProbability(key, {samplesPerStep});
        return (approximateDensity - target(samples)).mean();
    }

    std::vector<UpdateDatum> VariationalObjective::update()
    {
        auto [next, subkey] = key.split();
        key = next;
        return step(loss(subkey));
    }

    MaximumLikelihoodObjective::MaximumLikelihoodObjective(std::shared_ptr<Distribution> distribution,
                                                           double learningRate,
                                                           double maxGradNorm) :
        Objective(std::move(distribution), learningRate, maxGradNorm)
    {
    }

    torch::Tensor MaximumLikelihoodObjective::loss(const torch::Tensor &x, const torch::Tensor &condition)
    {
        return -distribution->logProbability(x, condition).mean();
    }

    std::vector<UpdateDatum> MaximumLikelihoodObjective::update(const torch::Tensor &x, const torch::Tensor &condition)
    {
        return step(loss(x, condition));
    }

    TEST_CASE("VariationalObjective")
    {
        // N(2, 0.5^2) up to a constant.
        LogDensity target = [](const torch::Tensor &x)
        {
            return -0.5 * ((x - 2) / 0.5).square();
        };

        SUBCASE("Fitting a normal moves it towards the target")
        {
            auto normal = std::make_shared<Normal>(0.0, 1.0);
            VariationalObjective objective(normal, target, Key(0), 0.05, 100);
            auto first = objective.update();
            REQUIRE(first.size() == 2);
            CHECK(first[0].name == "loss");
            CHECK(first[1].name == "gradient_norm");

            float last = first[0].value;
            for (int i = 0; i < 100; ++i)
            {
                last = objective.update()[0].value;
            }
            CHECK(last < first[0].value);
            CHECK(normal->getLoc().item<double>() > 1.0);
            CHECK(normal->getScale().item<double>() < 1.0);
        }

        SUBCASE("Block autoregressive flows train without an inverse and keep their masks")
        {
            auto flow = std::make_shared<BlockAutoregressiveNetwork>(Key(1), 2, 3, std::pair<int64_t, int64_t>{4, 4});
            auto distribution = std::make_shared<Transformed>(std::make_shared<StandardNormal>(Shape{2}), flow);
            LogDensity shifted = [](const torch::Tensor &x)
            {
                return -0.5 * (x - 1).square().sum(-1);
            };
            VariationalObjective objective(distribution, shifted, Key(2), 1e-2, 20);
            for (int i = 0; i < 5; ++i)
            {
                auto data = objective.update();
                CHECK(std::isfinite(data[0].value));
            }
            for (const auto &layer : flow->getLayers())
            {
                auto masked = 1 - layer->getDiagonalMask() - layer->getLowerMask();
                CHECK((layer->normalisedWeights() * masked).abs().max().item<double>() == 0.0);
            }
        }

        SUBCASE("Invalid settings are rejected")
        {
            auto normal = std::make_shared<Normal>(0.0, 1.0);
            CHECK_THROWS_AS(VariationalObjective(normal, target, Key(0), 0.05, 0), std::invalid_argument);
            CHECK_THROWS_AS(VariationalObjective(normal, LogDensity(), Key(0)), std::invalid_argument);
            CHECK_THROWS_AS(VariationalObjective(normal, target, Key(0), -1.0), std::invalid_argument);
            CHECK_THROWS_AS(VariationalObjective(std::make_shared<StandardNormal>(), target, Key(0)),
                            std::invalid_argument);
        }
    }

    TEST_CASE("MaximumLikelihoodObjective")
    {
        auto options = defaultOptions();
        auto data = 3 + torch::randn({256}, Key(5).generator(), options);
        auto normal = std::make_shared<Normal>(0.0, 1.0);
        MaximumLikelihoodObjective objective(normal, 0.1);

        auto initialLoss = objective.loss(data).item<double>();
        for (int i = 0; i < 100; ++i)
        {
            objective.update(data);
        }
        CHECK(objective.loss(data).item<double>() < initialLoss);
        CHECK(normal->getLoc().item<double>() > 2.0);
    }
}
