#include<cmath>
#include<limits>
#include<vector>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Distribution/Distribution.hpp"
#include"../../include/Distribution/Standard.hpp"
#include"../../include/Errors.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        torch::Tensor nanToNegativeInfinity(const torch::Tensor &logProbabilities)
        {
            auto nan = torch::isnan(logProbabilities);
            if (spdlog::should_log(spdlog::level::trace) && nan.any().item<bool>())
            {
                spdlog::trace("Replacing {} NaN log probabilities with -inf", nan.sum().item<int64_t>());
            }
            auto negativeInfinity = torch::full({}, -std::numeric_limits<double>::infinity(), logProbabilities.options());
            return torch::where(nan, negativeInfinity, logProbabilities);
        }
    }

    Distribution::Distribution(Shape shape, OptionalShape condShape) :
        eventShape(std::move(shape)),
        conditionShape(std::move(condShape))
    {
    }

    std::pair<torch::Tensor, torch::Tensor> Distribution::sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                                      const torch::Tensor &condition)
    {
        auto samples = sampleFlat(keys, condition);
        return {samples, logProbabilityFlat(samples, condition)};
    }

    torch::TensorOptions Distribution::sampleOptions() const
    {
        return defaultOptions();
    }

    Shape Distribution::conditionBatchShape(const torch::Tensor &condition) const
    {
        if (!conditionShape)
        {
            return {};
        }
        checkTrailingShape(condition, *conditionShape, "condition");
        return leadingShape(condition, *conditionShape);
    }

    std::pair<Shape, std::vector<Key>> Distribution::sampleKeys(const Key &key,
                                                                const Shape &sampleShape,
                                                                const torch::Tensor &condition) const
    {
        auto keyShape = concatShapes(sampleShape, conditionBatchShape(condition));
        return {keyShape, key.split(shapeNumel(keyShape))};
    }

    torch::Tensor Distribution::flattenCondition(const torch::Tensor &condition, const Shape &batchShape) const
    {
        if (!conditionShape)
        {
            return {};
        }
        auto flatShape = concatShapes({shapeNumel(batchShape)}, *conditionShape);
        return condition.expand(concatShapes(batchShape, *conditionShape)).reshape(flatShape);
    }

    torch::Tensor Distribution::logProbability(const torch::Tensor &x, const torch::Tensor &condition)
    {
        checkTrailingShape(x, eventShape, "x");
        auto batchShape = leadingShape(x, eventShape);
        if (conditionShape)
        {
            batchShape = broadcastShapes(batchShape, conditionBatchShape(condition));
        }

        auto flatShape = concatShapes({shapeNumel(batchShape)}, eventShape);
        auto flatX = x.expand(concatShapes(batchShape, eventShape)).reshape(flatShape);
        auto logProbabilities = logProbabilityFlat(flatX, flattenCondition(condition, batchShape));
        return nanToNegativeInfinity(logProbabilities.reshape(batchShape));
    }

    torch::Tensor Distribution::sample(const Key &key, const Shape &sampleShape, const torch::Tensor &condition)
    {
        auto [keyShape, keys] = sampleKeys(key, sampleShape, condition);
        auto outputShape = concatShapes(keyShape, eventShape);
        if (keys.empty())
        {
            return torch::empty(outputShape, sampleOptions());
        }
        return sampleFlat(keys, flattenCondition(condition, keyShape)).reshape(outputShape);
    }

    std::pair<torch::Tensor, torch::Tensor> Distribution::sampleAndLogProbability(const Key &key,
                                                                                  const Shape &sampleShape,
                                                                                  const torch::Tensor &condition)
    {
        auto [keyShape, keys] = sampleKeys(key, sampleShape, condition);
        auto outputShape = concatShapes(keyShape, eventShape);
        if (keys.empty())
        {
            return {torch::empty(outputShape, sampleOptions()), torch::empty(keyShape, sampleOptions())};
        }
        auto [samples, logProbabilities] = sampleAndLogProbabilityFlat(keys, flattenCondition(condition, keyShape));
        return {samples.reshape(outputShape), nanToNegativeInfinity(logProbabilities.reshape(keyShape))};
    }

    namespace
    {
        /// Unit variance normal centred on its condition.
        class ShiftedNormal : public Distribution
        {
        protected:
            torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition) override
            {
                return (-0.5 * (x - condition).square() - 0.5 * std::log(2 * M_PI)).sum(-1);
            }

            torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition) override
            {
                std::vector<torch::Tensor> draws;
                for (const auto &key : keys)
                {
                    draws.push_back(torch::randn(eventShape, key.generator(), condition.options()));
                }
                return torch::stack(draws) + condition;
            }
        public:
            ShiftedNormal() : Distribution({2}, Shape{2})
            {
            }
        };

        /// Produces NaN densities for negative inputs.
        class NanOnNegative : public Distribution
        {
        protected:
            torch::Tensor logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &) override
            {
                return torch::log(x).sum(-1);
            }

            torch::Tensor sampleFlat(const std::vector<Key> &keys, const torch::Tensor &) override
            {
                return torch::ones({static_cast<int64_t>(keys.size()), 1}, defaultOptions());
            }
        public:
            NanOnNegative() : Distribution({1}, std::nullopt)
            {
            }
        };
    }

    TEST_CASE("Distribution vectorization")
    {
        auto options = defaultOptions();

        SUBCASE("Unconditional sample shape is sampleShape + shape")
        {
            StandardNormal normal(Shape{3});
            CHECK(normal.sample(Key(0)).sizes().vec() == std::vector<int64_t>{3});
            CHECK(normal.sample(Key(0), {4, 5}).sizes().vec() == std::vector<int64_t>{4, 5, 3});
            auto [samples, logProbabilities] = normal.sampleAndLogProbability(Key(0), {4, 5});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{4, 5, 3});
            CHECK(logProbabilities.sizes().vec() == std::vector<int64_t>{4, 5});
            CHECK(torch::allclose(logProbabilities, normal.logProbability(samples)));
        }

        SUBCASE("Empty sample shapes give empty tensors")
        {
            StandardNormal normal(Shape{3});
            CHECK(normal.sample(Key(0), {0}).sizes().vec() == std::vector<int64_t>{0, 3});
        }

        SUBCASE("Empty samples keep the dtype of the distribution")
        {
            auto singleOptions = torch::TensorOptions().dtype(torch::kFloat32);
            StandardNormal single(Shape{3}, singleOptions);
            CHECK(single.sample(Key(0), {0}).dtype() == torch::kFloat32);
            auto [samples, logProbabilities] = single.sampleAndLogProbability(Key(0), {2, 0});
            CHECK(samples.dtype() == torch::kFloat32);
            CHECK(logProbabilities.dtype() == torch::kFloat32);
            CHECK(logProbabilities.sizes().vec() == std::vector<int64_t>{2, 0});
        }

        SUBCASE("Conditional sample shape includes the condition batch")
        {
            ShiftedNormal conditional;
            auto condition = torch::zeros({6, 2}, options);
            CHECK(conditional.sample(Key(1), {}, condition).sizes().vec() == std::vector<int64_t>{6, 2});
            CHECK(conditional.sample(Key(1), {4}, condition).sizes().vec() == std::vector<int64_t>{4, 6, 2});
            CHECK(conditional.sample(Key(1), {4}, torch::zeros({2}, options)).sizes().vec()
                  == std::vector<int64_t>{4, 2});
        }

        SUBCASE("Sampling follows the condition of each batch element")
        {
            ShiftedNormal conditional;
            auto condition = torch::tensor({{100.0, 100.0}, {-100.0, -100.0}}, options);
            auto samples = conditional.sample(Key(2), {}, condition);
            CHECK(samples[0][0].item<double>() > 50);
            CHECK(samples[1][0].item<double>() < -50);
        }

        SUBCASE("logProbability broadcasts x against the condition")
        {
            ShiftedNormal conditional;
            auto x = torch::zeros({5, 1, 2}, options);
            auto condition = torch::zeros({3, 2}, options);
            auto logProbabilities = conditional.logProbability(x, condition);
            CHECK(logProbabilities.sizes().vec() == std::vector<int64_t>{5, 3});
            CHECK(logProbabilities[4][2].item<double>() == doctest::Approx(-std::log(2 * M_PI)));
        }

        SUBCASE("Shape errors are raised before evaluation")
        {
            StandardNormal normal(Shape{3});
            ShiftedNormal conditional;
            CHECK_THROWS_AS(normal.logProbability(torch::zeros({4, 2}, options)), ShapeError);
            CHECK_THROWS_AS(conditional.logProbability(torch::zeros({2}, options)), ShapeError);
            CHECK_THROWS_AS(conditional.sample(Key(0), {3}), ShapeError);
            CHECK_THROWS_AS(conditional.logProbability(torch::zeros({2}, options), torch::zeros({3}, options)),
                            ShapeError);
            CHECK_THROWS_AS(conditional.logProbability(torch::zeros({4, 2}, options), torch::zeros({3, 2}, options)),
                            ShapeError);
        }

        SUBCASE("NaN log densities are reported as -inf")
        {
            NanOnNegative distribution;
            auto x = torch::tensor({{-1.0}, {1.0}}, options);
            auto logProbabilities = distribution.logProbability(x);
            CHECK_FALSE(torch::isnan(logProbabilities).any().item<bool>());
            CHECK(std::isinf(logProbabilities[0].item<double>()));
            CHECK(logProbabilities[0].item<double>() < 0);
            CHECK(logProbabilities[1].item<double>() == doctest::Approx(0.0));
        }
    }
}
