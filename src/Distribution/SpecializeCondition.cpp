#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Distribution/SpecializeCondition.hpp"
#include"../../include/Distribution/Standard.hpp"
#include"../../include/Errors.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        Shape checkedShape(const std::shared_ptr<Distribution> &distribution)
        {
            if (!distribution)
            {
                throw std::invalid_argument("SpecializeCondition requires a distribution.");
            }
            return distribution->shape();
        }
    }

    SpecializeCondition::SpecializeCondition(std::shared_ptr<Distribution> distribution,
                                             const torch::Tensor &condition,
                                             bool stopGradient) :
        Distribution(checkedShape(distribution), std::nullopt),
        distribution(register_module("distribution", std::move(distribution))),
        condition(condition),
        stopGradient(stopGradient)
    {
        const auto &expected = this->distribution->condShape();
        if (!condition.defined() || !expected || condition.sizes().vec() != *expected)
        {
            throw ShapeError(fmt::format("Expected condition shape {}, got {}.", shapeToString(expected),
                                         condition.defined() ? shapeToString(condition.sizes().vec()) : "None"));
        }
    }

    torch::Tensor SpecializeCondition::getCondition() const
    {
        return stopGradient ? condition.detach() : condition;
    }

    torch::Tensor SpecializeCondition::repeatedCondition(int64_t n) const
    {
        return getCondition().expand(concatShapes({n}, *distribution->condShape()));
    }

    torch::Tensor SpecializeCondition::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return distribution->logProbabilityFlat(x, repeatedCondition(x.size(0)));
    }

    torch::Tensor SpecializeCondition::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return distribution->sampleFlat(keys, repeatedCondition(static_cast<int64_t>(keys.size())));
    }

    std::pair<torch::Tensor, torch::Tensor> SpecializeCondition::sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                                             const torch::Tensor &)
    {
        return distribution->sampleAndLogProbabilityFlat(keys, repeatedCondition(static_cast<int64_t>(keys.size())));
    }

    namespace
    {
        /// Normal with unit variance whose mean is the condition.
        class ConditionalMean : public Distribution
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
            ConditionalMean() : Distribution({2}, Shape{2})
            {
            }
        };
    }

    torch::TensorOptions SpecializeCondition::sampleOptions() const
    {
        return distribution->sampleOptions();
    }

    TEST_CASE("SpecializeCondition")
    {
        auto options = defaultOptions();
        auto conditional = std::make_shared<ConditionalMean>();
        auto condition = torch::tensor({3.0, -3.0}, options);
        SpecializeCondition specialized(conditional, condition);

        SUBCASE("The result is unconditional")
        {
            CHECK(specialized.shape() == Shape{2});
            CHECK_FALSE(specialized.condShape().has_value());
        }

        SUBCASE("Methods use the stored condition")
        {
            auto x = torch::randn({5, 2}, Key(0).generator(), options);
            CHECK(torch::allclose(specialized.logProbability(x), conditional->logProbability(x, condition)));
            auto samples = specialized.sample(Key(1), {300});
            CHECK(torch::allclose(samples.mean(0), condition, 0.0, 0.3));
            auto [drawn, logProbabilities] = specialized.sampleAndLogProbability(Key(1), {300});
            CHECK(torch::allclose(drawn, samples));
            CHECK(torch::allclose(logProbabilities, conditional->logProbability(drawn, condition)));
        }

        SUBCASE("The condition is detached unless requested otherwise")
        {
            auto trainable = condition.clone().requires_grad_(true);
            CHECK_FALSE(SpecializeCondition(conditional, trainable).getCondition().requires_grad());

            SpecializeCondition tracked(conditional, trainable, false);
            tracked.logProbability(torch::zeros({2}, options)).backward();
            REQUIRE(trainable.grad().defined());
            CHECK(torch::allclose(trainable.grad(), -trainable.detach()));
        }

        SUBCASE("Condition shape is validated")
        {
            CHECK_THROWS_AS(SpecializeCondition(conditional, torch::zeros({3}, options)), ShapeError);
            CHECK_THROWS_AS(SpecializeCondition(conditional, torch::zeros({1, 2}, options)), ShapeError);
            CHECK_THROWS_AS(SpecializeCondition(std::make_shared<StandardNormal>(Shape{2}), condition), ShapeError);
        }
    }
}
