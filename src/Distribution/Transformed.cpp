#include<algorithm>
#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Bijection/Affine.hpp"
#include"../../include/Bijection/Chain.hpp"
#include"../../include/Bijection/Exp.hpp"
#include"../../include/Bijection/TriangularAffine.hpp"
#include"../../include/Distribution/Standard.hpp"
#include"../../include/Distribution/Transformed.hpp"
#include"../../include/Errors.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        void checkNotNull(const std::shared_ptr<Distribution> &base, const std::shared_ptr<Bijection> &bijection)
        {
            if (!base || !bijection)
            {
                throw std::invalid_argument("Transformed requires a base distribution and a bijection.");
            }
        }

        Shape checkedShape(const std::shared_ptr<Distribution> &base, const std::shared_ptr<Bijection> &bijection)
        {
            checkNotNull(base, bijection);
            if (base->shape() != bijection->shape())
            {
                throw std::invalid_argument(fmt::format(
                    "Base distribution shape {} does not match bijection shape {}.",
                    shapeToString(base->shape()), shapeToString(bijection->shape())));
            }
            return base->shape();
        }

        OptionalShape mergedConditionShape(const std::shared_ptr<Distribution> &base,
                                           const std::shared_ptr<Bijection> &bijection)
        {
            checkNotNull(base, bijection);
            return mergeConditionShapes({base->condShape(), bijection->condShape()});
        }
    }

    Transformed::Transformed(std::shared_ptr<Distribution> base, std::shared_ptr<Bijection> bijection) :
        Distribution(checkedShape(base, bijection), mergedConditionShape(base, bijection)),
        base(register_module("base", std::move(base))),
        bijection(register_module("bijection", std::move(bijection)))
    {
        spdlog::debug("Transformed distribution of shape {}, condition shape {}",
                      shapeToString(eventShape), shapeToString(conditionShape));
    }

    torch::Tensor Transformed::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &condition)
    {
        auto [z, logDet] = bijection->inverseAndLogDet(x, condition);
        return base->logProbabilityFlat(z, condition) + logDet;
    }

    torch::Tensor Transformed::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &condition)
    {
        return bijection->transform(base->sampleFlat(keys, condition), condition);
    }

    std::pair<torch::Tensor, torch::Tensor> Transformed::sampleAndLogProbabilityFlat(const std::vector<Key> &keys,
                                                                                     const torch::Tensor &condition)
    {
        auto [z, baseLogProbability] = base->sampleAndLogProbabilityFlat(keys, condition);
        auto [x, logDet] = bijection->transformAndLogDet(z, condition);
        return {x, baseLogProbability - logDet};
    }

    torch::TensorOptions Transformed::sampleOptions() const
    {
        return base->sampleOptions();
    }

    std::shared_ptr<Transformed> mergeTransforms(const std::shared_ptr<Transformed> &distribution)
    {
        if (!std::dynamic_pointer_cast<Transformed>(distribution->getBase()))
        {
            return distribution;
        }

        // Collected outermost first, applied innermost first.
        std::vector<std::shared_ptr<Bijection>> bijections{distribution->getBijection()};
        auto innermost = distribution->getBase();
        while (auto nested = std::dynamic_pointer_cast<Transformed>(innermost))
        {
            bijections.push_back(nested->getBijection());
            innermost = nested->getBase();
        }
        std::reverse(bijections.begin(), bijections.end());

        auto chain = Chain(bijections).mergeChains();
        spdlog::debug("Merged nested transforms into a chain of {} bijections", chain->size());
        return std::make_shared<Transformed>(innermost, chain);
    }

    namespace
    {
        /// Shifts both elements of its input by the sum of the condition.
        class ConditionalShift : public Bijection
        {
        public:
            explicit ConditionalShift(int64_t conditionDim) : Bijection({2}, Shape{conditionDim})
            {
            }

            std::pair<torch::Tensor, torch::Tensor> transformAndLogDet(const torch::Tensor &x,
                                                                       const torch::Tensor &condition) override
            {
                checkShapes(x, condition);
                auto y = x + condition.sum(-1, true);
                return {y, torch::zeros(leadingShape(y, eventShape), y.options())};
            }

            std::pair<torch::Tensor, torch::Tensor> inverseAndLogDet(const torch::Tensor &y,
                                                                     const torch::Tensor &condition) override
            {
                checkShapes(y, condition);
                auto x = y - condition.sum(-1, true);
                return {x, torch::zeros(leadingShape(x, eventShape), x.options())};
            }
        };
    }

    TEST_CASE("Transformed")
    {
        auto options = defaultOptions();
        auto affine = std::make_shared<Affine>(torch::tensor({1.0, -1.0}, options), torch::tensor({2.0, 0.5}, options));
        auto base = std::make_shared<StandardNormal>(Shape{2});
        Transformed transformed(base, affine);

        SUBCASE("Log density uses the change of variables formula")
        {
            auto x = torch::randn({7, 2}, Key(0).generator(), options);
            auto z = affine->inverse(x);
            auto expected = base->logProbability(z) - std::log(2.0 * 0.5);
            CHECK(torch::allclose(transformed.logProbability(x), expected));
        }

        SUBCASE("sampleAndLogProbability agrees with sample and logProbability")
        {
            auto [samples, logProbabilities] = transformed.sampleAndLogProbability(Key(1), {6});
            CHECK(torch::allclose(samples, transformed.sample(Key(1), {6})));
            CHECK(torch::allclose(logProbabilities, transformed.logProbability(samples)));
        }

        SUBCASE("Parameters of the base and the bijection are reachable")
        {
            CHECK(transformed.parameters().size() == 2);
        }

        SUBCASE("Empty samples keep the dtype of the base distribution")
        {
            auto singleOptions = torch::TensorOptions().dtype(torch::kFloat32);
            Transformed single(std::make_shared<StandardNormal>(Shape{2}, singleOptions),
                               std::make_shared<Affine>(torch::zeros({2}, singleOptions), torch::ones({2}, singleOptions)));
            CHECK(single.sample(Key(0), {0}).dtype() == torch::kFloat32);
            CHECK(single.sample(Key(0), {3}).dtype() == torch::kFloat32);
        }

        SUBCASE("Mismatched shapes are rejected")
        {
            CHECK_THROWS_AS(Transformed(std::make_shared<StandardNormal>(Shape{3}), affine), std::invalid_argument);
            CHECK_THROWS_AS(Transformed(nullptr, affine), std::invalid_argument);
        }
    }

    TEST_CASE("Transformed with a conditional bijection")
    {
        auto options = defaultOptions();
        Transformed conditional(std::make_shared<StandardNormal>(Shape{2}), std::make_shared<ConditionalShift>(2));
        REQUIRE(conditional.condShape().has_value());
        CHECK(*conditional.condShape() == Shape{2});

        SUBCASE("Condition batch dimensions are carried through")
        {
            auto condition = torch::tensor({{10.0, 10.0}, {-10.0, -10.0}, {0.0, 0.0}}, options);
            auto [samples, logProbabilities] = conditional.sampleAndLogProbability(Key(2), {4}, condition);
            CHECK(samples.sizes().vec() == std::vector<int64_t>{4, 3, 2});
            CHECK(logProbabilities.sizes().vec() == std::vector<int64_t>{4, 3});
            CHECK(torch::allclose(logProbabilities, conditional.logProbability(samples, condition)));
            CHECK(samples.select(1, 0).mean().item<double>() > 10);
        }

        SUBCASE("Conditional flows need a condition")
        {
            CHECK_THROWS_AS(conditional.logProbability(torch::zeros({2}, options)), ShapeError);
        }

        SUBCASE("Conditioning shapes must agree")
        {
            auto conditionalBase = std::make_shared<Transformed>(std::make_shared<StandardNormal>(Shape{2}),
                                                                 std::make_shared<ConditionalShift>(2));
            CHECK_NOTHROW(Transformed(conditionalBase, std::make_shared<ConditionalShift>(2)));
            CHECK_THROWS_AS(Transformed(conditionalBase, std::make_shared<ConditionalShift>(3)),
                            std::invalid_argument);
        }
    }

    TEST_CASE("mergeTransforms")
    {
        auto options = defaultOptions();
        auto inner = std::make_shared<Transformed>(
            std::make_shared<StandardNormal>(Shape{2}),
            std::make_shared<Affine>(torch::tensor({0.5, -0.5}, options), torch::tensor({1.5, 0.8}, options)));
        auto middle = std::make_shared<Transformed>(inner, std::make_shared<Exp>(Shape{2}));
        auto outer = std::make_shared<Transformed>(
            middle,
            std::make_shared<Chain>(std::vector<std::shared_ptr<Bijection>>{
                std::make_shared<TriangularAffine>(torch::zeros({2}, options),
                                                   torch::tensor({1.0, 0.0, 0.3, 2.0}, options).view({2, 2})),
                std::make_shared<Affine>(torch::tensor({1.0, 1.0}, options), torch::tensor({1.0, 3.0}, options))}));
        auto merged = mergeTransforms(outer);

        SUBCASE("Nested layers become one flat chain over the innermost base")
        {
            CHECK(std::dynamic_pointer_cast<StandardNormal>(merged->getBase()) != nullptr);
            auto chain = std::dynamic_pointer_cast<Chain>(merged->getBijection());
            REQUIRE(chain != nullptr);
            CHECK(chain->size() == 4);
        }

        SUBCASE("Sampling and densities are unchanged")
        {
            auto samples = outer->sample(Key(9), {20});
            CHECK(torch::allclose(merged->sample(Key(9), {20}), samples));
            CHECK(torch::allclose(merged->logProbability(samples), outer->logProbability(samples)));
        }

        SUBCASE("Distributions without nested transforms are returned unchanged")
        {
            CHECK(mergeTransforms(inner) == inner);
        }
    }
}
