#include<stdexcept>

#include<fmt/format.h>
#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Bijection/Chain.hpp"
#include"../../include/Bijection/Affine.hpp"
#include"../../include/Bijection/Exp.hpp"
#include"../../include/Bijection/TriangularAffine.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        const std::shared_ptr<Bijection> &front(const std::vector<std::shared_ptr<Bijection>> &bijections)
        {
            if (bijections.empty())
            {
                throw std::invalid_argument("A Chain needs at least one bijection.");
            }
            for (const auto &bijection : bijections)
            {
                if (!bijection)
                {
                    throw std::invalid_argument("A Chain cannot contain a null bijection.");
                }
            }
            return bijections.front();
        }

        OptionalShape mergedConditionShape(const std::vector<std::shared_ptr<Bijection>> &bijections)
        {
            std::vector<OptionalShape> shapes;
            for (const auto &bijection : bijections)
            {
                shapes.push_back(bijection->condShape());
            }
            return mergeConditionShapes(shapes);
        }
    }

    Chain::Chain(std::vector<std::shared_ptr<Bijection>> bijections) :
        Bijection(front(bijections)->shape(), mergedConditionShape(bijections)),
        bijections(std::move(bijections))
    {
        for (size_t i = 0; i < this->bijections.size(); ++i)
        {
            const auto &bijection = this->bijections[i];
            if (bijection->shape() != eventShape)
            {
                throw std::invalid_argument(fmt::format(
                    "All bijections in a Chain must have the same shape; bijection {} has shape {}, expected {}.",
                    i, shapeToString(bijection->shape()), shapeToString(eventShape)));
            }
            register_module(std::to_string(i), bijection);
        }
    }

    torch::Tensor Chain::transform(const torch::Tensor &x, const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        auto y = x;
        for (const auto &bijection : bijections)
        {
            y = bijection->transform(y, condition);
        }
        return y;
    }

    std::pair<torch::Tensor, torch::Tensor> Chain::transformAndLogDet(const torch::Tensor &x,
                                                                      const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        auto [y, logDet] = bijections.front()->transformAndLogDet(x, condition);
        for (size_t i = 1; i < bijections.size(); ++i)
        {
            auto [next, stepLogDet] = bijections[i]->transformAndLogDet(y, condition);
            y = next;
            logDet = logDet + stepLogDet;
        }
        return {y, logDet};
    }

    torch::Tensor Chain::inverse(const torch::Tensor &y, const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        auto x = y;
        for (auto it = bijections.rbegin(); it != bijections.rend(); ++it)
        {
            x = (*it)->inverse(x, condition);
        }
        return x;
    }

    std::pair<torch::Tensor, torch::Tensor> Chain::inverseAndLogDet(const torch::Tensor &y,
                                                                    const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        auto [x, logDet] = bijections.back()->inverseAndLogDet(y, condition);
        for (auto it = std::next(bijections.rbegin()); it != bijections.rend(); ++it)
        {
            auto [previous, stepLogDet] = (*it)->inverseAndLogDet(x, condition);
            x = previous;
            logDet = logDet + stepLogDet;
        }
        return {x, logDet};
    }

    std::shared_ptr<Chain> Chain::mergeChains() const
    {
        std::vector<std::shared_ptr<Bijection>> flat;
        for (const auto &bijection : bijections)
        {
            if (auto nested = std::dynamic_pointer_cast<Chain>(bijection))
            {
                auto merged = nested->mergeChains();
                flat.insert(flat.end(), merged->bijections.begin(), merged->bijections.end());
            }
            else
            {
                flat.push_back(bijection);
            }
        }
        spdlog::debug("Merged chain of {} bijections into {} flat bijections", bijections.size(), flat.size());
        return std::make_shared<Chain>(std::move(flat));
    }

    TEST_CASE("Chain")
    {
        auto options = defaultOptions();
        auto affine = std::make_shared<Affine>(torch::tensor({1.0, -1.0}, options), torch::tensor({2.0, 0.5}, options));
        auto exponential = std::make_shared<Exp>(Shape{2});
        auto triangular = std::make_shared<TriangularAffine>(
            torch::zeros({2}, options), torch::tensor({1.5, 0.0, 0.7, 0.4}, options).view({2, 2}));
        Chain chain({affine, triangular, exponential});
        auto x = torch::randn({10, 2}, Key(0).generator(), options);

        SUBCASE("Forward applies bijections in order")
        {
            auto expected = exponential->transform(triangular->transform(affine->transform(x)));
            CHECK(torch::allclose(chain.transform(x), expected));
        }

        SUBCASE("Log determinants are summed")
        {
            auto [y, logDet] = chain.transformAndLogDet(x);
            auto [y1, ld1] = affine->transformAndLogDet(x);
            auto [y2, ld2] = triangular->transformAndLogDet(y1);
            auto [y3, ld3] = exponential->transformAndLogDet(y2);
            CHECK(torch::allclose(y, y3));
            CHECK(torch::allclose(logDet, ld1 + ld2 + ld3));
        }

        SUBCASE("Round trip and log determinant antisymmetry")
        {
            auto [y, logDet] = chain.transformAndLogDet(x);
            auto [z, inverseLogDet] = chain.inverseAndLogDet(y);
            CHECK(torch::allclose(z, x, 1e-8, 1e-10));
            CHECK(torch::allclose(inverseLogDet, -logDet, 1e-8, 1e-10));
            CHECK(torch::allclose(chain.inverse(chain.transform(x)), x, 1e-8, 1e-10));
        }

        SUBCASE("Parameters of every member are registered")
        {
            CHECK(chain.parameters().size() == 5);
        }

        SUBCASE("mergeChains() flattens and preserves semantics")
        {
            auto inner = std::make_shared<Chain>(std::vector<std::shared_ptr<Bijection>>{affine, triangular});
            auto outer = std::make_shared<Chain>(std::vector<std::shared_ptr<Bijection>>{
                inner, std::make_shared<Chain>(std::vector<std::shared_ptr<Bijection>>{exponential})});
            auto merged = outer->mergeChains();

            CHECK(merged->size() == 3);
            CHECK((*merged)[0] == affine);
            CHECK((*merged)[1] == triangular);
            CHECK((*merged)[2] == exponential);

            auto [y, logDet] = outer->transformAndLogDet(x);
            auto [mergedY, mergedLogDet] = merged->transformAndLogDet(x);
            CHECK(torch::allclose(y, mergedY));
            CHECK(torch::allclose(logDet, mergedLogDet));
        }

        SUBCASE("Construction errors")
        {
            CHECK_THROWS_AS(Chain(std::vector<std::shared_ptr<Bijection>>{}), std::invalid_argument);
            CHECK_THROWS_AS(Chain(std::vector<std::shared_ptr<Bijection>>{affine, std::make_shared<Exp>(Shape{3})}),
                            std::invalid_argument);
        }

        SUBCASE("Shape mismatch is raised before computation")
        {
            CHECK_THROWS_AS(chain.transform(torch::zeros({4, 3}, options)), ShapeError);
        }
    }
}
