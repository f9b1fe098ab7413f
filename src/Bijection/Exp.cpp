#include<torch/torch.h>

#include"../../include/Bijection/Exp.hpp"
#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    Exp::Exp(Shape shape) : Bijection(std::move(shape), std::nullopt) {}

    std::pair<torch::Tensor, torch::Tensor> Exp::transformAndLogDet(const torch::Tensor &x,
                                                                    const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        auto ndim = static_cast<int64_t>(eventShape.size());
        return {torch::exp(x), sumTrailing(x, ndim)};
    }

    std::pair<torch::Tensor, torch::Tensor> Exp::inverseAndLogDet(const torch::Tensor &y,
                                                                  const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        auto ndim = static_cast<int64_t>(eventShape.size());
        auto x = torch::log(y);
        return {x, -sumTrailing(x, ndim)};
    }

    TEST_CASE("Exp")
    {
        Exp bijection(Shape{2});
        auto x = torch::randn({5, 2}, Key(0).generator(), defaultOptions());

        SUBCASE("Forward and inverse round trip")
        {
            auto [y, logDet] = bijection.transformAndLogDet(x);
            CHECK(torch::allclose(y, x.exp()));
            CHECK(torch::allclose(logDet, x.sum(-1)));
            auto [z, inverseLogDet] = bijection.inverseAndLogDet(y);
            CHECK(torch::allclose(z, x));
            CHECK(torch::allclose(inverseLogDet, -logDet));
        }

        SUBCASE("Scalar shape keeps every element as a batch entry")
        {
            Exp scalar;
            auto [y, logDet] = scalar.transformAndLogDet(x);
            CHECK(logDet.sizes().vec() == std::vector<int64_t>{5, 2});
        }
    }
}
