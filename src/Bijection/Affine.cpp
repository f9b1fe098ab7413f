#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Bijection/Affine.hpp"
#include"../../include/Errors.hpp"
#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        torch::Tensor checkedLogScale(const torch::Tensor &scale)
        {
            if (!(scale > 0).all().item<bool>())
            {
                throw std::invalid_argument("scale must be strictly positive.");
            }
            return torch::log(scale);
        }

        Shape broadcastShape(const torch::Tensor &first, const torch::Tensor &second)
        {
            return broadcastShapes(first.sizes().vec(), second.sizes().vec());
        }
    }

    Affine::Affine(const torch::Tensor &loc, const torch::Tensor &scale) :
        Bijection(broadcastShape(loc, scale), std::nullopt)
    {
        auto broadcasted = torch::broadcast_tensors({loc, scale});
        this->loc = register_parameter("loc", broadcasted[0].detach().clone());
        this->logScale = register_parameter("logScale", checkedLogScale(broadcasted[1].detach()).clone());
    }

    Affine::Affine(double loc, double scale) :
        Affine(torch::tensor(loc, defaultOptions()), torch::tensor(scale, defaultOptions()))
    {
    }

    torch::Tensor Affine::transform(const torch::Tensor &x, const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        return x * torch::exp(logScale) + loc;
    }

    std::pair<torch::Tensor, torch::Tensor> Affine::transformAndLogDet(const torch::Tensor &x,
                                                                       const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        return {x * torch::exp(logScale) + loc, expandToBatch(logScale.sum(), x)};
    }

    torch::Tensor Affine::inverse(const torch::Tensor &y, const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        return (y - loc) / torch::exp(logScale);
    }

    std::pair<torch::Tensor, torch::Tensor> Affine::inverseAndLogDet(const torch::Tensor &y,
                                                                     const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        return {(y - loc) / torch::exp(logScale), expandToBatch(-logScale.sum(), y)};
    }

    Scale::Scale(const torch::Tensor &scale) :
        Bijection(scale.sizes().vec(), std::nullopt)
    {
        logScale = register_parameter("logScale", checkedLogScale(scale.detach()).clone());
    }

    std::pair<torch::Tensor, torch::Tensor> Scale::transformAndLogDet(const torch::Tensor &x,
                                                                      const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        return {x * torch::exp(logScale), expandToBatch(logScale.sum(), x)};
    }

    std::pair<torch::Tensor, torch::Tensor> Scale::inverseAndLogDet(const torch::Tensor &y,
                                                                    const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        return {y / torch::exp(logScale), expandToBatch(-logScale.sum(), y)};
    }

    TEST_CASE("Affine")
    {
        auto loc = torch::tensor({1.0, -2.0, 0.5}, defaultOptions());
        auto scale = torch::tensor({2.0, 0.5, 3.0}, defaultOptions());
        Affine affine(loc, scale);
        auto x = torch::randn({4, 3}, Key(0).generator(), defaultOptions());

        SUBCASE("Shape is the broadcast shape of loc and scale")
        {
            CHECK(affine.shape() == Shape{3});
            CHECK(Affine(torch::zeros({2, 1}), torch::ones({3})).shape() == Shape{2, 3});
            CHECK_FALSE(affine.condShape().has_value());
        }

        SUBCASE("transform() scales and shifts")
        {
            CHECK(torch::allclose(affine.transform(x), x * scale + loc));
        }

        SUBCASE("Log determinant is the sum of log scales for every batch element")
        {
            auto [y, logDet] = affine.transformAndLogDet(x);
            CHECK(logDet.sizes().vec() == std::vector<int64_t>{4});
            CHECK(logDet[2].item().toDouble() == doctest::Approx(std::log(3.0)));
        }

        SUBCASE("inverse() undoes transform()")
        {
            auto [z, logDet] = affine.inverseAndLogDet(affine.transform(x));
            CHECK(torch::allclose(z, x));
            CHECK(logDet[0].item().toDouble() == doctest::Approx(-std::log(3.0)));
        }

        SUBCASE("Scalar affine broadcasts over any batch")
        {
            Affine scalar(1.0, 2.0);
            CHECK(scalar.shape().empty());
            auto [y, logDet] = scalar.transformAndLogDet(torch::zeros({2, 5}, defaultOptions()));
            CHECK(y.sizes().vec() == std::vector<int64_t>{2, 5});
            CHECK(logDet.sizes().vec() == std::vector<int64_t>{2, 5});
        }

        SUBCASE("Non-positive scale is rejected")
        {
            CHECK_THROWS_AS(Affine(0.0, 0.0), std::invalid_argument);
            CHECK_THROWS_AS(Affine(loc, -scale), std::invalid_argument);
        }

        SUBCASE("Mismatched input shape is rejected")
        {
            CHECK_THROWS_AS(affine.transform(torch::zeros({4, 2}, defaultOptions())), ShapeError);
        }

        SUBCASE("Parameters are trainable")
        {
            CHECK(affine.parameters().size() == 2);
            auto [y, logDet] = affine.transformAndLogDet(x);
            (y.sum() + logDet.sum()).backward();
            for (const auto &parameter : affine.parameters())
            {
                CHECK(parameter.grad().defined());
            }
        }
    }

    TEST_CASE("Scale")
    {
        Scale scale(torch::tensor({0.5, 4.0}, defaultOptions()));
        auto x = torch::randn({3, 2}, Key(1).generator(), defaultOptions());

        auto [y, logDet] = scale.transformAndLogDet(x);
        CHECK(torch::allclose(y, x * torch::tensor({0.5, 4.0}, defaultOptions())));
        CHECK(logDet[0].item().toDouble() == doctest::Approx(std::log(2.0)));

        auto [z, inverseLogDet] = scale.inverseAndLogDet(y);
        CHECK(torch::allclose(z, x));
        CHECK(torch::allclose(inverseLogDet, -logDet));

        CHECK_THROWS_AS(Scale(torch::tensor({1.0, 0.0}, defaultOptions())), std::invalid_argument);
    }
}
