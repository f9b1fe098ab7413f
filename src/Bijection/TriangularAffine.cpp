#include<cmath>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Bijection/TriangularAffine.hpp"
#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        int64_t checkedDimension(const torch::Tensor &arr)
        {
            if (arr.dim() != 2 || arr.size(0) != arr.size(1))
            {
                throw std::invalid_argument(fmt::format(
                    "TriangularAffine expects a square matrix; got shape {}.", shapeToString(arr.sizes().vec())));
            }
            return arr.size(0);
        }
    }

    TriangularAffine::TriangularAffine(const torch::Tensor &loc, const torch::Tensor &arr) :
        Bijection({checkedDimension(arr)}, std::nullopt)
    {
        auto dim = eventShape[0];
        if (!torch::equal(arr, torch::tril(arr)))
        {
            throw std::invalid_argument("TriangularAffine expects a lower triangular matrix.");
        }
        auto diagonal = torch::diagonal(arr);
        if (!(diagonal > 0).all().item<bool>())
        {
            throw std::invalid_argument("TriangularAffine expects a strictly positive diagonal.");
        }
        if (loc.dim() > 1 || (loc.dim() == 1 && loc.size(0) != dim && loc.size(0) != 1))
        {
            throw std::invalid_argument(fmt::format(
                "loc of shape {} does not broadcast to ({},).", shapeToString(loc.sizes().vec()), dim));
        }

        this->loc = register_parameter("loc", loc.detach().to(arr.dtype()).expand({dim}).clone());
        lower = register_parameter("lower", torch::tril(arr.detach(), -1).clone());
        logDiagonal = register_parameter("logDiagonal", torch::log(diagonal.detach()).clone());
    }

    torch::Tensor TriangularAffine::getMatrix() const
    {
        return torch::tril(lower, -1) + torch::diag_embed(torch::exp(logDiagonal));
    }

    std::pair<torch::Tensor, torch::Tensor> TriangularAffine::transformAndLogDet(const torch::Tensor &x,
                                                                                 const torch::Tensor &condition)
    {
        checkShapes(x, condition);
        auto y = torch::matmul(x, getMatrix().t()) + loc;
        return {y, expandToBatch(logDiagonal.sum(), x)};
    }

    std::pair<torch::Tensor, torch::Tensor> TriangularAffine::inverseAndLogDet(const torch::Tensor &y,
                                                                               const torch::Tensor &condition)
    {
        checkShapes(y, condition);
        auto centred = (y - loc).unsqueeze(-1);
        auto x = torch::linalg_solve_triangular(getMatrix(), centred, /*upper=*/false).squeeze(-1);
        return {x, expandToBatch(-logDiagonal.sum(), y)};
    }

    TEST_CASE("TriangularAffine")
    {
        auto options = defaultOptions();
        auto arr = torch::tensor({2.0, 0.0, 0.0,
                                  -1.0, 0.5, 0.0,
                                  0.3, 1.2, 3.0}, options).view({3, 3});
        auto loc = torch::tensor({1.0, 2.0, 3.0}, options);
        TriangularAffine bijection(loc, arr);
        auto x = torch::randn({6, 3}, Key(0).generator(), options);

        SUBCASE("Matrix is reconstructed exactly")
        {
            CHECK(torch::allclose(bijection.getMatrix(), arr));
        }

        SUBCASE("Forward is a matrix vector product")
        {
            auto [y, logDet] = bijection.transformAndLogDet(x);
            CHECK(torch::allclose(y, torch::matmul(x, arr.t()) + loc));
            CHECK(logDet[0].item().toDouble() == doctest::Approx(std::log(2.0 * 0.5 * 3.0)));
        }

        SUBCASE("Inverse undoes forward")
        {
            auto [y, logDet] = bijection.transformAndLogDet(x);
            auto [z, inverseLogDet] = bijection.inverseAndLogDet(y);
            CHECK(torch::allclose(z, x, 1e-8, 1e-10));
            CHECK(torch::allclose(inverseLogDet, -logDet));
        }

        SUBCASE("Scalar loc is broadcast")
        {
            TriangularAffine scalarLoc(torch::tensor(1.0, options), arr);
            CHECK(torch::allclose(scalarLoc.getLoc(), torch::ones({3}, options)));
        }

        SUBCASE("Invalid matrices are rejected")
        {
            CHECK_THROWS_AS(TriangularAffine(loc, arr.t()), std::invalid_argument);
            CHECK_THROWS_AS(TriangularAffine(loc, -arr), std::invalid_argument);
            CHECK_THROWS_AS(TriangularAffine(loc, torch::ones({3, 2}, options)), std::invalid_argument);
            CHECK_THROWS_AS(TriangularAffine(torch::zeros({2}, options), arr), std::invalid_argument);
        }
    }
}
