#include<cmath>
#include<memory>
#include<stdexcept>

#include<fmt/format.h>
#include<torch/torch.h>

#include"../../include/Bijection/Affine.hpp"
#include"../../include/Bijection/Chain.hpp"
#include"../../include/Bijection/Exp.hpp"
#include"../../include/Bijection/TriangularAffine.hpp"
#include"../../include/Distribution/Normal.hpp"
#include"../../include/Distribution/Standard.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        Shape broadcastShape(const torch::Tensor &loc, const torch::Tensor &scale)
        {
            return broadcastShapes(loc.sizes().vec(), scale.sizes().vec());
        }

        std::shared_ptr<Chain> affineThenExp(const torch::Tensor &loc, const torch::Tensor &scale)
        {
            return std::make_shared<Chain>(std::vector<std::shared_ptr<Bijection>>{
                std::make_shared<Affine>(loc, scale),
                std::make_shared<Exp>(broadcastShape(loc, scale))});
        }

        int64_t checkedDimension(const torch::Tensor &covariance)
        {
            if (covariance.dim() != 2 || covariance.size(0) != covariance.size(1))
            {
                throw std::invalid_argument(fmt::format("Covariance must be a square matrix; got shape {}.",
                                                        shapeToString(covariance.sizes().vec())));
            }
            return covariance.size(0);
        }

        torch::Tensor choleskyFactor(const torch::Tensor &covariance)
        {
            checkedDimension(covariance);
            if (!torch::allclose(covariance, covariance.t()))
            {
                throw std::invalid_argument("Covariance must be symmetric.");
            }
            try
            {
                return torch::linalg_cholesky(covariance.detach());
            }
            catch (const c10::Error &)
            {
                throw std::invalid_argument("Covariance must be positive definite.");
            }
        }
    }

    Normal::Normal(const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(std::make_shared<StandardNormal>(broadcastShape(loc, scale), loc.options()),
                    std::make_shared<Affine>(loc, scale))
    {
    }

    Normal::Normal(double loc, double scale) :
        Normal(torch::tensor(loc, defaultOptions()), torch::tensor(scale, defaultOptions()))
    {
    }

    torch::Tensor Normal::getLoc() const
    {
        return std::static_pointer_cast<Affine>(getBijection())->getLoc();
    }

    torch::Tensor Normal::getScale() const
    {
        return std::static_pointer_cast<Affine>(getBijection())->getScale();
    }

    LogNormal::LogNormal(const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(std::make_shared<StandardNormal>(broadcastShape(loc, scale), loc.options()),
                    affineThenExp(loc, scale))
    {
    }

    LogNormal::LogNormal(double loc, double scale) :
        LogNormal(torch::tensor(loc, defaultOptions()), torch::tensor(scale, defaultOptions()))
    {
    }

    torch::Tensor LogNormal::getLoc() const
    {
        auto &chain = static_cast<const Chain &>(*getBijection());
        return std::static_pointer_cast<Affine>(chain[0])->getLoc();
    }

    torch::Tensor LogNormal::getScale() const
    {
        auto &chain = static_cast<const Chain &>(*getBijection());
        return std::static_pointer_cast<Affine>(chain[0])->getScale();
    }

    MultivariateNormal::MultivariateNormal(const torch::Tensor &loc, const torch::Tensor &covariance) :
        Transformed(std::make_shared<StandardNormal>(Shape{checkedDimension(covariance)}, covariance.options()),
                    std::make_shared<TriangularAffine>(loc, choleskyFactor(covariance)))
    {
    }

    torch::Tensor MultivariateNormal::getLoc() const
    {
        return std::static_pointer_cast<TriangularAffine>(getBijection())->getLoc();
    }

    torch::Tensor MultivariateNormal::getCovariance() const
    {
        auto factor = std::static_pointer_cast<TriangularAffine>(getBijection())->getMatrix();
        return torch::matmul(factor, factor.t());
    }

    TEST_CASE("Normal")
    {
        SUBCASE("Samples of a standard normal have zero mean and unit variance")
        {
            Normal normal(0.0, 1.0);
            auto samples = normal.sample(Key(0), {1000});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{1000});
            CHECK(samples.mean().item<double>() == doctest::Approx(0.0).epsilon(0.1));
            CHECK(samples.var().item<double>() == doctest::Approx(1.0).epsilon(0.1));
        }

        SUBCASE("Log density matches the closed form")
        {
            auto options = defaultOptions();
            Normal normal(torch::tensor({1.0, -2.0}, options), torch::tensor({2.0, 0.5}, options));
            CHECK(normal.shape() == Shape{2});
            auto x = torch::tensor({0.0, -2.0}, options);
            auto expected = -std::log(2 * M_PI) - std::log(2.0 * 0.5) - 0.5 * 0.25;
            CHECK(normal.logProbability(x).item<double>() == doctest::Approx(expected));
        }

        SUBCASE("loc and scale broadcast")
        {
            Normal normal(torch::zeros({3}, defaultOptions()), torch::tensor(2.0, defaultOptions()));
            CHECK(normal.shape() == Shape{3});
            CHECK(torch::allclose(normal.getScale(), torch::full({3}, 2.0, defaultOptions())));
        }

        SUBCASE("Non-positive scale is rejected")
        {
            CHECK_THROWS_AS(Normal(0.0, -1.0), std::invalid_argument);
        }
    }

    TEST_CASE("LogNormal")
    {
        LogNormal logNormal(0.5, 0.8);

        SUBCASE("Samples are positive")
        {
            CHECK(logNormal.sample(Key(4), {100}).min().item<double>() > 0);
        }

        SUBCASE("Log density matches the closed form")
        {
            auto x = 2.0;
            auto z = (std::log(x) - 0.5) / 0.8;
            auto expected = -0.5 * z * z - 0.5 * std::log(2 * M_PI) - std::log(0.8) - std::log(x);
            CHECK(logNormal.logProbability(torch::tensor(x, defaultOptions())).item<double>()
                  == doctest::Approx(expected));
        }

        SUBCASE("Negative values have zero density")
        {
            auto logProbability = logNormal.logProbability(torch::tensor(-1.0, defaultOptions())).item<double>();
            CHECK(std::isinf(logProbability));
            CHECK(logProbability < 0);
        }

        SUBCASE("Parameters are exposed")
        {
            CHECK(logNormal.getLoc().item<double>() == doctest::Approx(0.5));
            CHECK(logNormal.getScale().item<double>() == doctest::Approx(0.8));
        }
    }

    TEST_CASE("MultivariateNormal")
    {
        auto options = defaultOptions();
        auto loc = torch::tensor({1.0, 2.0}, options);
        auto covariance = torch::tensor({2.0, 0.6, 0.6, 1.0}, options).view({2, 2});
        MultivariateNormal normal(loc, covariance);

        SUBCASE("Log density at the mean equals the closed form")
        {
            auto factor = torch::linalg_cholesky(covariance);
            auto expected = -std::log(2 * M_PI) - torch::log(torch::diagonal(factor)).sum().item<double>();
            CHECK(normal.logProbability(loc).item<double>() == doctest::Approx(expected));
            CHECK(expected == doctest::Approx(-std::log(2 * M_PI) - 0.5 * std::log(1.64)));
        }

        SUBCASE("Covariance is recovered from the factor")
        {
            CHECK(torch::allclose(normal.getCovariance(), covariance));
            CHECK(torch::allclose(normal.getLoc(), loc));
        }

        SUBCASE("Sample covariance approaches the covariance")
        {
            auto samples = normal.sample(Key(11), {4000});
            auto centred = samples - samples.mean(0);
            auto empirical = torch::matmul(centred.t(), centred) / 3999;
            CHECK(torch::allclose(empirical, covariance, 0.1, 0.1));
        }

        SUBCASE("Invalid covariances are rejected")
        {
            CHECK_THROWS_AS(MultivariateNormal(loc, torch::ones({2, 3}, options)), std::invalid_argument);
            CHECK_THROWS_AS(MultivariateNormal(loc, torch::tensor(1.0, options)), std::invalid_argument);
            CHECK_THROWS_AS(MultivariateNormal(loc, torch::ones({2}, options)), std::invalid_argument);
            CHECK_THROWS_AS(MultivariateNormal(loc, torch::tensor({1.0, 0.5, 0.0, 1.0}, options).view({2, 2})),
                            std::invalid_argument);
            CHECK_THROWS_AS(MultivariateNormal(loc, torch::tensor({1.0, 2.0, 2.0, 1.0}, options).view({2, 2})),
                            std::invalid_argument);
        }
    }
}
