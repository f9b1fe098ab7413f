#include<cmath>
#include<limits>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Distribution/Standard.hpp"
#include"../../include/Errors.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        const double logSqrtTwoPi = 0.5 * std::log(2 * M_PI);

        torch::Tensor negativeInfinityLike(const torch::Tensor &tensor)
        {
            return torch::full({}, -std::numeric_limits<double>::infinity(), tensor.options());
        }

        double smallestNormal(torch::ScalarType type)
        {
            return type == torch::kFloat64 ? std::numeric_limits<double>::min() : std::numeric_limits<float>::min();
        }

        double machineEpsilon(torch::ScalarType type)
        {
            return type == torch::kFloat64 ? std::numeric_limits<double>::epsilon()
                                           : std::numeric_limits<float>::epsilon();
        }

        /// Gumbel draw from U[0, 1); zero is lifted to the smallest normal number.
        torch::Tensor gumbelFromUniform(const torch::Tensor &uniform)
        {
            auto open = uniform.clamp_min(smallestNormal(uniform.scalar_type()));
            return -torch::log(-torch::log(open));
        }

        /// Laplace draw from U[0, 1); inputs below epsilon are lifted so that |u - 1/2| < 1/2.
        torch::Tensor laplaceFromUniform(const torch::Tensor &uniform)
        {
            auto centred = uniform.clamp_min(machineEpsilon(uniform.scalar_type())) - 0.5;
            return -torch::sign(centred) * torch::log1p(-2 * centred.abs());
        }
    }

    StandardDistribution::StandardDistribution(Shape shape, torch::TensorOptions options) :
        Distribution(std::move(shape), std::nullopt),
        options(options)
    {
    }

    torch::Tensor StandardDistribution::uniformFlat(const std::vector<Key> &keys) const
    {
        std::vector<torch::Tensor> draws;
        draws.reserve(keys.size());
        for (const auto &key : keys)
        {
            draws.push_back(torch::rand(eventShape, key.generator(), options));
        }
        return torch::stack(draws);
    }

    torch::Tensor StandardDistribution::normalFlat(const std::vector<Key> &keys) const
    {
        std::vector<torch::Tensor> draws;
        draws.reserve(keys.size());
        for (const auto &key : keys)
        {
            draws.push_back(torch::randn(eventShape, key.generator(), options));
        }
        return torch::stack(draws);
    }

    torch::TensorOptions StandardDistribution::sampleOptions() const
    {
        return options;
    }

    torch::Tensor StandardDistribution::sumEvent(const torch::Tensor &logDensities) const
    {
        return sumTrailing(logDensities, static_cast<int64_t>(eventShape.size()));
    }

    StandardNormal::StandardNormal(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardNormal::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return sumEvent(-0.5 * x.square() - logSqrtTwoPi);
    }

    torch::Tensor StandardNormal::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return normalFlat(keys);
    }

    StandardUniform::StandardUniform(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardUniform::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        auto inside = torch::logical_and(x >= 0, x <= 1);
        return sumEvent(torch::where(inside, torch::zeros_like(x), negativeInfinityLike(x)));
    }

    torch::Tensor StandardUniform::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return uniformFlat(keys);
    }

    StandardGumbel::StandardGumbel(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardGumbel::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return sumEvent(-(x + torch::exp(-x)));
    }

    torch::Tensor StandardGumbel::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return gumbelFromUniform(uniformFlat(keys));
    }

    StandardCauchy::StandardCauchy(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardCauchy::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return sumEvent(-std::log(M_PI) - torch::log1p(x.square()));
    }

    torch::Tensor StandardCauchy::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return torch::tan(M_PI * (uniformFlat(keys) - 0.5));
    }

    StandardLaplace::StandardLaplace(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardLaplace::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return sumEvent(-std::log(2.0) - x.abs());
    }

    torch::Tensor StandardLaplace::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return laplaceFromUniform(uniformFlat(keys));
    }

    StandardExponential::StandardExponential(Shape shape, torch::TensorOptions options) :
        StandardDistribution(std::move(shape), options)
    {
    }

    torch::Tensor StandardExponential::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        return sumEvent(torch::where(x >= 0, -x, negativeInfinityLike(x)));
    }

    torch::Tensor StandardExponential::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        return -torch::log1p(-uniformFlat(keys));
    }

    StandardStudentT::StandardStudentT(const torch::Tensor &df) :
        StandardDistribution(df.sizes().vec(), df.options())
    {
        if (!(df > 0).all().item<bool>())
        {
            throw std::invalid_argument("degrees of freedom values must be positive.");
        }
        logDf = register_parameter("logDf", torch::log(df.detach()).clone());
    }

    torch::Tensor StandardStudentT::logProbabilityFlat(const torch::Tensor &x, const torch::Tensor &)
    {
        auto df = getDf();
        auto normaliser = torch::lgamma((df + 1) / 2) - torch::lgamma(df / 2) - 0.5 * torch::log(df * M_PI);
        return sumEvent(normaliser - (df + 1) / 2 * torch::log1p(x.square() / df));
    }

    torch::Tensor StandardStudentT::sampleFlat(const std::vector<Key> &keys, const torch::Tensor &)
    {
        auto halfDf = getDf() / 2;
        std::vector<torch::Tensor> draws;
        draws.reserve(keys.size());
        for (const auto &key : keys)
        {
            auto generator = key.generator();
            auto normal = torch::randn(eventShape, generator, options);
            auto gamma = torch::_standard_gamma(halfDf, generator);
            draws.push_back(normal * torch::sqrt(halfDf / gamma));
        }
        return torch::stack(draws);
    }

    TEST_CASE("StandardNormal")
    {
        StandardNormal normal(Shape{2});

        SUBCASE("Log density matches the closed form")
        {
            auto x = torch::tensor({{0.0, 0.0}, {1.0, -2.0}}, defaultOptions());
            auto logProbabilities = normal.logProbability(x);
            CHECK(logProbabilities[0].item<double>() == doctest::Approx(-std::log(2 * M_PI)));
            CHECK(logProbabilities[1].item<double>() == doctest::Approx(-std::log(2 * M_PI) - 2.5));
        }

        SUBCASE("Same key reproduces the same draws")
        {
            CHECK(torch::equal(normal.sample(Key(3), {5}), normal.sample(Key(3), {5})));
            CHECK_FALSE(torch::equal(normal.sample(Key(3), {5}), normal.sample(Key(4), {5})));
        }

        SUBCASE("Every sampled element uses its own stream")
        {
            auto samples = normal.sample(Key(0), {2});
            CHECK_FALSE(torch::equal(samples[0], samples[1]));
        }

        SUBCASE("Samples use the requested options")
        {
            StandardNormal single(Shape{3}, torch::TensorOptions().dtype(torch::kFloat32));
            CHECK(single.sample(Key(0), {4}).dtype() == torch::kFloat32);
        }
    }

    TEST_CASE("StandardUniform")
    {
        StandardUniform uniform(Shape{3});

        SUBCASE("Samples lie in the unit interval")
        {
            auto samples = uniform.sample(Key(1), {200});
            CHECK(samples.min().item<double>() >= 0);
            CHECK(samples.max().item<double>() < 1);
            CHECK(samples.mean().item<double>() == doctest::Approx(0.5).epsilon(0.1));
        }

        SUBCASE("Log density is zero inside and -inf outside the support")
        {
            auto x = torch::tensor({{0.2, 0.5, 0.9}, {0.2, 1.5, 0.9}}, defaultOptions());
            auto logProbabilities = uniform.logProbability(x);
            CHECK(logProbabilities[0].item<double>() == doctest::Approx(0.0));
            CHECK(std::isinf(logProbabilities[1].item<double>()));
            CHECK(logProbabilities[1].item<double>() < 0);
        }
    }

    TEST_CASE("StandardGumbel, StandardCauchy and StandardLaplace")
    {
        auto x = torch::tensor({0.7}, defaultOptions());

        SUBCASE("Gumbel log density")
        {
            StandardGumbel gumbel;
            CHECK(gumbel.logProbability(x)[0].item<double>() == doctest::Approx(-(0.7 + std::exp(-0.7))));
        }

        SUBCASE("Cauchy log density")
        {
            StandardCauchy cauchy;
            CHECK(cauchy.logProbability(x)[0].item<double>() == doctest::Approx(-std::log(M_PI * (1 + 0.49))));
        }

        SUBCASE("Laplace log density")
        {
            StandardLaplace laplace;
            CHECK(laplace.logProbability(-x)[0].item<double>() == doctest::Approx(-std::log(2.0) - 0.7));
        }

        SUBCASE("A zero uniform draw still gives finite samples and densities")
        {
            for (auto type : {torch::kFloat32, torch::kFloat64})
            {
                INFO("dtype: " << type);
                auto zero = torch::zeros({1}, torch::TensorOptions().dtype(type));
                auto gumbelSample = gumbelFromUniform(zero);
                auto laplaceSample = laplaceFromUniform(zero);
                CHECK(torch::isfinite(gumbelSample).all().item<bool>());
                CHECK(torch::isfinite(laplaceSample).all().item<bool>());
                CHECK(torch::isfinite(StandardGumbel({}, zero.options()).logProbability(gumbelSample)).all().item<bool>());
                CHECK(torch::isfinite(StandardLaplace({}, zero.options()).logProbability(laplaceSample)).all().item<bool>());
            }
        }

        SUBCASE("Samples are finite")
        {
            StandardGumbel gumbel(Shape{2});
            StandardCauchy cauchy(Shape{2});
            StandardLaplace laplace(Shape{2});
            CHECK(torch::isfinite(gumbel.sample(Key(2), {50})).all().item<bool>());
            CHECK(torch::isfinite(cauchy.sample(Key(2), {50})).all().item<bool>());
            CHECK(torch::isfinite(laplace.sample(Key(2), {50})).all().item<bool>());
        }
    }

    TEST_CASE("StandardExponential")
    {
        StandardExponential exponential(Shape{2});

        auto samples = exponential.sample(Key(8), {100});
        CHECK(samples.min().item<double>() >= 0);
        CHECK(torch::isfinite(exponential.logProbability(samples)).all().item<bool>());

        auto x = torch::tensor({{1.0, 2.0}, {-1.0, 2.0}}, defaultOptions());
        auto logProbabilities = exponential.logProbability(x);
        CHECK(logProbabilities[0].item<double>() == doctest::Approx(-3.0));
        CHECK(std::isinf(logProbabilities[1].item<double>()));
    }

    TEST_CASE("StandardStudentT")
    {
        auto df = torch::tensor({1.0, 4.0}, defaultOptions());
        StandardStudentT studentT(df);

        SUBCASE("Shape follows the degrees of freedom")
        {
            CHECK(studentT.shape() == Shape{2});
            CHECK(torch::allclose(studentT.getDf(), df));
        }

        SUBCASE("Log density matches the closed form")
        {
            // df = 1 is the Cauchy distribution; df = 4 at zero gives 3 / 8.
            auto x = torch::tensor({0.5, 0.0}, defaultOptions());
            auto expected = -std::log(M_PI * 1.25) + std::log(3.0 / 8.0);
            CHECK(studentT.logProbability(x).item<double>() == doctest::Approx(expected));
        }

        SUBCASE("Samples have the expected shape")
        {
            auto samples = studentT.sample(Key(5), {7});
            CHECK(samples.sizes().vec() == std::vector<int64_t>{7, 2});
            CHECK(torch::isfinite(samples).all().item<bool>());
        }

        SUBCASE("Non-positive degrees of freedom are rejected")
        {
            CHECK_THROWS_AS(StandardStudentT(torch::tensor({1.0, 0.0})), std::invalid_argument);
        }
    }
}
