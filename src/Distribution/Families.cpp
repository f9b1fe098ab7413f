#include<cmath>
#include<memory>
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Bijection/Affine.hpp"
#include"../../include/Distribution/Families.hpp"
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

        torch::Tensor checkedWidth(const torch::Tensor &minval, const torch::Tensor &maxval)
        {
            auto width = maxval - minval;
            if (!(width > 0).all().item<bool>())
            {
                throw std::invalid_argument("maxval must be greater than minval.");
            }
            return width;
        }

        torch::Tensor checkedInverseRate(const torch::Tensor &rate)
        {
            if (!(rate > 0).all().item<bool>())
            {
                throw std::invalid_argument("rate must be strictly positive.");
            }
            return 1 / rate;
        }

        std::shared_ptr<Affine> affineOf(const std::shared_ptr<Bijection> &bijection)
        {
            return std::static_pointer_cast<Affine>(bijection);
        }

        std::shared_ptr<StandardStudentT> studentTBase(const torch::Tensor &df,
                                                       const torch::Tensor &loc,
                                                       const torch::Tensor &scale)
        {
            return std::make_shared<StandardStudentT>(torch::broadcast_tensors({df, loc, scale})[0]);
        }

        std::shared_ptr<Affine> studentTAffine(const torch::Tensor &df,
                                               const torch::Tensor &loc,
                                               const torch::Tensor &scale)
        {
            auto broadcasted = torch::broadcast_tensors({df, loc, scale});
            return std::make_shared<Affine>(broadcasted[1], broadcasted[2]);
        }
    }

    Uniform::Uniform(const torch::Tensor &minval, const torch::Tensor &maxval) :
        Transformed(std::make_shared<StandardUniform>(broadcastShape(minval, maxval), minval.options()),
                    std::make_shared<Affine>(minval, checkedWidth(minval, maxval)))
    {
    }

    torch::Tensor Uniform::getMinval() const
    {
        return affineOf(getBijection())->getLoc();
    }

    torch::Tensor Uniform::getMaxval() const
    {
        auto affine = affineOf(getBijection());
        return affine->getLoc() + affine->getScale();
    }

    Gumbel::Gumbel(const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(std::make_shared<StandardGumbel>(broadcastShape(loc, scale), loc.options()),
                    std::make_shared<Affine>(loc, scale))
    {
    }

    torch::Tensor Gumbel::getLoc() const
    {
        return affineOf(getBijection())->getLoc();
    }

    torch::Tensor Gumbel::getScale() const
    {
        return affineOf(getBijection())->getScale();
    }

    Cauchy::Cauchy(const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(std::make_shared<StandardCauchy>(broadcastShape(loc, scale), loc.options()),
                    std::make_shared<Affine>(loc, scale))
    {
    }

    torch::Tensor Cauchy::getLoc() const
    {
        return affineOf(getBijection())->getLoc();
    }

    torch::Tensor Cauchy::getScale() const
    {
        return affineOf(getBijection())->getScale();
    }

    StudentT::StudentT(const torch::Tensor &df, const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(studentTBase(df, loc, scale), studentTAffine(df, loc, scale))
    {
    }

    torch::Tensor StudentT::getDf() const
    {
        return std::static_pointer_cast<StandardStudentT>(getBase())->getDf();
    }

    torch::Tensor StudentT::getLoc() const
    {
        return affineOf(getBijection())->getLoc();
    }

    torch::Tensor StudentT::getScale() const
    {
        return affineOf(getBijection())->getScale();
    }

    Laplace::Laplace(const torch::Tensor &loc, const torch::Tensor &scale) :
        Transformed(std::make_shared<StandardLaplace>(broadcastShape(loc, scale), loc.options()),
                    std::make_shared<Affine>(loc, scale))
    {
    }

    torch::Tensor Laplace::getLoc() const
    {
        return affineOf(getBijection())->getLoc();
    }

    torch::Tensor Laplace::getScale() const
    {
        return affineOf(getBijection())->getScale();
    }

    Exponential::Exponential(const torch::Tensor &rate) :
        Transformed(std::make_shared<StandardExponential>(rate.sizes().vec(), rate.options()),
                    std::make_shared<Scale>(checkedInverseRate(rate)))
    {
    }

    torch::Tensor Exponential::getRate() const
    {
        return 1 / std::static_pointer_cast<Scale>(getBijection())->getScale();
    }

    TEST_CASE("Uniform")
    {
        auto options = defaultOptions();
        Uniform uniform(torch::tensor({1.0, -1.0}, options), torch::tensor({3.0, 0.0}, options));

        SUBCASE("Log density is -log(width) on the support")
        {
            auto x = torch::tensor({2.0, -0.5}, options);
            CHECK(uniform.logProbability(x).item<double>() == doctest::Approx(-std::log(2.0)));
        }

        SUBCASE("Log density is -inf off the support")
        {
            auto x = torch::tensor({{3.5, -0.5}, {2.0, -1.5}}, options);
            auto logProbabilities = uniform.logProbability(x);
            CHECK(std::isinf(logProbabilities[0].item<double>()));
            CHECK(std::isinf(logProbabilities[1].item<double>()));
            CHECK_FALSE(torch::isnan(logProbabilities).any().item<bool>());
        }

        SUBCASE("Samples stay within the bounds")
        {
            auto samples = uniform.sample(Key(6), {100});
            CHECK((samples >= uniform.getMinval()).all().item<bool>());
            CHECK((samples <= uniform.getMaxval()).all().item<bool>());
            CHECK(torch::isfinite(uniform.logProbability(samples)).all().item<bool>());
        }

        SUBCASE("maxval must exceed minval")
        {
            CHECK_THROWS_AS(Uniform(torch::tensor({1.0}, options), torch::tensor({1.0}, options)),
                            std::invalid_argument);
        }
    }

    TEST_CASE("Gumbel, Cauchy and Laplace")
    {
        auto options = defaultOptions();
        auto loc = torch::tensor(1.0, options);
        auto scale = torch::tensor(2.0, options);
        auto x = torch::tensor(2.0, options);
        auto z = 0.5;

        SUBCASE("Gumbel log density")
        {
            Gumbel gumbel(loc, scale);
            auto expected = -(z + std::exp(-z)) - std::log(2.0);
            CHECK(gumbel.logProbability(x).item<double>() == doctest::Approx(expected));
        }

        SUBCASE("Cauchy log density")
        {
            Cauchy cauchy(loc, scale);
            auto expected = -std::log(M_PI * 2.0 * (1 + z * z));
            CHECK(cauchy.logProbability(x).item<double>() == doctest::Approx(expected));
        }

        SUBCASE("Laplace log density")
        {
            Laplace laplace(loc, scale);
            auto expected = -std::log(4.0) - z;
            CHECK(laplace.logProbability(x).item<double>() == doctest::Approx(expected));
            CHECK(torch::allclose(laplace.getLoc(), loc));
            CHECK(torch::allclose(laplace.getScale(), scale));
        }

        SUBCASE("Scales must be positive")
        {
            CHECK_THROWS_AS(Gumbel(loc, -scale), std::invalid_argument);
            CHECK_THROWS_AS(Cauchy(loc, torch::zeros_like(scale)), std::invalid_argument);
            CHECK_THROWS_AS(Laplace(loc, -scale), std::invalid_argument);
        }
    }

    TEST_CASE("StudentT")
    {
        auto options = defaultOptions();
        StudentT studentT(torch::tensor({1.0, 5.0}, options), torch::tensor(0.0, options), torch::tensor(2.0, options));

        SUBCASE("df, loc and scale broadcast together")
        {
            CHECK(studentT.shape() == Shape{2});
            CHECK(torch::allclose(studentT.getDf(), torch::tensor({1.0, 5.0}, options)));
            CHECK(torch::allclose(studentT.getScale(), torch::full({2}, 2.0, options)));
        }

        SUBCASE("df = 1 reduces to a Cauchy distribution")
        {
            StudentT single(torch::tensor(1.0, options), torch::tensor(1.0, options), torch::tensor(2.0, options));
            Cauchy cauchy(torch::tensor(1.0, options), torch::tensor(2.0, options));
            auto x = torch::linspace(-5, 5, 11, options);
            CHECK(torch::allclose(single.logProbability(x), cauchy.logProbability(x)));
        }

        SUBCASE("Non-positive degrees of freedom are rejected")
        {
            CHECK_THROWS_AS(StudentT(torch::tensor(-1.0, options), torch::tensor(0.0, options),
                                     torch::tensor(1.0, options)),
                            std::invalid_argument);
        }
    }

    TEST_CASE("Exponential")
    {
        auto options = defaultOptions();
        Exponential exponential(torch::tensor({2.0, 0.5}, options));

        SUBCASE("Log density matches the closed form")
        {
            auto x = torch::tensor({1.0, 4.0}, options);
            auto expected = std::log(2.0) - 2.0 + std::log(0.5) - 2.0;
            CHECK(exponential.logProbability(x).item<double>() == doctest::Approx(expected));
            CHECK(torch::allclose(exponential.getRate(), torch::tensor({2.0, 0.5}, options)));
        }

        SUBCASE("Negative values have zero density")
        {
            auto x = torch::tensor({-1.0, 4.0}, options);
            CHECK(std::isinf(exponential.logProbability(x).item<double>()));
        }

        SUBCASE("Non-positive rates are rejected")
        {
            CHECK_THROWS_AS(Exponential(torch::tensor({1.0, 0.0}, options)), std::invalid_argument);
        }
    }
}
