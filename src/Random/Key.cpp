#include<set>
#include<stdexcept>

#include<ATen/CPUGeneratorImpl.h>
#include<torch/torch.h>

#include"../../include/Random/Key.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    namespace
    {
        // splitmix64 finaliser.
        uint64_t mix(uint64_t value)
        {
            value += 0x9E3779B97F4A7C15ULL;
            value = (value ^ (value >> 30)) * 0xBF58476D1CE4E5B9ULL;
            value = (value ^ (value >> 27)) * 0x94D049BB133111EBULL;
            return value ^ (value >> 31);
        }
    }

    Key::Key(uint64_t seed) : seed(seed) {}

    std::vector<Key> Key::split(int64_t n) const
    {
        if (n < 0)
        {
            throw std::invalid_argument("Cannot split a key into a negative number of keys.");
        }
        std::vector<Key> keys;
        keys.reserve(n);
        auto root = mix(seed);
        for (int64_t i = 0; i < n; ++i)
        {
            keys.emplace_back(mix(root ^ mix(static_cast<uint64_t>(i) + 1)));
        }
        return keys;
    }

    std::pair<Key, Key> Key::split() const
    {
        auto keys = split(2);
        return {keys[0], keys[1]};
    }

    at::Generator Key::generator() const
    {
        return at::make_generator<at::CPUGeneratorImpl>(seed);
    }

    TEST_CASE("Key")
    {
        Key key(0);

        SUBCASE("split() is deterministic")
        {
            auto first = key.split(5);
            auto second = key.split(5);
            CHECK(first == second);
        }

        SUBCASE("split() children are distinct from each other and the parent")
        {
            std::set<uint64_t> seen{key.data()};
            for (const auto &child : key.split(100))
            {
                seen.insert(child.data());
            }
            CHECK(seen.size() == 101);
        }

        SUBCASE("split() prefix is stable")
        {
            auto few = key.split(3);
            auto many = key.split(10);
            CHECK(few[2] == many[2]);
        }

        SUBCASE("Same key reproduces the same draws")
        {
            auto a = torch::randn({4}, key.generator(), torch::kFloat64);
            auto b = torch::randn({4}, key.generator(), torch::kFloat64);
            CHECK(torch::equal(a, b));
        }

        SUBCASE("Different keys give different draws")
        {
            auto [first, second] = key.split();
            auto a = torch::randn({4}, first.generator(), torch::kFloat64);
            auto b = torch::randn({4}, second.generator(), torch::kFloat64);
            CHECK_FALSE(torch::equal(a, b));
        }

        SUBCASE("Negative split throws")
        {
            CHECK_THROWS_AS(key.split(-1), std::invalid_argument);
        }
    }
}
