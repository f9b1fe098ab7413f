#pragma once

#ifndef TORCHFLOWS_KEY_HPP
#define TORCHFLOWS_KEY_HPP

#include<cstdint>
#include<utility>
#include<vector>

#include<ATen/core/Generator.h>

namespace TorchFlows
{
    /**
     * @class Key
     * @brief Explicit, stateless, splittable random seed.
     *
     * Every operation that needs randomness takes a Key instead of touching a global
     * generator. A key always reproduces the same draws, and the children returned by
     * split() are derived deterministically so that each can seed an independent stream.
     *
     * Draws are made by handing generator() to the LibTorch factory functions, e.g.
     * `torch::randn(shape, key.generator(), options)`.
     */
    class Key
    {
    private:
        uint64_t seed; ///< Raw 64 bit key material
    public:
        explicit Key(uint64_t seed);

        /**
         * @brief Splits the key into `n` child keys.
         *
         * Child `i` is a function of the parent and `i` only, so splitting the same key
         * twice returns the same children.
         *
         * @param n Number of children (n >= 0).
         * @throws std::invalid_argument if n is negative.
         */
        std::vector<Key> split(int64_t n) const;

        /**
         * @brief Splits into two children, the usual "key, subkey" idiom.
         */
        std::pair<Key, Key> split() const;

        /**
         * @brief Creates a fresh CPU generator seeded from this key.
         */
        at::Generator generator() const;

        inline uint64_t data() const
        {
            return seed;
        }

        inline bool operator==(const Key &other) const
        {
            return seed == other.seed;
        }

        inline bool operator!=(const Key &other) const
        {
            return seed != other.seed;
        }
    };
}

#endif //TORCHFLOWS_KEY_HPP
