#pragma once

#ifndef TORCHFLOWS_ERRORS_HPP
#define TORCHFLOWS_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace TorchFlows
{
    /**
     * @brief Raised when the trailing dimensions of an input disagree with a declared
     *        shape or conditioning shape.
     *
     * Raised before any computation takes place.
     */
    class ShapeError : public std::invalid_argument
    {
    public:
        explicit ShapeError(const std::string &message) : std::invalid_argument(message) {}
    };

    /**
     * @brief Raised by operations a bijection deliberately does not provide,
     *        e.g. inverting a block autoregressive network.
     */
    class NotImplementedError : public std::logic_error
    {
    public:
        explicit NotImplementedError(const std::string &message) : std::logic_error(message) {}
    };
}

#endif //TORCHFLOWS_ERRORS_HPP
