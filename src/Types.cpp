#include<algorithm>
#include<numeric>
#include<stdexcept>

#include<fmt/format.h>
#include<fmt/ranges.h>
#include<torch/torch.h>

#include"../include/Types.hpp"
#include"../include/Errors.hpp"

#include<doctest/doctest.h>

namespace TorchFlows
{
    std::string shapeToString(const Shape &shape)
    {
        if (shape.size() == 1)
        {
            return fmt::format("({},)", shape[0]);
        }
        return fmt::format("({})", fmt::join(shape, ", "));
    }

    std::string shapeToString(const OptionalShape &shape)
    {
        return shape ? shapeToString(*shape) : "None";
    }

    int64_t shapeNumel(const Shape &shape)
    {
        return std::accumulate(shape.begin(), shape.end(), int64_t{1}, std::multiplies<int64_t>());
    }

    Shape concatShapes(const Shape &leading, const Shape &trailing)
    {
        Shape output;
        output.reserve(leading.size() + trailing.size());
        output.insert(output.end(), leading.begin(), leading.end());
        output.insert(output.end(), trailing.begin(), trailing.end());
        return output;
    }

    void checkTrailingShape(const torch::Tensor &tensor, const Shape &expected, const std::string &name)
    {
        if (!tensor.defined())
        {
            throw ShapeError(fmt::format("Expected trailing dimensions matching {} for {}; got no tensor.",
                                         shapeToString(expected), name));
        }
        auto actual = tensor.sizes().vec();
        auto ndim = static_cast<int64_t>(expected.size());
        bool matches = static_cast<int64_t>(actual.size()) >= ndim &&
                       std::equal(expected.begin(), expected.end(), actual.end() - ndim);
        if (!matches)
        {
            throw ShapeError(fmt::format("Expected trailing dimensions matching {} for {}; got {}.",
                                         shapeToString(expected), name, shapeToString(actual)));
        }
    }

    Shape leadingShape(const torch::Tensor &tensor, const Shape &trailing)
    {
        auto sizes = tensor.sizes();
        return Shape(sizes.begin(), sizes.end() - static_cast<int64_t>(trailing.size()));
    }

    Shape broadcastShapes(const Shape &first, const Shape &second)
    {
        auto ndim = std::max(first.size(), second.size());
        Shape output(ndim, 1);
        for (size_t i = 0; i < ndim; ++i)
        {
            // Align from the right.
            int64_t a = i < first.size() ? first[first.size() - 1 - i] : 1;
            int64_t b = i < second.size() ? second[second.size() - 1 - i] : 1;
            if (a != b && a != 1 && b != 1)
            {
                throw ShapeError(fmt::format("Shapes {} and {} cannot be broadcast together.",
                                             shapeToString(first), shapeToString(second)));
            }
            output[ndim - 1 - i] = a == 1 ? b : a;
        }
        return output;
    }

    OptionalShape mergeConditionShapes(const std::vector<OptionalShape> &shapes)
    {
        OptionalShape merged;
        for (const auto &shape : shapes)
        {
            if (!shape)
            {
                continue;
            }
            if (merged && *merged != *shape)
            {
                throw std::invalid_argument(fmt::format(
                    "Conditioning shapes must match where provided; got {} and {}.",
                    shapeToString(*merged), shapeToString(*shape)));
            }
            merged = shape;
        }
        return merged;
    }

    torch::Tensor sumTrailing(const torch::Tensor &tensor, int64_t n)
    {
        if (n == 0)
        {
            return tensor;
        }
        std::vector<int64_t> dims;
        for (int64_t i = 1; i <= n; ++i)
        {
            dims.push_back(-i);
        }
        return tensor.sum(dims);
    }

    TEST_CASE("Shape utilities")
    {
        SUBCASE("shapeToString() formats like a tuple")
        {
            CHECK(shapeToString(Shape{}) == "()");
            CHECK(shapeToString(Shape{3}) == "(3,)");
            CHECK(shapeToString(Shape{2, 3}) == "(2, 3)");
            CHECK(shapeToString(OptionalShape{}) == "None");
        }

        SUBCASE("checkTrailingShape() accepts batch dimensions")
        {
            CHECK_NOTHROW(checkTrailingShape(torch::zeros({5, 4, 2}), {2}, "x"));
            CHECK_NOTHROW(checkTrailingShape(torch::zeros({2}), {2}, "x"));
            CHECK_NOTHROW(checkTrailingShape(torch::zeros({7}), {}, "x"));
        }

        SUBCASE("checkTrailingShape() rejects mismatched trailing dimensions")
        {
            CHECK_THROWS_AS(checkTrailingShape(torch::zeros({5, 3}), {2}, "x"), ShapeError);
            CHECK_THROWS_AS(checkTrailingShape(torch::zeros({2}), {2, 2}, "x"), ShapeError);
            CHECK_THROWS_AS(checkTrailingShape(torch::Tensor(), {2}, "condition"), ShapeError);
        }

        SUBCASE("leadingShape() strips the event shape")
        {
            CHECK(leadingShape(torch::zeros({5, 4, 2}), {2}) == Shape{5, 4});
            CHECK(leadingShape(torch::zeros({5, 4, 2}), {}) == Shape{5, 4, 2});
        }

        SUBCASE("broadcastShapes()")
        {
            CHECK(broadcastShapes({3, 1}, {4}) == Shape{3, 4});
            CHECK(broadcastShapes({}, {2, 2}) == Shape{2, 2});
            CHECK_THROWS_AS(broadcastShapes({3}, {4}), ShapeError);
        }

        SUBCASE("mergeConditionShapes()")
        {
            CHECK_FALSE(mergeConditionShapes({std::nullopt, std::nullopt}).has_value());
            CHECK(*mergeConditionShapes({std::nullopt, Shape{3}}) == Shape{3});
            CHECK_THROWS_AS(mergeConditionShapes({Shape{3}, Shape{2}}), std::invalid_argument);
        }

        SUBCASE("sumTrailing()")
        {
            auto tensor = torch::ones({2, 3, 4});
            CHECK(sumTrailing(tensor, 2).sizes().vec() == std::vector<int64_t>{2});
            CHECK(sumTrailing(tensor, 2)[0].item().toDouble() == doctest::Approx(12));
            CHECK(sumTrailing(tensor, 0).sizes().vec() == std::vector<int64_t>{2, 3, 4});
        }
    }
}
