#pragma once

#include <cstddef>
#include <stdexcept>

namespace dmat
{

/* Thrown by set/apply when a coordinate has no backing cell. */
class out_of_bounds_error : public std::runtime_error
{
public:
	out_of_bounds_error();
};

/* Thrown when rows handed to from_rows cannot form a rectangular matrix. */
class shape_error : public std::invalid_argument
{
public:
	shape_error();
	shape_error(const size_t row, const size_t expected_cols, const size_t actual_cols);
};

}
