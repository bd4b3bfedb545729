#include <dmat/error.hpp>

#include <string>

#include <boost/lexical_cast.hpp>

namespace dmat
{

out_of_bounds_error::out_of_bounds_error()
: std::runtime_error("Index out of bounds")
{}

shape_error::shape_error()
: std::invalid_argument("Cannot build a matrix from an empty sequence of rows")
{}

shape_error::shape_error(const size_t row, const size_t expected_cols, const size_t actual_cols)
: std::invalid_argument(
	std::string("Row ") + boost::lexical_cast<std::string>(row)
	+ " has " + boost::lexical_cast<std::string>(actual_cols)
	+ " columns, expected " + boost::lexical_cast<std::string>(expected_cols)
)
{}

}
