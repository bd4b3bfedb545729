#pragma once

#include <algorithm>

#include <boost/optional.hpp>

#include <dmat/matrix.hpp>
#include <dmat/util/log.hpp>

/* Arithmetic on matrix<T>.
 * T must provide + - * / returning T, and T() must be the additive identity.
 */

namespace dmat
{

namespace detail
{
	template<typename T>
	inline void log_mismatch(const char* facility, matrix<T> const& a, matrix<T> const& b)
	{
		log l(facility, log::level_e::DEBUG);
		if(!l.enabled())
			return;

		l() << "Shape mismatch: "
			<< a.num_rows() << 'x' << a.num_cols() << (a.is_filled() ? "" : " (unfilled)")
			<< " against "
			<< b.num_rows() << 'x' << b.num_cols() << (b.is_filled() ? "" : " (unfilled)");
	}
}

template<typename T>
matrix<T> add(matrix<T> const& m, typename matrix<T>::value_type const& value)
{
	return m.map([&value](T const& x) -> T { return x + value; });
}

template<typename T>
matrix<T> subtract(matrix<T> const& m, typename matrix<T>::value_type const& value)
{
	return m.map([&value](T const& x) -> T { return x - value; });
}

template<typename T>
matrix<T> multiply(matrix<T> const& m, typename matrix<T>::value_type const& value)
{
	return m.map([&value](T const& x) -> T { return x * value; });
}

template<typename T>
matrix<T> divide(matrix<T> const& m, typename matrix<T>::value_type const& value)
{
	return m.map([&value](T const& x) -> T { return x / value; });
}

// None unless both operands are filled and of identical shape.
template<typename T>
boost::optional<matrix<T>> matrix_add(matrix<T> const& a, matrix<T> const& b)
{
	if(a.shape() != b.shape() || !a.is_filled() || !b.is_filled())
	{
		detail::log_mismatch("dmat::matrix_add", a, b);
		return boost::none;
	}

	matrix<T> result(a.num_rows(), a.num_cols());
	std::transform(a.begin(), a.end(), b.begin(), result.begin(), [](T const& x, T const& y) -> T { return x + y; });

	return result;
}

/* Standard product: a is n x m, b is m x p, the result is n x p.
 * None when the inner dimensions differ or an operand is unfilled. */
template<typename T>
boost::optional<matrix<T>> matrix_multiply(matrix<T> const& a, matrix<T> const& b)
{
	if(a.num_cols() != b.num_rows() || !a.is_filled() || !b.is_filled())
	{
		detail::log_mismatch("dmat::matrix_multiply", a, b);
		return boost::none;
	}

	matrix<T> result(a.num_rows(), b.num_cols());

	for(size_t i = 0; i < a.num_rows(); ++i)
		for(size_t j = 0; j < b.num_cols(); ++j)
			for(size_t k = 0; k < a.num_cols(); ++k)
			{
				const T prod(a.get_or_default(i, k) * b.get_or_default(k, j));
				result.apply(i, j, [&prod](T const& x) -> T { return x + prod; });
			}

	return result;
}

}
