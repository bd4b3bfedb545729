#pragma once

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>

#include <dmat/matrix.hpp>

namespace dmat
{

namespace detail
{
	template<typename T>
	inline T const& printable(T const& x)
	{
		return x;
	}

	// Character-sized integers print as numbers, not as characters.
	inline int printable(const char x)
	{
		return +x;
	}

	inline int printable(const signed char x)
	{
		return +x;
	}

	inline int printable(const unsigned char x)
	{
		return +x;
	}

	// Default stream precision, so 0.1 reads "0.1".
	template<typename T>
	std::string format_cell(T const& x)
	{
		std::ostringstream os;
		os << printable(x);
		return os.str();
	}
}

/* Renders one bracketed line per row after a leading newline, e.g. "\n[ 1 2 ]\n[ 3 4 ]\n".
 * Every value is right-aligned to the widest value of the whole matrix.
 */
template<typename T>
std::string to_string(matrix<T> const& m)
{
	const matrix<std::string> text(m.map([](T const& x) { return detail::format_cell(x); }));

	size_t width = 0;
	for(std::string const& s : text)
		width = std::max(width, s.size());

	std::ostringstream os;
	os << '\n';

	for(auto const& row : text.rows())
	{
		os << "[ ";
		for(std::string const& s : row)
			os << std::setw(static_cast<int>(width)) << std::right << s << ' ';
		os << "]\n";
	}

	return os.str();
}

template<typename T>
std::ostream& operator<<(std::ostream& os, matrix<T> const& m)
{
	return os << to_string(m);
}

}
