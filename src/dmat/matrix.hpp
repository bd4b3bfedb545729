#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/iterator/iterator_facade.hpp>
#include <boost/optional.hpp>
#include <boost/range/iterator_range.hpp>

#include <dmat/error.hpp>

namespace dmat
{

/* Selects the constructor that declares a shape without allocating cells. */
struct unfilled_t {};
const unfilled_t unfilled = unfilled_t();

/* Walks a row-major buffer one row at a time, yielding each row as a range. */
template<typename T>
class row_iterator
	: public boost::iterator_facade<
		row_iterator<T>,
		boost::iterator_range<T const*>,
		boost::random_access_traversal_tag,
		boost::iterator_range<T const*>
	>
{
public:
	typedef boost::iterator_range<T const*> row_type;

	// Value-initialised iterators compare equal, as forward iterators require.
	row_iterator()
	: base(nullptr)
	, cols(0)
	, row(0)
	{}

	row_iterator(T const* _base, const size_t _cols, const size_t _row)
	: base(_base)
	, cols(_cols)
	, row(_row)
	{}

private:
	friend class boost::iterator_core_access;

	row_type dereference() const
	{
		T const* first = base + row * cols;
		return row_type(first, first + cols);
	}

	bool equal(row_iterator const& rhs) const
	{
		return base == rhs.base && cols == rhs.cols && row == rhs.row;
	}

	void increment()
	{
		++row;
	}

	void decrement()
	{
		--row;
	}

	void advance(const std::ptrdiff_t n)
	{
		row = static_cast<size_t>(static_cast<std::ptrdiff_t>(row) + n);
	}

	std::ptrdiff_t distance_to(row_iterator const& rhs) const
	{
		return static_cast<std::ptrdiff_t>(rhs.row) - static_cast<std::ptrdiff_t>(row);
	}

	T const* base;
	size_t cols;
	size_t row;
};

/* Dense matrix over a flat row-major buffer.
 * Cell (i, j) lives at offset i*cols + j. Every matrix owns its cells; copies are deep.
 * T must be default constructible and copyable.
 */
template<typename T>
class matrix
{
	template<typename U>
	friend class matrix;

public:
	typedef T value_type;
	typedef typename std::vector<T>::iterator iterator;
	typedef typename std::vector<T>::const_iterator const_iterator;
	typedef boost::iterator_range<T const*> row_type;
	typedef dmat::row_iterator<T> const_row_iterator;
	typedef boost::iterator_range<const_row_iterator> row_range;

private:
	size_t size_i, size_j;
	std::vector<T> cells;
	bool filled;

public:
	matrix()
	: size_i(0)
	, size_j(0)
	, cells()
	, filled(true)
	{}

	/* Shape only; no cell exists until the matrix is replaced by a filled one.
	 * Reads yield nothing and writes throw out_of_bounds_error. */
	matrix(const unfilled_t, const size_t size_i, const size_t size_j)
	: size_i(size_i)
	, size_j(size_j)
	, cells()
	, filled(false)
	{}

	matrix(const size_t size_i, const size_t size_j, T const& default_value = T())
	: size_i(size_i)
	, size_j(size_j)
	, cells(size_i * size_j, default_value)
	, filled(true)
	{}

	/* Takes the shape from the number of rows and the length of the first row.
	 * Throws shape_error when there are no rows or the rows are ragged. */
	static matrix from_rows(std::vector<std::vector<T>> const& values)
	{
		if(values.empty())
			throw shape_error();

		matrix result(unfilled, values.size(), values.front().size());
		result.cells.reserve(result.size_i * result.size_j);

		for(size_t i = 0; i < values.size(); ++i)
		{
			if(values[i].size() != result.size_j)
				throw shape_error(i, result.size_j, values[i].size());

			result.cells.insert(result.cells.end(), values[i].begin(), values[i].end());
		}

		result.filled = true;

		return result;
	}

	size_t num_rows() const
	{
		return size_i;
	}

	size_t num_cols() const
	{
		return size_j;
	}

	std::pair<size_t, size_t> shape() const
	{
		return std::make_pair(size_i, size_j);
	}

	// Number of allocated cells; zero for an unfilled matrix.
	size_t size() const
	{
		return cells.size();
	}

	// False only for a matrix built with the unfilled tag, whatever its shape.
	bool is_filled() const
	{
		return filled;
	}

	size_t offset(const size_t row, const size_t col) const
	{
		return row * size_j + col;
	}

	bool in_bounds(const size_t row, const size_t col) const
	{
		return row < size_i && col < size_j;
	}

	boost::optional<size_t> checked_offset(const size_t row, const size_t col) const
	{
		if(!in_bounds(row, col))
			return boost::none;

		const size_t i = offset(row, col);
		if(i >= cells.size())
			return boost::none;

		return i;
	}

	boost::optional<T&> get(const size_t row, const size_t col)
	{
		const boost::optional<size_t> i(checked_offset(row, col));
		if(!i)
			return boost::none;

		return boost::optional<T&>(cells[*i]);
	}

	boost::optional<T const&> get(const size_t row, const size_t col) const
	{
		const boost::optional<size_t> i(checked_offset(row, col));
		if(!i)
			return boost::none;

		return boost::optional<T const&>(cells[*i]);
	}

	T get_or_default(const size_t row, const size_t col) const
	{
		const boost::optional<T const&> value(get(row, col));
		if(!value)
			return T();

		return *value;
	}

	matrix& set(const size_t row, const size_t col, T const& value)
	{
		boost::optional<T&> cell(get(row, col));
		if(!cell)
			throw out_of_bounds_error();

		*cell = value;
		return *this;
	}

	template<typename F>
	matrix& apply(const size_t row, const size_t col, F f)
	{
		boost::optional<T&> cell(get(row, col));
		if(!cell)
			throw out_of_bounds_error();

		*cell = f(static_cast<T const&>(*cell));
		return *this;
	}

	/* Elementwise transform into a new matrix of the same shape.
	 * An unfilled matrix maps to an unfilled matrix. */
	template<typename F>
	matrix<typename std::decay<typename std::result_of<F(T const&)>::type>::type> map(F f) const
	{
		typedef typename std::decay<typename std::result_of<F(T const&)>::type>::type result_t;

		matrix<result_t> result(unfilled, size_i, size_j);
		result.cells.reserve(cells.size());

		for(T const& x : cells)
			result.cells.push_back(f(x));

		result.filled = filled;

		return result;
	}

	row_range rows() const
	{
		const size_t n = is_filled() ? size_i : 0;
		return row_range(
			const_row_iterator(cells.data(), size_j, 0),
			const_row_iterator(cells.data(), size_j, n)
		);
	}

	boost::optional<row_type> row_at(const size_t i) const
	{
		const row_range r(rows());
		if(i >= static_cast<size_t>(r.size()))
			return boost::none;

		return *(r.begin() + i);
	}

	// Flat access in buffer order.
	iterator begin()
	{
		return cells.begin();
	}

	iterator end()
	{
		return cells.end();
	}

	const_iterator begin() const
	{
		return cells.begin();
	}

	const_iterator end() const
	{
		return cells.end();
	}

	bool operator==(matrix const& rhs) const
	{
		return size_i == rhs.size_i && size_j == rhs.size_j && filled == rhs.filled && cells == rhs.cells;
	}

	bool operator!=(matrix const& rhs) const
	{
		return !(*this == rhs);
	}
};

}
