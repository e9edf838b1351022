#ifndef GFD_ITERATOR_H
#define GFD_ITERATOR_H


#include <vector>
#include <memory>
#include "gfd_types.h"
#include "gfd_assert.h"


namespace gfd
{


/*
* This is an interface to an object which iterates over values
* of a generic type T.
* These iterators are initialised to be invalid.
* You can call `current` and `next` if and only if the iterator is `valid`.
* `start` can be called at any time to validate the iterator and restart it.
* Calling `next` will result in invalidating the iterator once the end is reached.
*/
template<typename T>
class IIterator
{
public:
	virtual ~IIterator() = default;

	virtual void start() = 0;  // post: `valid()` unless empty, and points to first value
	virtual T current() const = 0;  // pre: `valid()`
	virtual void next() = 0;  // pre: `valid()`
	virtual bool valid() const = 0;
};


typedef IIterator<Triple> ITripleIterator;
typedef IIterator<CodedTriple> ICodedTripleIterator;


/*
* Iterates over the elements of `values`, in order. The vector
* is not copied, so it must outlive the returned iterator and
* must not be modified while the iterator is in use.
*/
template<typename T>
std::unique_ptr<IIterator<T>> create_vector_iterator(const std::vector<T>& values)
{
	class VectorIterator :
		public IIterator<T>
	{
	public:
		VectorIterator(const std::vector<T>& values) :
			m_values(values),
			m_idx(values.size())
		{ }

		void start() override { m_idx = 0; }
		T current() const override
		{
			GFD_CHECK_PRECOND(valid());
			return m_values[m_idx];
		}
		void next() override
		{
			GFD_CHECK_PRECOND(valid());
			++m_idx;
		}
		bool valid() const override { return m_idx < m_values.size(); }

	private:
		const std::vector<T>& m_values;
		size_t m_idx;
	};

	return std::make_unique<VectorIterator>(values);
}


}  // namespace gfd


#endif  // GFD_ITERATOR_H
