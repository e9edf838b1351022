#ifndef GFD_GRAPH_INDICES_H
#define GFD_GRAPH_INDICES_H


#include "gfd_cache.h"
#include "gfd_label_index.h"
#include "gfd_type_index.h"
#include "gfd_predicate_index.h"


namespace gfd
{


class Graph;  // forward declaration


/*
* All four indices over one graph snapshot. Construction is the
* only write; afterwards every accessor is const, so any number of
* threads may query concurrently without locking.
*/
class GraphIndices
{
public:
	/*
	* If `log_build_times` is set, the time taken by each index
	* is written to stdout.
	*/
	explicit GraphIndices(const Graph& g, bool log_build_times = false);

	const LabelIndex& labels() const { return m_labels; }
	const DataTypeIndex& datatypes() const { return m_datatypes; }
	const ObjectTypeIndex& object_types() const { return m_object_types; }
	const PredicateIndex& predicates() const { return m_predicates; }

	/*
	* The returned cache refers into this object, so must not
	* outlive it.
	*/
	Cache cache() const
	{
		return { m_object_types, m_datatypes };
	}

private:
	LabelIndex m_labels;
	DataTypeIndex m_datatypes;
	ObjectTypeIndex m_object_types;
	PredicateIndex m_predicates;
};


}  // namespace gfd


#endif  // GFD_GRAPH_INDICES_H
