#include "gfd_predicate_index.h"
#include "gfd_graph.h"


namespace gfd
{


PredicateIndex build_predicate_index(const Graph& g)
{
	PredicateIndex idx;

	auto iter = g.scan();
	iter->start();
	while (iter->valid())
	{
		const CodedTriple t = iter->current();

		PredicateAdjacency& adj = idx.slot(t.pred);
		adj.forwards.slot(t.sub).insert(t.obj);
		adj.backwards.slot(t.obj).insert(t.sub);

		iter->next();
	}

	return idx;
}


}  // namespace gfd
