#include "gfd_label_index.h"
#include "gfd_graph.h"


namespace gfd
{


LabelIndex build_label_index(const Graph& g)
{
	LabelIndex idx(Literal{ "" });
	const CodedResource label_relation = g.vocabulary().label_relation;

	auto iter = g.scan();
	iter->start();
	while (iter->valid())
	{
		const CodedTriple t = iter->current();
		if (t.pred == label_relation)
		{
			const Resource label = g.dictionary().decode(t.obj);
			if (const Literal* l = std::get_if<Literal>(&label))
				idx.set(t.sub, *l);
		}
		iter->next();
	}

	return idx;
}


}  // namespace gfd
