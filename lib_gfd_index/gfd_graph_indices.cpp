#include <chrono>
#include <iostream>
#include "gfd_graph_indices.h"
#include "gfd_graph.h"


namespace gfd
{


namespace
{


/*
* Run `build` and return its result, reporting how long it took
* if `log` is set.
*/
template<typename BuildFn>
auto timed_build(const char* what, bool log, BuildFn build)
{
	const auto start_time = std::chrono::system_clock::now();
	auto result = build();
	const auto end_time = std::chrono::system_clock::now();

	if (log)
	{
		std::cout << "Built " << what << " index in " <<
			std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count()
			<< "ms." << std::endl;
	}

	return result;
}


}  // namespace


GraphIndices::GraphIndices(const Graph& g, bool log_build_times) :
	m_labels(timed_build("label", log_build_times,
		[&g]() { return build_label_index(g); })),
	m_datatypes(timed_build("datatype", log_build_times,
		[&g]() { return build_datatype_index(g); })),
	m_object_types(timed_build("object type", log_build_times,
		[&g]() { return build_object_type_index(g); })),
	m_predicates(timed_build("predicate", log_build_times,
		[&g]() { return build_predicate_index(g); }))
{
	if (log_build_times)
	{
		std::cout << "Indexed " << g.size() << " triples: "
			<< m_labels.size() << " labels, "
			<< m_datatypes.object_to_type.size() << " literals, "
			<< m_object_types.object_to_type.size() << " entities, "
			<< m_predicates.size() << " predicates." << std::endl;
	}
}


}  // namespace gfd
