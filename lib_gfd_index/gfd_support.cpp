#include "gfd_support.h"


namespace gfd
{


size_t support(const PredicateIndex& pred_idx,
	const CodedAssertion& assertion,
	const CodedResourceSet& domain)
{
	const auto& forwards = pred_idx.get(assertion.pred).forwards;

	// probe with whichever side is smaller
	size_t count = 0;
	if (domain.size() <= forwards.size())
	{
		for (CodedResource s : domain)
			if (forwards.contains_key(s))
				++count;
	}
	else
	{
		for (const auto& entry : forwards)
			if (domain.count(entry.first) > 0)
				++count;
	}

	return count;
}


}  // namespace gfd
