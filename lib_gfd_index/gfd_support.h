#ifndef GFD_SUPPORT_H
#define GFD_SUPPORT_H


#include "gfd_types.h"
#include "gfd_predicate_index.h"


namespace gfd
{


/*
* The number of subjects in `domain` with at least one outgoing
* edge labelled with the assertion's predicate, i.e.
* |domain intersect keys(pred_idx[assertion.pred].forwards)|.
* Never exceeds |domain|, and is 0 for a predicate which does not
* occur. Neither argument is modified.
*/
size_t support(const PredicateIndex& pred_idx,
	const CodedAssertion& assertion,
	const CodedResourceSet& domain);


}  // namespace gfd


#endif  // GFD_SUPPORT_H
