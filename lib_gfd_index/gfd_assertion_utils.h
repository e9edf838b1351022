#ifndef GFD_ASSERTION_UTILS_H
#define GFD_ASSERTION_UTILS_H


#include "gfd_types.h"
#include "gfd_cache.h"


namespace gfd
{


/*
* These functions return true iff the right argument is an
* instance of the left one: a concrete term matches resources
* with the same value (see `is_same_value`), and a type variable
* matches concrete resources of its type (see `is_same_type`).
*/
bool term_matches(const CodedAssertionTerm& t, CodedResource r, const Cache& cache);
bool assertion_matches(const CodedAssertion& a, const CodedTriple& t, const Cache& cache);


/*
* The subjects an assertion can bind: the members of the class of
* its left hand side, if that is an OBJECT type variable, or the
* empty set otherwise. This is the domain normally counted by
* `support`. The result refers into `cache`.
*/
const CodedResourceSet& assertion_domain(const CodedAssertion& a, const Cache& cache);


}  // namespace gfd


#endif  // GFD_ASSERTION_UTILS_H
