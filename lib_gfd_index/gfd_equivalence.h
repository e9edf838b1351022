#ifndef GFD_EQUIVALENCE_H
#define GFD_EQUIVALENCE_H


#include "gfd_types.h"
#include "gfd_cache.h"


namespace gfd
{


/*
* Decide whether two assertions are interchangeable under the
* type information in `cache`.
* Both left hand sides must be OBJECT type variables over the same
* class, and both predicates must be equal; otherwise the result
* is false. Given that, the assertions are equivalent iff their
* right hand sides
* (a) are concrete resources with the same value (`is_same_value`), or
* (b) are both type variables (of any kind) with the same type, or
* (c) are one type variable and one concrete resource of that type
*     (`is_same_type`, tried in both orders).
*/
bool is_equivalent(const CodedAssertion& a, const CodedAssertion& b, const Cache& cache);


/*
* True iff `a` is a type variable and `b` is a concrete resource
* of a's type:
* OBJECT     -> b is an indexed entity with a.type among its classes
* DATA       -> b is an indexed literal whose datatype is a.type
* MULTIMODAL -> as DATA
* False in every other case. Note this is not symmetric.
*/
bool is_same_type(const CodedAssertionTerm& a, const CodedAssertionTerm& b, const Cache& cache);


/*
* True iff `a` and `b` are the same resource, or are indexed
* literals which are equal once normalised (e.g. "Alice" and
* "ALICE" as strings).
*/
bool is_same_value(CodedResource a, CodedResource b, const Cache& cache);


}  // namespace gfd


#endif  // GFD_EQUIVALENCE_H
