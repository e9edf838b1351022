#ifndef GFD_PREDICATE_INDEX_H
#define GFD_PREDICATE_INDEX_H


#include "gfd_types.h"
#include "gfd_default_map.h"


namespace gfd
{


class Graph;  // forward declaration


/*
* The edges of a single predicate, in both directions:
* `forwards[s]` are the objects of s, `backwards[o]` the
* subjects of o.
* Invariant: o in forwards[s] iff s in backwards[o].
*/
struct PredicateAdjacency
{
	DefaultMap<CodedResource, CodedResourceSet> forwards;
	DefaultMap<CodedResource, CodedResourceSet> backwards;
};


/*
* predicate -> its adjacency. Predicates which never occur map
* to an empty adjacency.
*/
typedef DefaultMap<CodedResource, PredicateAdjacency> PredicateIndex;


/*
* Linear in the number of triples.
*/
PredicateIndex build_predicate_index(const Graph& g);


}  // namespace gfd


#endif  // GFD_PREDICATE_INDEX_H
