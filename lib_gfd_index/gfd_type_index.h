#ifndef GFD_TYPE_INDEX_H
#define GFD_TYPE_INDEX_H


#include <optional>
#include "gfd_types.h"
#include "gfd_default_map.h"


namespace gfd
{


class Graph;  // forward declaration


/*
* Literal <-> datatype, in both directions. Each literal has
* exactly one datatype, so `object_to_type` is a function and
* every literal is in exactly one `type_to_object` bucket.
* `object_to_value` maps each literal to a representative: the
* first literal seen with the same datatype, language tag and
* normal value (see `cast_literal`). Two literals are equal up to
* normalisation iff they have the same representative.
*/
struct DataTypeIndex
{
	DefaultMap<CodedResource, std::optional<CodedResource>> object_to_type;
	DefaultMap<CodedResource, CodedResourceSet> type_to_object;
	DefaultMap<CodedResource, std::optional<CodedResource>> object_to_value;
};


/*
* Entity <-> class, in both directions. This is many-to-many.
* Invariant: every entity which occurs as a subject is in at
* least one class; entities with no asserted class are put in
* the graph's generic class.
*/
struct ObjectTypeIndex
{
	DefaultMap<CodedResource, CodedResourceSet> object_to_type;
	DefaultMap<CodedResource, CodedResourceSet> type_to_object;
};


/*
* Index every literal occurring as an object under its datatype
* (see `literal_datatype`).
*/
DataTypeIndex build_datatype_index(const Graph& g);


/*
* Index every entity occurring as a subject under the objects of
* its type triples, or under the generic class if it has none.
*/
ObjectTypeIndex build_object_type_index(const Graph& g);


}  // namespace gfd


#endif  // GFD_TYPE_INDEX_H
