#ifndef GFD_LABEL_INDEX_H
#define GFD_LABEL_INDEX_H


#include "gfd_types.h"
#include "gfd_default_map.h"


namespace gfd
{


class Graph;  // forward declaration


/*
* entity -> its display label (the empty literal if it has none)
*/
typedef DefaultMap<CodedResource, Literal> LabelIndex;


/*
* Record the object of every label triple against its subject.
* If an entity has several labels, one of them is kept, with no
* guarantee as to which. Non-literal labels are ignored.
*/
LabelIndex build_label_index(const Graph& g);


}  // namespace gfd


#endif  // GFD_LABEL_INDEX_H
