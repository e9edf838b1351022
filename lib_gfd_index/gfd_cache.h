#ifndef GFD_CACHE_H
#define GFD_CACHE_H


#include "gfd_type_index.h"


namespace gfd
{


/*
* The indices which equivalence checks consult. Built once per
* snapshot and shared, read-only, between all comparisons; the
* referenced indices must outlive it.
*/
struct Cache
{
	const ObjectTypeIndex& object_type_index;
	const DataTypeIndex& data_type_index;
};


}  // namespace gfd


#endif  // GFD_CACHE_H
