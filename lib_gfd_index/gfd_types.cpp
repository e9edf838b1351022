#include "gfd_types.h"
#include "gfd_assert.h"


namespace gfd
{


std::string type_var_kind_str(TypeVariableKind kind)
{
	switch (kind)
	{
	case TypeVariableKind::OBJECT:
		return "object";
	case TypeVariableKind::DATA:
		return "data";
	case TypeVariableKind::MULTIMODAL:
		return "multimodal";
	default:
		GFD_CHECK_PRECOND(false);
		return "";
	}
}


}  // namespace gfd
