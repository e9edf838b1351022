#include "gfd_equivalence.h"
#include "gfd_assert.h"


namespace gfd
{


bool is_equivalent(const CodedAssertion& a, const CodedAssertion& b, const Cache& cache)
{
	const CodedTypeVariable* lhs_a = std::get_if<CodedTypeVariable>(&a.lhs);
	const CodedTypeVariable* lhs_b = std::get_if<CodedTypeVariable>(&b.lhs);

	// only assertions about the same typed subject variable and the
	// same predicate are ever comparable
	if (lhs_a == nullptr || lhs_b == nullptr
		|| lhs_a->kind != TypeVariableKind::OBJECT
		|| lhs_b->kind != TypeVariableKind::OBJECT
		|| lhs_a->type != lhs_b->type
		|| a.pred != b.pred)
		return false;

	const CodedTypeVariable* rhs_a = std::get_if<CodedTypeVariable>(&a.rhs);
	const CodedTypeVariable* rhs_b = std::get_if<CodedTypeVariable>(&b.rhs);

	if (rhs_a == nullptr && rhs_b == nullptr)
		return is_same_value(std::get<CodedResource>(a.rhs), std::get<CodedResource>(b.rhs), cache);
	else if (rhs_a != nullptr && rhs_b != nullptr)
		return rhs_a->type == rhs_b->type;
	else
		// exactly one side is a variable, and `is_same_type` only
		// accepts the variable as its first argument
		return is_same_type(a.rhs, b.rhs, cache) || is_same_type(b.rhs, a.rhs, cache);
}


bool is_same_type(const CodedAssertionTerm& a, const CodedAssertionTerm& b, const Cache& cache)
{
	const CodedTypeVariable* var = std::get_if<CodedTypeVariable>(&a);
	const CodedResource* r = std::get_if<CodedResource>(&b);

	if (var == nullptr || r == nullptr)
		return false;

	switch (var->kind)
	{
	case TypeVariableKind::OBJECT:
	{
		// only entities are in this index, so a literal `r` falls
		// through to the default, which is empty
		const CodedResourceSet& classes = cache.object_type_index.object_to_type.get(*r);
		return classes.count(var->type) > 0;
	}
	case TypeVariableKind::DATA:
	case TypeVariableKind::MULTIMODAL:
	{
		// likewise only literals are in this index
		const auto& dtype = cache.data_type_index.object_to_type.get(*r);
		return dtype.has_value() && *dtype == var->type;
	}
	default:
		GFD_CHECK_PRECOND(false);
		return false;
	}
}


bool is_same_value(CodedResource a, CodedResource b, const Cache& cache)
{
	if (a == b)
		return true;

	// unindexed resources (entities included) have no representative
	const auto& rep = cache.data_type_index.object_to_value.get(a);
	return rep.has_value() && rep == cache.data_type_index.object_to_value.get(b);
}


}  // namespace gfd
