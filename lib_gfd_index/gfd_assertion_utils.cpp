#include "gfd_assertion_utils.h"
#include "gfd_equivalence.h"


namespace gfd
{


bool term_matches(const CodedAssertionTerm& t, CodedResource r, const Cache& cache)
{
	struct TermMatchVisitor
	{
		bool operator()(CodedResource r2) const
		{
			return is_same_value(r2, r, cache);
		}
		bool operator()(const CodedTypeVariable& v) const
		{
			return is_same_type(v, r, cache);
		}

		CodedResource r;
		const Cache& cache;
	};
	return std::visit(TermMatchVisitor{ r, cache }, t);
}


bool assertion_matches(const CodedAssertion& a, const CodedTriple& t, const Cache& cache)
{
	return a.pred == t.pred
		&& term_matches(a.lhs, t.sub, cache)
		&& term_matches(a.rhs, t.obj, cache);
}


const CodedResourceSet& assertion_domain(const CodedAssertion& a, const Cache& cache)
{
	const auto& members = cache.object_type_index.type_to_object;

	const CodedTypeVariable* v = std::get_if<CodedTypeVariable>(&a.lhs);
	if (v == nullptr || v->kind != TypeVariableKind::OBJECT)
		return members.default_value();

	return members.get(v->type);
}


}  // namespace gfd
