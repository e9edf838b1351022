#include "gfd_dictionary_utils.h"
#include "gfd_dictionary.h"
#include "gfd_assert.h"


namespace gfd
{


CodedTypeVariable encode(Dictionary& dict, const TypeVariable& v)
{
	return { v.kind, dict.encode(v.type) };
}


TypeVariable decode(const Dictionary& dict, const CodedTypeVariable& v)
{
	return { v.kind, dict.decode(v.type) };
}


CodedAssertionTerm encode(Dictionary& dict, const AssertionTerm& t)
{
	struct TermEncoder
	{
		TermEncoder(Dictionary& dict) :
			dict(dict)
		{ }

		CodedAssertionTerm operator()(const TypeVariable& v)
		{
			return encode(dict, v);
		}

		CodedAssertionTerm operator()(const Resource& r)
		{
			return dict.encode(r);
		}

		Dictionary& dict;
	};
	return std::visit(TermEncoder(dict), t);
}


AssertionTerm decode(const Dictionary& dict, const CodedAssertionTerm& t)
{
	struct TermDecoder
	{
		TermDecoder(const Dictionary& dict) :
			dict(dict)
		{ }

		AssertionTerm operator()(const CodedTypeVariable& v)
		{
			return decode(dict, v);
		}

		AssertionTerm operator()(const CodedResource& r)
		{
			return dict.decode(r);
		}

		const Dictionary& dict;
	};
	return std::visit(TermDecoder(dict), t);
}


CodedTriple encode(Dictionary& dict, const Triple& t)
{
	return {
		dict.encode(t.sub), dict.encode(t.pred), dict.encode(t.obj)
	};
}


Triple decode(const Dictionary& dict, const CodedTriple& t)
{
	return {
		dict.decode(t.sub), dict.decode(t.pred), dict.decode(t.obj)
	};
}


CodedAssertion encode(Dictionary& dict, const Assertion& a)
{
	return {
		encode(dict, a.lhs), dict.encode(a.pred), encode(dict, a.rhs)
	};
}


Assertion decode(const Dictionary& dict, const CodedAssertion& a)
{
	return {
		decode(dict, a.lhs), dict.decode(a.pred), decode(dict, a.rhs)
	};
}


std::optional<CodedTypeVariable> find_encoded(const Dictionary& dict, const TypeVariable& v)
{
	auto type = dict.find(v.type);
	if (!type)
		return std::nullopt;
	return CodedTypeVariable{ v.kind, *type };
}


std::optional<CodedAssertionTerm> find_encoded(const Dictionary& dict, const AssertionTerm& t)
{
	if (const TypeVariable* v = std::get_if<TypeVariable>(&t))
	{
		auto coded = find_encoded(dict, *v);
		if (!coded)
			return std::nullopt;
		return CodedAssertionTerm(*coded);
	}
	else
	{
		auto coded = dict.find(std::get<Resource>(t));
		if (!coded)
			return std::nullopt;
		return CodedAssertionTerm(*coded);
	}
}


std::optional<CodedAssertion> find_encoded(const Dictionary& dict, const Assertion& a)
{
	auto lhs = find_encoded(dict, a.lhs);
	auto pred = dict.find(a.pred);
	auto rhs = find_encoded(dict, a.rhs);

	// if any component is unknown, the whole assertion is
	if (!lhs || !pred || !rhs)
		return std::nullopt;

	return CodedAssertion{ *lhs, *pred, *rhs };
}


std::unique_ptr<ICodedTripleIterator> autoencode(
	Dictionary& dict, std::unique_ptr<ITripleIterator> iter)
{
	GFD_CHECK_PRECOND(iter != nullptr);

	// simple wrapper around the given iterator which calls `encode` in `current`
	class AutoencodingTripleIterator :
		public ICodedTripleIterator
	{
	public:
		AutoencodingTripleIterator(
			Dictionary& dict, std::unique_ptr<ITripleIterator> iter) :
			m_dict(dict), m_iter(std::move(iter))
		{ }

		void start() override
		{
			m_iter->start();
		}

		CodedTriple current() const override
		{
			return encode(m_dict, m_iter->current());
		}

		void next() override
		{
			m_iter->next();
		}

		bool valid() const override
		{
			return m_iter->valid();
		}

	private:
		Dictionary& m_dict;
		std::unique_ptr<ITripleIterator> m_iter;
	};

	return std::make_unique<AutoencodingTripleIterator>(dict, std::move(iter));
}


}  // namespace gfd
