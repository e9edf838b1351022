#include <unordered_map>
#include "gfd_type_index.h"
#include "gfd_graph.h"
#include "gfd_vocab.h"
#include "gfd_cast.h"
#include "gfd_assert.h"


namespace gfd
{


namespace
{


/*
* A literal holding the normal value of `l`, tagged with its
* variant index, under the indexed datatype of `l`. Two literals
* get equal keys iff they are equal up to normalisation.
*/
Literal normal_key(const Literal& l, const Vocabulary& vocab)
{
	const NormalValue v = cast_literal(l, vocab);
	return Literal{
		std::to_string(v.index()) + ':' + normal_value_str(v),
		literal_datatype(l, vocab).val,
		l.lang
	};
}


}  // namespace


DataTypeIndex build_datatype_index(const Graph& g)
{
	DataTypeIndex idx;
	const Dictionary& dict = g.dictionary();

	// each object only needs decoding once
	CodedResourceSet checked;

	// normal key -> representative literal
	std::unordered_map<Literal, CodedResource> representatives;

	auto iter = g.scan();
	iter->start();
	while (iter->valid())
	{
		const CodedResource obj = iter->current().obj;

		if (checked.insert(obj).second)
		{
			const Resource r = dict.decode(obj);
			if (const Literal* l = std::get_if<Literal>(&r))
			{
				// the dictionary encodes a literal's datatype along with it
				const auto dtype = dict.find(literal_datatype(*l, dict.vocabulary()));
				GFD_CHECK_INVARIANT(dtype.has_value());

				idx.object_to_type.set(obj, dtype);
				idx.type_to_object.slot(*dtype).insert(obj);

				auto rep = representatives.try_emplace(normal_key(*l, dict.vocabulary()), obj);
				idx.object_to_value.set(obj, rep.first->second);
			}
		}

		iter->next();
	}

	return idx;
}


ObjectTypeIndex build_object_type_index(const Graph& g)
{
	ObjectTypeIndex idx;
	const CodedVocabulary& vocab = g.vocabulary();

	// subject -> whether it is an entity; also serves as the set of
	// all subjects, to find the untyped ones afterwards
	std::unordered_map<CodedResource, bool> subjects;

	auto iter = g.scan();
	iter->start();
	while (iter->valid())
	{
		const CodedTriple t = iter->current();

		auto [subj_iter, is_new] = subjects.try_emplace(t.sub, false);
		if (is_new)
			subj_iter->second = is_entity(g.dictionary().decode(t.sub));

		if (subj_iter->second && t.pred == vocab.type_relation)
		{
			idx.object_to_type.slot(t.sub).insert(t.obj);
			idx.type_to_object.slot(t.obj).insert(t.sub);
		}

		iter->next();
	}

	for (const auto& [sub, entity] : subjects)
	{
		if (entity && !idx.object_to_type.contains_key(sub))
		{
			idx.object_to_type.slot(sub).insert(vocab.generic_class);
			idx.type_to_object.slot(vocab.generic_class).insert(sub);
		}
	}

	return idx;
}


}  // namespace gfd
