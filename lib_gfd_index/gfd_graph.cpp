#include "gfd_graph.h"
#include "gfd_dictionary_utils.h"
#include "gfd_assert.h"


namespace gfd
{


namespace
{


CodedVocabulary encode_vocabulary(Dictionary& dict)
{
	const Vocabulary& vocab = dict.vocabulary();
	return {
		dict.encode(vocab.type_relation),
		dict.encode(vocab.label_relation),
		dict.encode(vocab.generic_class),
		dict.encode(vocab.string_datatype),
		dict.encode(vocab.any_datatype)
	};
}


}  // namespace


Graph::Graph(Vocabulary vocab) :
	m_dict(std::move(vocab)),
	m_vocab(encode_vocabulary(m_dict))
{ }


bool Graph::add(const Triple& t)
{
	return add(encode(m_dict, t));
}


bool Graph::add(CodedTriple t)
{
	GFD_CHECK_PRECOND(t.sub < m_dict.size() && t.pred < m_dict.size() && t.obj < m_dict.size());

	// don't insert duplicates!
	if (!m_triple_set.insert(t).second)
		return false;

	m_triples.push_back(t);

	GFD_CHECK_POSTCOND(m_triples.size() == m_triple_set.size());
	return true;
}


size_t Graph::load(std::unique_ptr<ITripleIterator> iter)
{
	auto coded_iter = autoencode(m_dict, std::move(iter));

	size_t add_count = 0;
	coded_iter->start();
	while (coded_iter->valid())
	{
		add(coded_iter->current());
		coded_iter->next();
		++add_count;
	}

	return add_count;
}


std::unique_ptr<ICodedTripleIterator> Graph::scan() const
{
	return create_vector_iterator(m_triples);
}


}  // namespace gfd
