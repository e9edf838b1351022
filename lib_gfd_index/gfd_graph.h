#ifndef GFD_GRAPH_H
#define GFD_GRAPH_H


#include <vector>
#include <memory>
#include <unordered_set>
#include "gfd_types.h"
#include "gfd_vocab.h"
#include "gfd_iterator.h"
#include "gfd_dictionary.h"


namespace gfd
{


/*
* A snapshot of a triple collection, in encoded format. Triples
* have set semantics: adding a triple twice stores it once.
* Load everything first, then build indices from it; the indices
* do not follow later additions.
*/
class Graph
{
public:
	explicit Graph(Vocabulary vocab = Vocabulary());

	/*
	* Add a triple to the snapshot, returning true iff it was new.
	* WARNING: invalidates any currently-alive iterators.
	* Please do not insert while you read!
	*/
	bool add(const Triple& t);

	/*
	* As above, for a triple whose resources were encoded by
	* this graph's dictionary.
	*/
	bool add(CodedTriple t);

	/*
	* Add every triple produced by `iter` (which is restarted first).
	* Returns the number of triples read, including duplicates.
	*/
	size_t load(std::unique_ptr<ITripleIterator> iter);

	/*
	* Iterate over all distinct triples, in insertion order.
	*/
	std::unique_ptr<ICodedTripleIterator> scan() const;

	const std::vector<CodedTriple>& triples() const { return m_triples; }
	size_t size() const { return m_triples.size(); }

	Dictionary& dictionary() { return m_dict; }
	const Dictionary& dictionary() const { return m_dict; }
	const CodedVocabulary& vocabulary() const { return m_vocab; }

private:
	Dictionary m_dict;
	const CodedVocabulary m_vocab;
	std::vector<CodedTriple> m_triples;
	std::unordered_set<CodedTriple> m_triple_set;
};


}  // namespace gfd


#endif  // GFD_GRAPH_H
