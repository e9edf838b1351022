#ifndef GFD_DICTIONARY_H
#define GFD_DICTIONARY_H


#include <vector>
#include <string>
#include <optional>
#include <unordered_map>
#include "gfd_types.h"
#include "gfd_vocab.h"


namespace gfd
{


/*
* This class encodes/decodes resources to/from integers,
* to save memory and make index lookups cheap.
* Resources are assigned new integer codes as they are
* encountered.
* Literals are identified as written (value, datatype and language
* tag), so decoding always gives back the resource that was encoded.
* Equality up to normalisation is the datatype index's concern.
* Encoding a literal also encodes the IRI of its indexed datatype.
*/
class Dictionary
{
public:
	explicit Dictionary(Vocabulary vocab = Vocabulary());

	CodedResource encode(const Resource& r);
	Resource decode(CodedResource i) const;

	/*
	* Look up the code of `r` without assigning one.
	*/
	std::optional<CodedResource> find(const Resource& r) const;

	size_t size() const { return m_decoder.size(); }
	const Vocabulary& vocabulary() const { return m_vocab; }

private:
	const Vocabulary m_vocab;
	std::unordered_map<Resource, CodedResource> m_encoder;
	std::vector<Resource> m_decoder;
};


}  // namespace gfd


#endif  // GFD_DICTIONARY_H
