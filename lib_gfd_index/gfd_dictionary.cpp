#include "gfd_dictionary.h"
#include "gfd_assert.h"


namespace gfd
{


Dictionary::Dictionary(Vocabulary vocab) :
	m_vocab(std::move(vocab))
{ }


CodedResource Dictionary::encode(const Resource& r)
{
	// if the resource was new, this is what its new key would be
	const CodedResource potential_new_code = m_decoder.size();

	// do a lookup, but insert if the resource doesn't exist, with a new ID
	// (note that map's `insert` does not update the value if the key already
	// exists)
	auto [iter, is_new] = m_encoder.insert(std::make_pair(r, potential_new_code));

	const CodedResource code = iter->second;

	// decoding the return value gives the input
	GFD_CHECK_INVARIANT(!is_new || code == potential_new_code);
	GFD_CHECK_INVARIANT(is_new || m_decoder[code] == r);

	if (is_new)
	{
		m_decoder.push_back(r);

		// a literal's datatype always has a code too, so that index
		// builders can resolve it without modifying the dictionary
		// (note: this may rehash `m_encoder`, invalidating `iter`)
		if (const Literal* l = std::get_if<Literal>(&r))
			encode(literal_datatype(*l, m_vocab));
	}

	return code;
}


Resource Dictionary::decode(CodedResource i) const
{
	GFD_CHECK_PRECOND(i < m_decoder.size());
	return m_decoder[i];
}


std::optional<CodedResource> Dictionary::find(const Resource& r) const
{
	auto iter = m_encoder.find(r);
	if (iter == m_encoder.end())
		return std::nullopt;
	return iter->second;
}


}  // namespace gfd
