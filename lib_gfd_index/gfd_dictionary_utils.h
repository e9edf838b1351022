#ifndef GFD_DICTIONARY_UTILS_H
#define GFD_DICTIONARY_UTILS_H


#include <memory>
#include <optional>
#include "gfd_types.h"
#include "gfd_iterator.h"


namespace gfd
{


class Dictionary;  // forward declaration


CodedTypeVariable encode(Dictionary& dict, const TypeVariable& v);
TypeVariable decode(const Dictionary& dict, const CodedTypeVariable& v);
CodedAssertionTerm encode(Dictionary& dict, const AssertionTerm& t);
AssertionTerm decode(const Dictionary& dict, const CodedAssertionTerm& t);
CodedTriple encode(Dictionary& dict, const Triple& t);
Triple decode(const Dictionary& dict, const CodedTriple& t);
CodedAssertion encode(Dictionary& dict, const Assertion& a);
Assertion decode(const Dictionary& dict, const CodedAssertion& a);


/*
* Encode without assigning new codes, so these can be used
* on a shared dictionary while other threads read it.
* Returns std::nullopt if any resource mentioned is unknown
* to the dictionary.
*/
std::optional<CodedTypeVariable> find_encoded(const Dictionary& dict, const TypeVariable& v);
std::optional<CodedAssertionTerm> find_encoded(const Dictionary& dict, const AssertionTerm& t);
std::optional<CodedAssertion> find_encoded(const Dictionary& dict, const Assertion& a);


/*
* Wrap an iterator with another iterator which automatically
* encodes its outputs. Subsumes management of the given input
* iterator. Warning: `dict` must remain alive for the entire
* duration of the returned iterator's lifetime.
*/
std::unique_ptr<ICodedTripleIterator> autoencode(
	Dictionary& dict, std::unique_ptr<ITripleIterator> iter);


}  // namespace gfd


#endif  // GFD_DICTIONARY_UTILS_H
