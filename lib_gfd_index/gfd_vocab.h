#ifndef GFD_VOCAB_H
#define GFD_VOCAB_H


#include <string>
#include "gfd_types.h"


namespace gfd
{


namespace rdf
{
extern const std::string TYPE;
}  // namespace rdf


namespace rdfs
{
extern const std::string LABEL;
extern const std::string CLASS;
}  // namespace rdfs


namespace xsd
{
extern const std::string NS;
extern const std::string STRING;
extern const std::string ANY_TYPE;
extern const std::string INTEGER;
extern const std::string DECIMAL;
extern const std::string DOUBLE;
extern const std::string DATE;
extern const std::string DATE_TIME;
extern const std::string G_YEAR;
extern const std::string G_YEAR_MONTH;
extern const std::string G_MONTH;
extern const std::string G_MONTH_DAY;
extern const std::string G_DAY;
}  // namespace xsd


/*
* The datatype families which the value normaliser knows how to
* canonicalise. Everything else is OTHER and is left untouched.
*/
enum class DatatypeFamily
{
	NUMERIC, DATETIME, DATEFRAG, STRING, OTHER
};


DatatypeFamily datatype_family(const std::string& datatype);


/*
* The IRIs which index construction depends on. The defaults are
* the W3C ones, but graphs using a different schema for labels or
* typing can swap them out.
*/
struct Vocabulary
{
	IRI type_relation{ rdf::TYPE };
	IRI label_relation{ rdfs::LABEL };
	IRI generic_class{ rdfs::CLASS };  // class of entities with no asserted type
	IRI string_datatype{ xsd::STRING };  // datatype of language-tagged literals
	IRI any_datatype{ xsd::ANY_TYPE };  // datatype of plain literals
};


/*
* The above, once encoded by the graph's dictionary.
*/
struct CodedVocabulary
{
	CodedResource type_relation;
	CodedResource label_relation;
	CodedResource generic_class;
	CodedResource string_datatype;
	CodedResource any_datatype;
};


/*
* The datatype a literal is indexed under: its explicit datatype
* if it has one, else the string datatype if it is language
* tagged, else the "any type" marker.
*/
IRI literal_datatype(const Literal& l, const Vocabulary& vocab);


}  // namespace gfd


#endif  // GFD_VOCAB_H
