#include <unordered_set>
#include "gfd_vocab.h"


namespace gfd
{


const std::string rdf::TYPE = "http://www.w3.org/1999/02/22-rdf-syntax-ns#type";
const std::string rdfs::LABEL = "http://www.w3.org/2000/01/rdf-schema#label";
const std::string rdfs::CLASS = "http://www.w3.org/2000/01/rdf-schema#Class";


const std::string xsd::NS = "http://www.w3.org/2001/XMLSchema#";
const std::string xsd::STRING = xsd::NS + "string";
const std::string xsd::ANY_TYPE = xsd::NS + "anyType";
const std::string xsd::INTEGER = xsd::NS + "integer";
const std::string xsd::DECIMAL = xsd::NS + "decimal";
const std::string xsd::DOUBLE = xsd::NS + "double";
const std::string xsd::DATE = xsd::NS + "date";
const std::string xsd::DATE_TIME = xsd::NS + "dateTime";
const std::string xsd::G_YEAR = xsd::NS + "gYear";
const std::string xsd::G_YEAR_MONTH = xsd::NS + "gYearMonth";
const std::string xsd::G_MONTH = xsd::NS + "gMonth";
const std::string xsd::G_MONTH_DAY = xsd::NS + "gMonthDay";
const std::string xsd::G_DAY = xsd::NS + "gDay";


namespace
{


// local names within the XSD namespace
const std::unordered_set<std::string> NUMERIC_TYPES = {
	"decimal", "float", "double", "integer",
	"nonPositiveInteger", "negativeInteger", "nonNegativeInteger", "positiveInteger",
	"long", "int", "short", "byte",
	"unsignedLong", "unsignedInt", "unsignedShort", "unsignedByte"
};
const std::unordered_set<std::string> DATETIME_TYPES = {
	"dateTime", "dateTimeStamp", "date"
};
const std::unordered_set<std::string> DATEFRAG_TYPES = {
	"gYear", "gYearMonth", "gMonth", "gMonthDay", "gDay"
};
const std::unordered_set<std::string> STRING_TYPES = {
	"string", "normalizedString", "token", "language", "Name", "NCName", "NMTOKEN"
};


}  // namespace


DatatypeFamily datatype_family(const std::string& datatype)
{
	if (datatype.compare(0, xsd::NS.size(), xsd::NS) != 0)
		return DatatypeFamily::OTHER;

	const std::string local = datatype.substr(xsd::NS.size());

	if (NUMERIC_TYPES.count(local) > 0)
		return DatatypeFamily::NUMERIC;
	else if (DATETIME_TYPES.count(local) > 0)
		return DatatypeFamily::DATETIME;
	else if (DATEFRAG_TYPES.count(local) > 0)
		return DatatypeFamily::DATEFRAG;
	else if (STRING_TYPES.count(local) > 0)
		return DatatypeFamily::STRING;
	else
		return DatatypeFamily::OTHER;
}


IRI literal_datatype(const Literal& l, const Vocabulary& vocab)
{
	if (!l.datatype.empty())
		return IRI{ l.datatype };
	else if (!l.lang.empty())
		return vocab.string_datatype;
	else
		return vocab.any_datatype;
}


}  // namespace gfd
