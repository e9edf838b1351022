#ifndef GFD_TYPES_H
#define GFD_TYPES_H


#include <string>
#include <variant>
#include <tuple>
#include <unordered_set>


namespace gfd
{


/*
* A literal value. `datatype` and `lang` are empty when the
* literal carries no datatype IRI / language tag respectively.
*/
struct Literal
{
	std::string val;
	std::string datatype;
	std::string lang;

	inline bool operator == (const Literal& other) const
	{
		return val == other.val && datatype == other.datatype && lang == other.lang;
	}
	inline bool operator != (const Literal& other) const { return !(*this == other); }
	inline bool operator < (const Literal& other) const
	{
		return std::tie(val, datatype, lang) < std::tie(other.val, other.datatype, other.lang);
	}
};


struct IRI
{
	std::string val;

	inline bool operator == (const IRI& other) const { return val == other.val; }
	inline bool operator != (const IRI& other) const { return val != other.val; }
	inline bool operator < (const IRI& other) const { return val < other.val; }
	inline bool operator <= (const IRI& other) const { return val <= other.val; }
	inline bool operator > (const IRI& other) const { return val > other.val; }
	inline bool operator >= (const IRI& other) const { return val >= other.val; }
};


typedef std::variant<Literal, IRI> Resource;
typedef size_t CodedResource;
typedef std::unordered_set<CodedResource> CodedResourceSet;


inline bool is_literal(const Resource& r) { return std::holds_alternative<Literal>(r); }
inline bool is_entity(const Resource& r) { return std::holds_alternative<IRI>(r); }


/*
* The closed set of type variable kinds.
* OBJECT variables range over entities of a class, DATA variables
* over literals of a datatype. MULTIMODAL nodes are data variables
* over an extended datatype family, and compare exactly like DATA.
*/
enum class TypeVariableKind
{
	OBJECT, DATA, MULTIMODAL
};


/*
* Get a string representation of a type variable kind.
*/
std::string type_var_kind_str(TypeVariableKind kind);


/*
* A placeholder for "any resource of type `type`", where `type`
* is a class (OBJECT) or a datatype (DATA, MULTIMODAL).
*/
template<typename ResT>
struct GeneralTypeVariable
{
	TypeVariableKind kind;
	ResT type;

	inline bool operator == (const GeneralTypeVariable<ResT>& other) const
	{
		return kind == other.kind && type == other.type;
	}
	inline bool operator != (const GeneralTypeVariable<ResT>& other) const { return !(*this == other); }
};


template<typename ResT>
GeneralTypeVariable<ResT> object_type_var(ResT type)
{
	return { TypeVariableKind::OBJECT, std::move(type) };
}
template<typename ResT>
GeneralTypeVariable<ResT> data_type_var(ResT type)
{
	return { TypeVariableKind::DATA, std::move(type) };
}
template<typename ResT>
GeneralTypeVariable<ResT> multimodal_node(ResT type)
{
	return { TypeVariableKind::MULTIMODAL, std::move(type) };
}


template<typename ResT>
using GeneralAssertionTerm = std::variant<GeneralTypeVariable<ResT>, ResT>;


template<typename ResT>
struct GeneralTriple
{
	ResT sub, pred, obj;

	inline bool operator == (const GeneralTriple<ResT>& other) const
	{
		return sub == other.sub && pred == other.pred && obj == other.obj;
	}
	inline bool operator != (const GeneralTriple<ResT>& other) const { return !(*this == other); }
};


/*
* A triple pattern whose endpoints may be concrete resources or
* type variables. The predicate is always concrete.
*/
template<typename ResT>
struct GeneralAssertion
{
	GeneralAssertionTerm<ResT> lhs;
	ResT pred;
	GeneralAssertionTerm<ResT> rhs;

	inline bool operator == (const GeneralAssertion<ResT>& other) const
	{
		return lhs == other.lhs && pred == other.pred && rhs == other.rhs;
	}
	inline bool operator != (const GeneralAssertion<ResT>& other) const { return !(*this == other); }
};


typedef GeneralTypeVariable<Resource> TypeVariable;
typedef GeneralTypeVariable<CodedResource> CodedTypeVariable;
typedef GeneralAssertionTerm<Resource> AssertionTerm;
typedef GeneralAssertionTerm<CodedResource> CodedAssertionTerm;
typedef GeneralTriple<Resource> Triple;
typedef GeneralTriple<CodedResource> CodedTriple;
typedef GeneralAssertion<Resource> Assertion;
typedef GeneralAssertion<CodedResource> CodedAssertion;


// works on Resources, type variables or assertion terms, via calling or via std::visit
struct GfdToStringVisitor
{
	std::string operator()(const Literal& l)
	{
		std::string s = '"' + l.val + '"';
		if (!l.lang.empty())
			s += '@' + l.lang;
		else if (!l.datatype.empty())
			s += "^^<" + l.datatype + '>';
		return s;
	}
	std::string operator()(const IRI& l)
	{
		return '<' + l.val + '>';
	}
	std::string operator()(const Resource& r)
	{
		return std::visit(*this, r);
	}
	std::string operator()(const TypeVariable& v)
	{
		return '?' + type_var_kind_str(v.kind) + ':' + (*this)(v.type);
	}
	std::string operator()(const AssertionTerm& t)
	{
		return std::visit(*this, t);
	}
};


}  // namespace gfd


/*
* implementation of standard hash functions of the above structs,
* so they can be used as keys of hash maps etc
*/
namespace std
{


template <>
struct hash<gfd::Literal>
{
	std::size_t operator()(const gfd::Literal& k) const
	{
		return (std::hash<std::string>()(k.val) * 37
			+ std::hash<std::string>()(k.datatype)) * 37
			+ std::hash<std::string>()(k.lang);
	}
};


template <>
struct hash<gfd::IRI>
{
	std::size_t operator()(const gfd::IRI& k) const
	{
		return std::hash<std::string>()(k.val) * 3;
	}
};


template<>
struct hash<gfd::GeneralTriple<gfd::CodedResource>>
{
	std::size_t operator()(const gfd::GeneralTriple<gfd::CodedResource>& t) const
	{
		// shifting by a third of the bit width each time stops
		// the identity hash of small codes from colliding
		return ((t.sub << (2 * 8 * sizeof(gfd::CodedResource) / 3))
			^ (t.pred << (8 * sizeof(gfd::CodedResource) / 3)) ^ t.obj);
	}
};


}  // namespace std


#endif  // GFD_TYPES_H
