#ifndef GFD_TEST_HELPERS_H
#define GFD_TEST_HELPERS_H


#include <memory>
#include <string>
#include <boost/test/unit_test.hpp>
#include "gfd_types.h"
#include "gfd_vocab.h"
#include "gfd_graph.h"
#include "gfd_graph_indices.h"
#include "gfd_dictionary_utils.h"


namespace gfd
{
namespace test
{


inline Resource ex(const std::string& name)
{
    return IRI{ "http://example.org/" + name };
}


inline Resource lit(const std::string& val, const std::string& datatype = "",
    const std::string& lang = "")
{
    return Literal{ val, datatype, lang };
}


/*
* e1 is a Student and a Person, e3 a Person, and e2 has no type.
* Names are string-typed or language-tagged literals, "Alice" and
* "ALICE" being the same value once normalised.
*/
struct PeopleGraphFixture
{
    PeopleGraphFixture()
    {
        const Resource type = IRI{ rdf::TYPE };
        const Resource label = IRI{ rdfs::LABEL };

        g.add(Triple{ ex("e1"), type, ex("Student") });
        g.add(Triple{ ex("e1"), type, ex("Person") });
        g.add(Triple{ ex("e1"), label, lit("Eve") });
        g.add(Triple{ ex("e1"), ex("name"), lit("Alice", xsd::STRING) });
        g.add(Triple{ ex("e1"), ex("age"), lit("30", xsd::INTEGER) });
        g.add(Triple{ ex("e2"), ex("name"), lit("ALICE", xsd::STRING) });
        g.add(Triple{ ex("e2"), ex("knows"), ex("e1") });
        g.add(Triple{ ex("e3"), type, ex("Person") });
        g.add(Triple{ ex("e3"), ex("name"), lit("Bob", "", "en") });
        g.add(Triple{ ex("e3"), ex("nick"), lit("bobby") });
        g.add(Triple{ ex("e3"), ex("born"), lit("1990-01-01", xsd::DATE) });
        g.add(Triple{ ex("e3"), ex("knows"), ex("e1") });

        indices = std::make_unique<GraphIndices>(g);
    }

    CodedResource code(const Resource& r) const
    {
        auto c = g.dictionary().find(r);
        BOOST_REQUIRE(c.has_value());
        return *c;
    }

    CodedAssertion coded(const Assertion& a)
    {
        return encode(g.dictionary(), a);
    }

    Graph g;
    std::unique_ptr<GraphIndices> indices;
};


}  // namespace test
}  // namespace gfd


#endif  // GFD_TEST_HELPERS_H
