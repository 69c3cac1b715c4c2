//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden_acl_inspect.cpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name$
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//


#include "warden/acl/object_identity_factory.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>


using namespace Warden::Acl;
using std::cerr;
using std::cout;
using std::endl;
using std::string;


/*
    Names/Types
*/
using Identity_vector = std::vector<Object_identity>;


/*
    Domain types known to the tool.
*/
const char* const demo_types[] = {
    "Account",
    "Savings_account",
    "Document"
};


bool
is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}


/*
    An argument is an integer only when it is spelled as one:  an optional
    minus sign, then decimal digits, and nothing else.  Anything else,
    including " 7" and "+7", is a string identifier.
*/
Identifier
parse_identifier(const string& s)
{
    const std::size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;

    if (start == s.size() || !is_digit(s[start]))
        return s;

    const char* first   = s.c_str();
    char*       last    = nullptr;

    errno = 0;
    const long long n = std::strtoll(first, &last, 10);

    if (*last == '\0' && errno == 0)
        return n;

    return s;
}


int
main(int argc, char* argv[])
{
    if (argc < 3 || argc % 2 == 0) {
        cerr << "usage: " << argv[0] << " type id [type id ...]\n";
        return 1;
    }

    const auto registryp = std::make_shared<Type_registry>();

    for (const char* name : demo_types)
        registryp->insert(name);

    const Object_identity_factory   factory{Type_resolver(registryp)};
    Identity_vector                 identities;

    try {
        for (int i = 1; i + 1 < argc; i += 2)
            identities.push_back(factory.make(parse_identifier(argv[i + 1]), argv[i]));
    } catch (const Invalid_type& e) {
        cerr << argv[0] << ": " << e.what() << endl;
        return 1;
    } catch (const Invalid_argument& e) {
        cerr << argv[0] << ": " << e.what() << endl;
        return 1;
    }

    for (const Object_identity& x : identities)
        cout << x << " hash=" << hash_value(x) << endl;

    for (Identity_vector::size_type i = 0; i != identities.size(); ++i) {
        for (Identity_vector::size_type j = i + 1; j != identities.size(); ++j) {
            if (identities[i] == identities[j])
                cout << "equal: " << i << ' ' << j << endl;
        }
    }

    return 0;
}

//  $CUSTOM_FOOTER$
