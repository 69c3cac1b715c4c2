//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/identifier.cpp
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


#include "warden/acl/identifier.hpp"
#include "warden/acl/error.hpp"
#include "boost/container_hash/hash.hpp"
#include "boost/optional.hpp"
#include "boost/uuid/uuid_io.hpp"
#include <ostream>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Names/Types
*/
using boost::apply_visitor;
using boost::optional;


/*
    Implementation Details
*/
namespace Detail {


/*
    Identifier Kind Visitor
*/
class Kind_visitor : public boost::static_visitor<Identifier_kind> {
public:
    Identifier_kind operator()(boost::blank) const              { return Identifier_kind::nil; }
    Identifier_kind operator()(long long) const                 { return Identifier_kind::integer; }
    Identifier_kind operator()(const std::string&) const        { return Identifier_kind::string; }
    Identifier_kind operator()(const boost::uuids::uuid&) const { return Identifier_kind::uuid; }
};


/*
    Identifier Widening Visitor
*/
class Widening_visitor : public boost::static_visitor<optional<long long>> {
public:
    template<class T>
    optional<long long> operator()(const T&) const
    {
        return boost::none;
    }

    optional<long long> operator()(short n) const           { return static_cast<long long>(n); }
    optional<long long> operator()(unsigned short n) const  { return static_cast<long long>(n); }
    optional<long long> operator()(int n) const             { return static_cast<long long>(n); }
    optional<long long> operator()(unsigned int n) const    { return static_cast<long long>(n); }
    optional<long long> operator()(long n) const            { return static_cast<long long>(n); }
    optional<long long> operator()(long long n) const       { return n; }
};


/*
    Identifier Hashing Visitor

    Integers are hashed by their widened value so that identifiers that
    compare equal across widths also hash equal.
*/
class Hash_visitor : public boost::static_visitor<std::size_t> {
public:
    std::size_t operator()(boost::blank) const                  { return 0; }
    std::size_t operator()(long long n) const                   { return boost::hash<long long>()(n); }
    std::size_t operator()(const std::string& s) const          { return boost::hash<std::string>()(s); }
    std::size_t operator()(const boost::uuids::uuid& u) const   { return boost::hash<boost::uuids::uuid>()(u); }
};


/*
    Identifier Formatting Visitor
*/
class String_visitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(boost::blank) const                  { return "null"; }
    std::string operator()(long long n) const                   { return std::to_string(n); }
    std::string operator()(const std::string& s) const          { return s; }
    std::string operator()(const boost::uuids::uuid& u) const   { return boost::uuids::to_string(u); }
};


}   // Detail


/*
    Identifier
*/
Identifier_kind
Identifier::kind() const
{
    return apply_visitor(Detail::Kind_visitor(), val);
}


long long
Identifier::integer() const
{
    const optional<long long> n = apply_visitor(Detail::Widening_visitor(), val);

    if (!n)
        throw Invalid_argument("identifier is not an integer: " + to_string(*this));

    return *n;
}


bool
operator==(const Identifier& x, const Identifier& y)
{
    if (x.is_integer() && y.is_integer())
        return x.integer() == y.integer();

    return x.val == y.val;
}


bool
operator< (const Identifier& x, const Identifier& y)
{
    const Identifier_kind xkind = x.kind();
    const Identifier_kind ykind = y.kind();

    if (xkind != ykind) return xkind < ykind;
    if (xkind == Identifier_kind::integer) return x.integer() < y.integer();
    return x.val < y.val;
}


std::size_t
hash_value(const Identifier& x)
{
    std::size_t seed = static_cast<std::size_t>(x.kind());

    boost::hash_combine(seed, apply_visitor(Detail::Hash_visitor(), x.val));
    return seed;
}


/*
    Identifier Formatting
*/
std::string
to_string(const Identifier& x)
{
    return apply_visitor(Detail::String_visitor(), x.value());
}


std::ostream&
operator<<(std::ostream& os, const Identifier& x)
{
    return os << to_string(x);
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
