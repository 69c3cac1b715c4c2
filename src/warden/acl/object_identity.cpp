//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/object_identity.cpp
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


#include "warden/acl/object_identity.hpp"
#include "boost/container_hash/hash.hpp"
#include <ostream>
#include <sstream>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Names/Types
*/
using boost::optional;


/*
    Constants
*/
const std::size_t identity_hash_seed = 31;


/*
    Object Identity
*/
Object_identity::Object_identity(const Type_name& name, Identifier id, const Type_resolver& types)
{
    if (name.empty())
        throw Invalid_argument("type name required");

    if (!id)
        throw Invalid_argument("identifier required");

    what    = types.resolve(name);
    which   = std::move(id);
}


Object_identity::Object_identity(const Type_name& name, Identifier id)
    : Object_identity{name, std::move(id), default_type_resolver()}
{
}


Object_identity::Object_identity(Type type, Identifier id)
    : what{std::move(type)}
    , which{std::move(id)}
{
    if (!what)
        throw Invalid_argument("type required");

    if (!which)
        throw Invalid_argument("identifier required");
}


std::size_t
hash_value(const Object_identity& x)
{
    std::size_t seed = identity_hash_seed;

    boost::hash_combine(seed, x.what);
    boost::hash_combine(seed, x.which);
    return seed;
}


/*
    Object Identity Construction
*/
Object_identity
make_object_identity(const Dynamic_object& object, const Type_resolver& types)
{
    if (!object)
        throw Invalid_argument("domain object required");

    const Type              type = types.resolve(object.type_name());
    optional<Identifier>    idp;

    try {
        idp = object.invoke(identity_accessor_name);
    } catch (...) {
        throw Identity_unavailable("could not extract identity from object of type " + type.name(), std::current_exception());
    }

    if (!idp) {
        const Invalid_argument missing{type.name() + " has no accessor named " + identity_accessor_name};
        throw Identity_unavailable(missing.what(), std::make_exception_ptr(missing));
    }

    if (!*idp) {
        const Invalid_argument null{"identity accessor of " + type.name() + " returned null"};
        throw Identity_unavailable(null.what(), std::make_exception_ptr(null));
    }

    return Object_identity(type, std::move(*idp));
}


Object_identity
make_object_identity(const Dynamic_object& object)
{
    return make_object_identity(object, default_type_resolver());
}


/*
    Object Identity Formatting
*/
std::string
to_string(const Object_identity& x)
{
    std::ostringstream os;

    os << x;
    return os.str();
}


std::ostream&
operator<<(std::ostream& os, const Object_identity& x)
{
    return os << "Object_identity[Type: " << x.type() << "; Identifier: " << x.identifier() << ']';
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
