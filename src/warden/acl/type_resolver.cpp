//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type_resolver.cpp
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


#include "warden/acl/type_resolver.hpp"
#include "warden/acl/error.hpp"
#include "boost/core/demangle.hpp"


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
    Type Resolver
*/
optional<Type>
Type_resolver::find(const Type_name& name) const
{
    if (!ifacep)
        throw Invalid_argument("type resolver required");

    return ifacep->find(name);
}


optional<Type>
Type_resolver::find(std::type_index native) const
{
    if (!ifacep)
        throw Invalid_argument("type resolver required");

    return ifacep->find(native);
}


Type
Type_resolver::resolve(const Type_name& name) const
{
    if (name.empty())
        throw Invalid_argument("type name required");

    if (const optional<Type> type = find(name))
        return *type;

    throw Invalid_type(name);
}


Type
Type_resolver::resolve(std::type_index native) const
{
    if (const optional<Type> type = find(native))
        return *type;

    throw Invalid_type(boost::core::demangle(native.name()));
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
