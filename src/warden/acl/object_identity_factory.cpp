//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/object_identity_factory.cpp
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
#include "warden/acl/error.hpp"
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Object Identity Factory
*/
Object_identity_factory::Object_identity_factory(Type_resolver resolver)
    : types{std::move(resolver)}
{
    if (!types)
        throw Invalid_argument("type resolver required");
}


Object_identity
Object_identity_factory::make(Identifier id, const Type_name& type) const
{
    return Object_identity(type, std::move(id), types);
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
