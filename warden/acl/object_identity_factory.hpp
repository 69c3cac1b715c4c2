//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/object_identity_factory.hpp
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

#ifndef WARDEN_ACL_OBJECT_IDENTITY_FACTORY_HPP
#define WARDEN_ACL_OBJECT_IDENTITY_FACTORY_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/domain_object.hpp"
#include "warden/acl/identifier.hpp"
#include "warden/acl/object_identity.hpp"
#include "warden/acl/type_registry.hpp"
#include "warden/acl/type_resolver.hpp"


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Object Identity Factory

    Builds the identities an ACL store is keyed by, either by retrieving
    them from domain objects or by generating them from an identifier and
    a type name, resolving types through one Type_resolver.
*/
class WARDEN_ACL_DECL Object_identity_factory {
public:
    // Construct
    explicit Object_identity_factory(Type_resolver = default_type_resolver());

    // Retrieval
    template<class T> Object_identity   make(const T& domain_object) const;
    Object_identity                     make(const Dynamic_object&) const;

    // Generation
    Object_identity make(Identifier, const Type_name&) const;

    // Observers
    const Type_resolver& resolver() const;

private:
    // Data
    Type_resolver types;
};


/*
    Object Identity Factory
*/
template<class T>
inline Object_identity
Object_identity_factory::make(const T& domain_object) const
{
    return make_object_identity(domain_object, types);
}


inline Object_identity
Object_identity_factory::make(const Dynamic_object& domain_object) const
{
    return make_object_identity(domain_object, types);
}


inline const Type_resolver&
Object_identity_factory::resolver() const
{
    return types;
}


}   // Acl
}   // Warden


#endif  // WARDEN_ACL_OBJECT_IDENTITY_FACTORY_HPP

//  $CUSTOM_FOOTER$
