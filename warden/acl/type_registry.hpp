//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type_registry.hpp
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

#ifndef WARDEN_ACL_TYPE_REGISTRY_HPP
#define WARDEN_ACL_TYPE_REGISTRY_HPP

#include "warden/acl/config.hpp"
#include "warden/acl/type.hpp"
#include "warden/acl/type_resolver.hpp"
#include "boost/optional.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Type Registry

    Holds the domain types known to the process, each under a unique name
    and optionally bound to one native C++ type.  Populated at startup.
    Registering the same binding twice is harmless; binding a name or a
    native type to a second counterpart is an Invalid_argument.
*/
class WARDEN_ACL_DECL Type_registry : public Type_resolver::Interface {
public:
    // Construct
    Type_registry() = default;

    // Registration
    Type                    insert(const Type_name&);
    Type                    insert(const Type_name&, std::type_index);
    template<class T> Type  insert(const Type_name&);

    // Lookup
    boost::optional<Type>   find(const Type_name&) const override;
    boost::optional<Type>   find(std::type_index) const override;
    bool                    contains(const Type_name&) const;
    std::size_t             size() const;

private:
    // Names/Types
    using Mutex         = std::mutex;
    using Lock          = std::lock_guard<Mutex>;
    using Name_map      = std::map<Type_name, boost::optional<std::type_index>>;
    using Native_map    = std::unordered_map<std::type_index, Type_name>;

    // Data
    mutable Mutex   mutex;
    Name_map        names;
    Native_map      natives;
};


/*
    Default Registry
*/
WARDEN_ACL_DECL std::shared_ptr<Type_registry>  default_type_registry();
WARDEN_ACL_DECL Type_resolver                   default_type_resolver();


/*
    Type Registry
*/
template<class T>
inline Type
Type_registry::insert(const Type_name& name)
{
    return insert(name, std::type_index(typeid(T)));
}


}   // Acl
}   // Warden


#endif  // WARDEN_ACL_TYPE_REGISTRY_HPP

//  $CUSTOM_FOOTER$
