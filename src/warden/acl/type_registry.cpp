//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/type_registry.cpp
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


#include "warden/acl/type_registry.hpp"
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
    Type Registry
*/
Type
Type_registry::insert(const Type_name& name)
{
    Type type{name};
    Lock lock{mutex};

    names.emplace(name, boost::none);
    return type;
}


Type
Type_registry::insert(const Type_name& name, std::type_index native)
{
    Type type{name};
    Lock lock{mutex};

    const auto nativep = natives.find(native);
    if (nativep != natives.end() && nativep->second != name)
        throw Invalid_argument(boost::core::demangle(native.name()) + " is already registered as " + nativep->second);

    const auto namep = names.find(name);
    if (namep != names.end() && namep->second && *namep->second != native)
        throw Invalid_argument(name + " is already bound to " + boost::core::demangle(namep->second->name()));

    names[name] = native;
    natives.emplace(native, name);
    return type;
}


optional<Type>
Type_registry::find(const Type_name& name) const
{
    Lock lock{mutex};

    if (names.find(name) == names.end())
        return boost::none;

    return Type(name);
}


optional<Type>
Type_registry::find(std::type_index native) const
{
    Lock lock{mutex};

    const auto nativep = natives.find(native);
    if (nativep == natives.end())
        return boost::none;

    return Type(nativep->second);
}


bool
Type_registry::contains(const Type_name& name) const
{
    Lock lock{mutex};

    return names.find(name) != names.end();
}


std::size_t
Type_registry::size() const
{
    Lock lock{mutex};

    return names.size();
}


/*
    Default Registry
*/
std::shared_ptr<Type_registry>
default_type_registry()
{
    static const std::shared_ptr<Type_registry> registryp = std::make_shared<Type_registry>();

    return registryp;
}


Type_resolver
default_type_resolver()
{
    return Type_resolver(default_type_registry());
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
