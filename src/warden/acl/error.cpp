//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/error.cpp
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


#include "warden/acl/error.hpp"
#include <utility>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Invalid Argument
*/
Invalid_argument::Invalid_argument(const std::string& what)
    : std::invalid_argument{what}
{
}


/*
    Invalid Type
*/
Invalid_type::Invalid_type(const std::string& type)
    : std::runtime_error{"unknown type: " + type}
    , name{type}
{
}


const std::string&
Invalid_type::type_name() const
{
    return name;
}


/*
    Identity Unavailable
*/
Identity_unavailable::Identity_unavailable(const std::string& what, std::exception_ptr cause)
    : std::runtime_error{what}
    , ep{std::move(cause)}
{
}


std::exception_ptr
Identity_unavailable::cause() const
{
    return ep;
}


void
Identity_unavailable::rethrow_cause() const
{
    if (ep)
        std::rethrow_exception(ep);

    throw *this;
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
