//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/error.hpp
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

#ifndef WARDEN_ACL_ERROR_HPP
#define WARDEN_ACL_ERROR_HPP

#include "warden/acl/config.hpp"
#include <exception>
#include <stdexcept>
#include <string>


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Invalid Argument

    A required input (type name, type handle, identifier, resolver, or
    source object) was missing, empty, or null.
*/
class WARDEN_ACL_DECL Invalid_argument : public std::invalid_argument {
public:
    // Construct
    explicit Invalid_argument(const std::string& what);
};


/*
    Invalid Type
*/
class WARDEN_ACL_DECL Invalid_type : public std::runtime_error {
public:
    // Construct
    explicit Invalid_type(const std::string& name);

    // Observers
    const std::string& type_name() const;

private:
    // Data
    std::string name;
};


/*
    Identity Unavailable

    The identifier of a domain object could not be obtained.  The failure
    that prevented it is retained as the cause.
*/
class WARDEN_ACL_DECL Identity_unavailable : public std::runtime_error {
public:
    // Construct
    Identity_unavailable(const std::string& what, std::exception_ptr cause);

    // Observers
    std::exception_ptr cause() const;

    // Cause Propagation
    [[noreturn]] void rethrow_cause() const;

private:
    // Data
    std::exception_ptr ep;
};


}   // Acl
}   // Warden


#endif  // WARDEN_ACL_ERROR_HPP

//  $CUSTOM_FOOTER$
