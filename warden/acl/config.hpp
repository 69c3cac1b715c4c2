//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/config.hpp
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

#ifndef WARDEN_ACL_CONFIG_HPP
#define WARDEN_ACL_CONFIG_HPP

#include "warden/config.hpp"


/*
    Detect API usage.
*/
# if !defined WARDEN_ACL_EXPORTS
#   define WARDEN_ACL_DECL
# else
#   if defined WARDEN_ACL_SOURCE
#       define WARDEN_ACL_DECL WARDEN_EXPORT_DECL
#   else
#       define WARDEN_ACL_DECL WARDEN_IMPORT_DECL
#   endif
# endif


#endif  // WARDEN_ACL_CONFIG_HPP

//  $CUSTOM_FOOTER$
