//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/config.hpp
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

#ifndef WARDEN_CONFIG_HPP
#define WARDEN_CONFIG_HPP


/*
    Shared Library Linkage
*/
# if defined _WIN32
#   define WARDEN_EXPORT_DECL   __declspec(dllexport)
#   define WARDEN_IMPORT_DECL   __declspec(dllimport)
# elif defined __GNUC__
#   define WARDEN_EXPORT_DECL   __attribute__((visibility("default")))
#   define WARDEN_IMPORT_DECL
# else
#   define WARDEN_EXPORT_DECL
#   define WARDEN_IMPORT_DECL
# endif


#endif  // WARDEN_CONFIG_HPP

//  $CUSTOM_FOOTER$
