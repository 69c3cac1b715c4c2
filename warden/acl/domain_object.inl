//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  warden/acl/domain_object.inl
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


/*
    Warden Access Control Library
*/
namespace Warden    {
namespace Acl       {


/*
    Dynamic Object
*/
inline
Dynamic_object::Dynamic_object(Interface_ptr p)
    : ifacep{std::move(p)}
{
}


inline
Dynamic_object::Dynamic_object(Dynamic_object&& other)
    : ifacep{std::move(other.ifacep)}
{
}


inline Dynamic_object&
Dynamic_object::operator=(Dynamic_object&& other)
{
    ifacep = std::move(other.ifacep);
    return *this;
}


inline Type_name
Dynamic_object::type_name() const
{
    return ifacep->type_name();
}


inline boost::optional<Identifier>
Dynamic_object::invoke(const Accessor_name& name) const
{
    return ifacep->invoke(name);
}


inline
Dynamic_object::operator bool() const
{
    return ifacep ? true : false;
}


inline bool
operator==(const Dynamic_object& x, const Dynamic_object& y)
{
    return x.ifacep == y.ifacep;
}


inline bool
operator< (const Dynamic_object& x, const Dynamic_object& y)
{
    return x.ifacep < y.ifacep;
}


inline void
swap(Dynamic_object& x, Dynamic_object& y)
{
    using std::swap;

    swap(x.ifacep, y.ifacep);
}


}   // Acl
}   // Warden

//  $CUSTOM_FOOTER$
