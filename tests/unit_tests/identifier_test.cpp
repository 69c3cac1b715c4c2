//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/unit_tests/identifier_test.cpp
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


#include <gtest/gtest.h>
#include <warden/acl/error.hpp>
#include <warden/acl/identifier.hpp>
#include <boost/uuid/string_generator.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>

using namespace Warden::Acl;

namespace tests

{

    static_assert(!std::is_constructible<Identifier, char>::value, "a character is not an identifier");
    static_assert(!std::is_constructible<Identifier, bool>::value, "a boolean is not an identifier");
    static_assert(std::is_constructible<Identifier, std::uint16_t>::value, "16-bit unsigned widens losslessly");
    static_assert(std::is_constructible<Identifier, std::uint32_t>::value, "32-bit unsigned widens losslessly");

    TEST( IdentifierTest, testDefaultIdentifierIsNil )
    {
        Identifier id;
        ASSERT_FALSE(id);
        ASSERT_EQ(id.kind(), Identifier_kind::nil);
        ASSERT_EQ(to_string(id), "null");
        ASSERT_FALSE(Identifier(static_cast<const char*>(nullptr)));
    }

    TEST( IdentifierTest, testKinds )
    {
        ASSERT_EQ(Identifier(short(1)).kind(), Identifier_kind::integer);
        ASSERT_EQ(Identifier(1).kind(), Identifier_kind::integer);
        ASSERT_EQ(Identifier(1L).kind(), Identifier_kind::integer);
        ASSERT_EQ(Identifier(1LL).kind(), Identifier_kind::integer);
        ASSERT_EQ(Identifier("abc").kind(), Identifier_kind::string);
        ASSERT_EQ(Identifier(std::string("abc")).kind(), Identifier_kind::string);
        auto u = boost::uuids::string_generator()("0e4f2b6c-9a61-4d5e-8f0a-3c2b1d4e5f60");
        ASSERT_EQ(Identifier(u).kind(), Identifier_kind::uuid);
    }

    TEST( IdentifierTest, testIntegersOfDifferentWidthAreEqual )
    {
        Identifier narrow(7);
        Identifier wide(7LL);
        ASSERT_EQ(narrow, wide);
        ASSERT_EQ(Identifier(short(7)), Identifier(7L));
        ASSERT_EQ(hash_value(narrow), hash_value(wide));
        ASSERT_EQ(std::hash<Identifier>()(Identifier(short(7))), std::hash<Identifier>()(Identifier(7L)));
        ASSERT_NE(Identifier(7), Identifier(8LL));
    }

    TEST( IdentifierTest, testUnsignedIntegersEqualSignedIntegers )
    {
        Identifier u32(std::uint32_t(7));
        Identifier u16(std::uint16_t(7));
        ASSERT_EQ(u32.kind(), Identifier_kind::integer);
        ASSERT_EQ(u32, Identifier(7));
        ASSERT_EQ(u32, Identifier(7LL));
        ASSERT_EQ(u16, Identifier(short(7)));
        ASSERT_EQ(hash_value(u32), hash_value(Identifier(7)));
        ASSERT_EQ(hash_value(u32), hash_value(Identifier(7LL)));
        ASSERT_EQ(hash_value(u16), hash_value(Identifier(7LL)));
        ASSERT_NE(u32, Identifier(8));
        ASSERT_NE(boost::get<unsigned int>(&u32.value()), nullptr);
    }

    TEST( IdentifierTest, testLargestUnsignedValueWidensWithoutLoss )
    {
        const std::uint32_t max = std::numeric_limits<std::uint32_t>::max();
        Identifier id(max);
        ASSERT_EQ(id.integer(), 4294967295LL);
        ASSERT_EQ(id, Identifier(4294967295LL));
        ASSERT_NE(id, Identifier(-1));
        ASSERT_LT(Identifier(-1), id);
        ASSERT_EQ(to_string(id), "4294967295");
    }

    TEST( IdentifierTest, testStoredWidthIsRetained )
    {
        Identifier narrow(7);
        Identifier wide(7LL);
        ASSERT_NE(boost::get<int>(&narrow.value()), nullptr);
        ASSERT_EQ(boost::get<long long>(&narrow.value()), nullptr);
        ASSERT_NE(boost::get<long long>(&wide.value()), nullptr);
    }

    TEST( IdentifierTest, testNonIntegersCompareExactly )
    {
        ASSERT_EQ(Identifier("abc"), Identifier(std::string("abc")));
        ASSERT_NE(Identifier("abc"), Identifier("abd"));
        // a numeric-looking string is not an integer
        ASSERT_NE(Identifier("7"), Identifier(7));
        auto u1 = boost::uuids::string_generator()("0e4f2b6c-9a61-4d5e-8f0a-3c2b1d4e5f60");
        auto u2 = boost::uuids::string_generator()("0e4f2b6c-9a61-4d5e-8f0a-3c2b1d4e5f61");
        ASSERT_EQ(Identifier(u1), Identifier(u1));
        ASSERT_NE(Identifier(u1), Identifier(u2));
        ASSERT_EQ(hash_value(Identifier("abc")), hash_value(Identifier(std::string("abc"))));
    }

    TEST( IdentifierTest, testInteger )
    {
        ASSERT_EQ(Identifier(short(-3)).integer(), -3LL);
        ASSERT_EQ(Identifier(9223372036854775807LL).integer(), 9223372036854775807LL);
        ASSERT_TRUE(Identifier(0).is_integer());
        ASSERT_FALSE(Identifier("0").is_integer());
        ASSERT_THROW(Identifier("abc").integer(), Invalid_argument);
        ASSERT_THROW(Identifier().integer(), Invalid_argument);
    }

    TEST( IdentifierTest, testOrdering )
    {
        ASSERT_LT(Identifier(short(2)), Identifier(3LL));
        ASSERT_LT(Identifier(-1LL), Identifier(0));
        ASSERT_FALSE(Identifier(7) < Identifier(7LL));
        ASSERT_FALSE(Identifier(7LL) < Identifier(7));
        // nil < integer < string < uuid
        auto u = boost::uuids::string_generator()("0e4f2b6c-9a61-4d5e-8f0a-3c2b1d4e5f60");
        ASSERT_LT(Identifier(), Identifier(0));
        ASSERT_LT(Identifier(1000), Identifier("a"));
        ASSERT_LT(Identifier("zzz"), Identifier(u));
        ASSERT_LT(Identifier("abc"), Identifier("abd"));
    }

    TEST( IdentifierTest, testToString )
    {
        ASSERT_EQ(to_string(Identifier(42)), "42");
        ASSERT_EQ(to_string(Identifier(short(-5))), "-5");
        ASSERT_EQ(to_string(Identifier("abc")), "abc");
        auto u = boost::uuids::string_generator()("0E4F2B6C-9A61-4D5E-8F0A-3C2B1D4E5F60");
        ASSERT_EQ(to_string(Identifier(u)), "0e4f2b6c-9a61-4d5e-8f0a-3c2b1d4e5f60");
        std::ostringstream os;
        os << Identifier(42LL);
        ASSERT_EQ(os.str(), "42");
    }

    TEST( IdentifierTest, testMovedFromIdentifierIsNil )
    {
        Identifier a(42);
        Identifier b(std::move(a));
        ASSERT_EQ(b, Identifier(42));
        ASSERT_FALSE(a);
        Identifier c;
        c = std::move(b);
        ASSERT_EQ(c, Identifier(42));
        ASSERT_FALSE(b);
    }

}
