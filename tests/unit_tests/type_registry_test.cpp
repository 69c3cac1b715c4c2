//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/unit_tests/type_registry_test.cpp
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
#include <warden/acl/type.hpp>
#include <warden/acl/type_registry.hpp>
#include <warden/acl/type_resolver.hpp>
#include <utils/test_domain.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <typeindex>
#include <unordered_set>
#include <vector>

using namespace Warden::Acl;

namespace tests

{

    TEST( TypeTest, testNullType )
    {
        Type type;
        ASSERT_FALSE(type);
        ASSERT_TRUE(type.name().empty());
        ASSERT_THROW(Type(""), Invalid_argument);
    }

    TEST( TypeTest, testTypesCompareByName )
    {
        ASSERT_EQ(Type("Account"), Type("Account"));
        ASSERT_NE(Type("Account"), Type("Savings_account"));
        ASSERT_NE(Type("Account"), Type("account"));
        ASSERT_LT(Type("Account"), Type("Document"));
        ASSERT_EQ(hash_value(Type("Account")), hash_value(Type("Account")));
        std::unordered_set<Type> types { Type("Account"), Type("Account"), Type("Document") };
        ASSERT_EQ(types.size(), 2u);
    }

    TEST( TypeRegistryTest, testInsertAndFindByName )
    {
        Type_registry registry;
        ASSERT_EQ(registry.insert("Foo"), Type("Foo"));
        ASSERT_TRUE(registry.contains("Foo"));
        ASSERT_FALSE(registry.contains("Bar"));
        ASSERT_EQ(*registry.find("Foo"), Type("Foo"));
        ASSERT_FALSE(registry.find("Bar"));
        ASSERT_EQ(registry.size(), 1u);
    }

    TEST( TypeRegistryTest, testInsertEmptyNameThrows )
    {
        Type_registry registry;
        ASSERT_THROW(registry.insert(""), Invalid_argument);
        ASSERT_THROW(registry.insert<Account>(""), Invalid_argument);
        ASSERT_EQ(registry.size(), 0u);
    }

    TEST( TypeRegistryTest, testNativeTypeBinding )
    {
        Type_registry registry;
        registry.insert<Account>("Account");
        ASSERT_EQ(*registry.find(std::type_index(typeid(Account))), Type("Account"));
        ASSERT_EQ(*registry.find("Account"), Type("Account"));
        ASSERT_FALSE(registry.find(std::type_index(typeid(Savings_account))));
    }

    TEST( TypeRegistryTest, testRepeatedInsertIsIdempotent )
    {
        Type_registry registry;
        registry.insert<Account>("Account");
        registry.insert<Account>("Account");
        registry.insert("Account");
        ASSERT_EQ(registry.size(), 1u);
        ASSERT_EQ(*registry.find(std::type_index(typeid(Account))), Type("Account"));
    }

    TEST( TypeRegistryTest, testNameOnlyTypeCanBeBoundLater )
    {
        Type_registry registry;
        registry.insert("Account");
        ASSERT_FALSE(registry.find(std::type_index(typeid(Account))));
        registry.insert<Account>("Account");
        ASSERT_EQ(*registry.find(std::type_index(typeid(Account))), Type("Account"));
    }

    TEST( TypeRegistryTest, testConflictingBindingsThrow )
    {
        Type_registry registry;
        registry.insert<Account>("Account");
        // same native type under a second name
        ASSERT_THROW(registry.insert<Account>("Other_account"), Invalid_argument);
        // same name for a second native type
        ASSERT_THROW(registry.insert<Document>("Account"), Invalid_argument);
        ASSERT_FALSE(registry.contains("Other_account"));
        ASSERT_FALSE(registry.find(std::type_index(typeid(Document))));
    }

    TEST( TypeRegistryTest, testConcurrentInsertAndFind )
    {
        const auto registryp = make_test_registry();
        const std::size_t initial_size = registryp->size();
        const int writers = 4;
        const int readers = 4;
        const int names_per_writer = 250;
        std::atomic<int> misses{0};
        std::vector<std::thread> threads;

        for (int t = 0; t != writers; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = 0; i != names_per_writer; ++i) {
                    const Type_name name = "Concurrent_" + std::to_string(t) + "_" + std::to_string(i);
                    if (registryp->insert(name) != Type(name))
                        ++misses;
                }
            });
        }

        for (int t = 0; t != readers; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i != names_per_writer; ++i) {
                    const auto by_name = registryp->find("Account");
                    const auto by_native = registryp->find(std::type_index(typeid(Document)));
                    if (!by_name || *by_name != Type("Account"))
                        ++misses;
                    if (!by_native || *by_native != Type("Document"))
                        ++misses;
                }
            });
        }

        for (std::thread& thread : threads)
            thread.join();

        ASSERT_EQ(misses.load(), 0);
        ASSERT_EQ(registryp->size(), initial_size + writers * names_per_writer);
        for (int t = 0; t != writers; ++t) {
            for (int i = 0; i != names_per_writer; ++i)
                ASSERT_TRUE(registryp->contains("Concurrent_" + std::to_string(t) + "_" + std::to_string(i)));
        }
        ASSERT_EQ(*registryp->find(std::type_index(typeid(Account))), Type("Account"));
    }

    TEST( TypeResolverTest, testResolve )
    {
        Type_resolver resolver(make_test_registry());
        ASSERT_TRUE(resolver);
        ASSERT_EQ(resolver.resolve("Account"), Type("Account"));
        ASSERT_EQ(resolver.resolve(std::type_index(typeid(Document))), Type("Document"));
    }

    TEST( TypeResolverTest, testResolveMissThrowsInvalidType )
    {
        Type_resolver resolver(make_test_registry());
        ASSERT_FALSE(resolver.find("Nonexistent"));
        try {
            resolver.resolve("Nonexistent");
            FAIL() << "expected Invalid_type";
        } catch (const Invalid_type& e) {
            ASSERT_EQ(e.type_name(), "Nonexistent");
        }
        ASSERT_THROW(resolver.resolve(std::type_index(typeid(Unregistered))), Invalid_type);
        ASSERT_THROW(resolver.resolve(""), Invalid_argument);
    }

    TEST( TypeResolverTest, testNullResolverThrows )
    {
        Type_resolver resolver;
        ASSERT_FALSE(resolver);
        ASSERT_THROW(resolver.find("Account"), Invalid_argument);
        ASSERT_THROW(resolver.resolve("Account"), Invalid_argument);
        ASSERT_THROW(resolver.resolve(std::type_index(typeid(Account))), Invalid_argument);
    }

    TEST( TypeResolverTest, testDefaultResolverSharesDefaultRegistry )
    {
        ASSERT_EQ(default_type_registry(), default_type_registry());
        ASSERT_EQ(default_type_resolver(), default_type_resolver());
        default_type_registry()->insert("Default_registry_entry");
        ASSERT_EQ(default_type_resolver().resolve("Default_registry_entry"), Type("Default_registry_entry"));
    }

}
