#include "gtest/gtest.h"
#include "attribute.hpp"
#include "attribute_traits.hpp"

#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace fieldmap;
using namespace std::chrono;

namespace {

struct Address {
    std::string city;
    std::optional<std::string> zip;

    DECLARE_FIELDMAP_ATTRIBUTES(
        "city", &Address::city,
        "zip", &Address::zip
    )
};

struct Person {
    std::string name;
    int age = 0;
    Address address;

    std::string upper_name() const {
        std::string result = name;
        for (auto& c : result) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return result;
    }

    Address home() const { return Address{"Oslo", std::nullopt}; }

    FIELDMAP_TYPE_NAME("Person")
    DECLARE_FIELDMAP_ATTRIBUTES(
        "name", &Person::name,
        "age", &Person::age,
        "address", &Person::address,
        "upper_name", &Person::upper_name,
        "home", &Person::home
    )
};

struct Employee : Person {
    std::string name = "shadowed";
    double salary = 0.0;

    INHERIT_FIELDMAP_ATTRIBUTES(Person)
    DECLARE_FIELDMAP_ATTRIBUTES(
        "name", &Employee::name,
        "salary", &Employee::salary
    )
};

enum class Level { LOW = 1, HIGH = 5 };

}

// 1. Scalars map onto the matching alternative
TEST(AttributeValueTest, BasicTypes) {
    EXPECT_EQ(AttributeValue().type(), AttributeValue::Type::NONE);
    EXPECT_EQ(AttributeValue(true).type(), AttributeValue::Type::BOOL);
    EXPECT_EQ(AttributeValue(42).type(), AttributeValue::Type::INT);
    EXPECT_EQ(AttributeValue(42u).type(), AttributeValue::Type::INT);
    EXPECT_EQ(AttributeValue(1.5).type(), AttributeValue::Type::DOUBLE);
    EXPECT_EQ(AttributeValue("text").type(), AttributeValue::Type::STRING);
    EXPECT_EQ(AttributeValue(Date{year{2015}, January, day{1}}).type(), AttributeValue::Type::DATE);
    EXPECT_EQ(AttributeValue(ObjectRef()).type(), AttributeValue::Type::NONE);

    EXPECT_EQ(*AttributeValue(42).get_if<std::int64_t>(), 42);
    EXPECT_EQ(AttributeValue(42).get_if<std::string>(), nullptr);
}

TEST(AttributeValueTest, TypeNames) {
    EXPECT_EQ(AttributeValue().type_name(), "null");
    EXPECT_EQ(AttributeValue(1).type_name(), "int");
    EXPECT_EQ(AttributeValue("a").type_name(), "str");
    EXPECT_EQ(AttributeValue::list({1, 2}).type_name(), "list");
    EXPECT_EQ(AttributeValue::map({{"a", 1}}).type_name(), "dict");

    Person person;
    EXPECT_EQ(make_value(person).type_name(), "Person");
    Address address;
    EXPECT_EQ(make_value(address).type_name(), "object");
}

TEST(AttributeValueTest, MapLookup) {
    AttributeValue value = AttributeValue::map({{"a", 1}, {"b", "two"}});

    auto a = get_attribute(value, "a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, AttributeValue(1));

    // Absent keys read as null, like dict.get()
    auto missing = get_attribute(value, "missing");
    ASSERT_TRUE(missing.has_value());
    EXPECT_TRUE(missing->is_null());

    EXPECT_FALSE(get_attribute(AttributeValue(5), "a").has_value());
}

TEST(AttributeValueTest, DottedPath) {
    AttributeValue value = AttributeValue::map({
        {"author", AttributeValue::map({{"name", "Ann"}, {"profile", nullptr}})},
    });

    auto name = get_attribute_path(value, "author.name");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, AttributeValue("Ann"));

    // A null intermediate counts as missing, a null leaf does not
    EXPECT_FALSE(get_attribute_path(value, "author.profile.bio").has_value());
    auto profile = get_attribute_path(value, "author.profile");
    ASSERT_TRUE(profile.has_value());
    EXPECT_TRUE(profile->is_null());

    EXPECT_FALSE(get_attribute_path(value, "author..name").has_value());
    EXPECT_FALSE(get_attribute_path(value, "author.name.first").has_value());
}

TEST(AttributeTraitsTest, Containers) {
    std::vector<int> numbers = {1, 2, 3};
    EXPECT_EQ(make_value(numbers), AttributeValue::list({1, 2, 3}));

    std::map<std::string, int> scores = {{"a", 1}, {"b", 2}};
    EXPECT_EQ(make_value(scores), AttributeValue::map({{"a", 1}, {"b", 2}}));

    std::map<int, std::string> names = {{1, "one"}};
    EXPECT_EQ(make_value(names), AttributeValue::map({{"1", "one"}}));

    std::optional<int> empty;
    EXPECT_TRUE(make_value(empty).is_null());
    EXPECT_EQ(make_value(std::optional<int>(7)), AttributeValue(7));

    std::unique_ptr<std::string> missing;
    EXPECT_TRUE(make_value(missing).is_null());
    auto shared = std::make_shared<double>(2.5);
    EXPECT_EQ(make_value(shared), AttributeValue(2.5));

    EXPECT_EQ(make_value(Level::HIGH), AttributeValue(5));
}

TEST(AttributeTraitsTest, ChronoTypes) {
    sys_days day_point = year{2015} / January / 1;
    EXPECT_EQ(make_value(day_point), AttributeValue(Date{year{2015}, January, day{1}}));

    sys_time<seconds> moment = day_point + hours{10} + minutes{30};
    const auto value = make_value(moment);
    ASSERT_NE(value.get_if<DateTime>(), nullptr);
    EXPECT_EQ(*value.get_if<DateTime>(), time_point_cast<microseconds>(moment));
}

TEST(BoundObjectTest, DataMembersAndAccessors) {
    Person person{"ann", 30, {"Bergen", "5003"}};
    AttributeValue value = make_value(person);
    ASSERT_EQ(value.type(), AttributeValue::Type::OBJECT);

    EXPECT_EQ(*get_attribute(value, "name"), AttributeValue("ann"));
    EXPECT_EQ(*get_attribute(value, "age"), AttributeValue(30));
    EXPECT_EQ(*get_attribute(value, "upper_name"), AttributeValue("ANN"));
    EXPECT_FALSE(get_attribute(value, "salary").has_value());

    EXPECT_EQ(*get_attribute_path(value, "address.city"), AttributeValue("Bergen"));
    EXPECT_EQ(*get_attribute_path(value, "address.zip"), AttributeValue("5003"));

    // The accessor result is a temporary that must outlive the call
    auto home = get_attribute(value, "home");
    ASSERT_TRUE(home.has_value());
    EXPECT_EQ(*get_attribute(*home, "city"), AttributeValue("Oslo"));
    EXPECT_TRUE(get_attribute(*home, "zip")->is_null());
}

TEST(BoundObjectTest, ReflectsLaterChanges) {
    Person person{"ann", 30, {}};
    AttributeValue value = make_value(person);
    person.age = 31;
    EXPECT_EQ(*get_attribute(value, "age"), AttributeValue(31));
}

TEST(BoundObjectTest, InheritedAttributes) {
    Employee employee;
    employee.Person::name = "base";
    employee.age = 40;
    employee.salary = 1000.0;

    AttributeValue value = make_value(employee);
    EXPECT_EQ(*get_attribute(value, "name"), AttributeValue("shadowed"));
    EXPECT_EQ(*get_attribute(value, "age"), AttributeValue(40));
    EXPECT_EQ(*get_attribute(value, "salary"), AttributeValue(1000.0));
}

TEST(BoundObjectTest, TemporaryContainerOutlivesExpression) {
    AttributeValue value = make_value(std::vector<Person>{
        Person{"a-name-long-enough-to-leave-small-string-storage", 1, {"Bergen", std::nullopt}},
        Person{"another-name-long-enough-for-the-heap-as-well", 2, {}},
    });
    const auto* items = value.get_if<AttributeValue::List>();
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->size(), 2u);

    EXPECT_EQ(*get_attribute((*items)[0], "name"),
              AttributeValue("a-name-long-enough-to-leave-small-string-storage"));
    EXPECT_EQ(*get_attribute_path((*items)[0], "address.city"), AttributeValue("Bergen"));
    EXPECT_EQ(*get_attribute((*items)[1], "age"), AttributeValue(2));

    AttributeValue single = make_value(Person{"temporary-person-with-a-long-name", 7, {}});
    EXPECT_EQ(*get_attribute(single, "name"), AttributeValue("temporary-person-with-a-long-name"));
    EXPECT_NE(object_cast<Person>(single), nullptr);
}

TEST(BoundObjectTest, OwnedObjectAndCast) {
    AttributeValue value(make_owned_object(Person{"bob", 22, {}}));
    EXPECT_EQ(*get_attribute(value, "name"), AttributeValue("bob"));

    const Person* person = object_cast<Person>(value);
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->age, 22);
    EXPECT_EQ(object_cast<Address>(value), nullptr);
    EXPECT_EQ(object_cast<Person>(AttributeValue(1)), nullptr);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
