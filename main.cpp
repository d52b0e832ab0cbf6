#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "fieldmap.hpp"
#include "rtc_base/logging.h"

using namespace std::chrono;

struct User {
    std::string email;
    std::string username;
    std::string first_name;
    std::string last_name;

    FIELDMAP_TYPE_NAME("User")
    DECLARE_FIELDMAP_ATTRIBUTES(
        "email", &User::email,
        "username", &User::username,
        "first_name", &User::first_name,
        "last_name", &User::last_name
    )
};

struct Post {
    std::string title;
    User author;
    sys_time<seconds> created;
    std::vector<std::string> tags;

    FIELDMAP_TYPE_NAME("Post")
    DECLARE_FIELDMAP_ATTRIBUTES(
        "title", &Post::title,
        "author", &Post::author,
        "created", &Post::created,
        "tags", &Post::tags
    )
};

int main() {
    try {
        rtc::LogMessage::LogToDebug(rtc::LS_INFO);

        auto [user_schema, user_error] = fieldmap::SchemaBuilder("UserSerializer")
            .field("email", fieldmap::char_field())
            .field("username", fieldmap::char_field())
            .field("full_name", fieldmap::method_field([](const fieldmap::AttributeValue& instance) -> fieldmap::AttributeValue {
                const User* user = fieldmap::object_cast<User>(instance);
                if (user == nullptr) {
                    return nullptr;
                }
                return user->first_name + " " + user->last_name;
            }))
            .meta({{}, {"username"}})
            .build();
        if (user_error.has_error()) {
            RTC_LOG(LS_ERROR) << user_error.get_full_description();
            return 1;
        }

        auto [post_schema, post_error] = fieldmap::SchemaBuilder("PostSerializer")
            .field("title", fieldmap::char_field())
            .field("author", fieldmap::nested_field(user_schema))
            .field("created", fieldmap::datetime_field())
            .field("tags", fieldmap::raw_field())
            .build();
        if (post_error.has_error()) {
            RTC_LOG(LS_ERROR) << post_error.get_full_description();
            return 1;
        }

        std::vector<Post> posts = {
            {"Hello", {"john@example.com", "john", "John", "Smith"},
             sys_days{year{2015} / January / 1} + hours{10} + minutes{30}, {"intro"}},
            {"Second", {"jane@example.com", "jane", "Jane", "Doe"},
             sys_days{year{2015} / February / 3} + hours{8}, {"news", "update"}},
        };

        fieldmap::SerializeOptions options;
        options.pretty_print = true;

        fieldmap::Serializer serializer(post_schema, fieldmap::make_value(posts), true, options);
        auto [json, error] = serializer.to_json();
        if (error.has_error()) {
            RTC_LOG(LS_ERROR) << error.get_full_description();
            return 1;
        }

        RTC_LOG(LS_INFO) << "Serialized " << posts.size() << " posts";
        std::cout << json << std::endl;

        rapidjson::Document description;
        fieldmap::describe_schema(*post_schema, description, description.GetAllocator());
        auto [metadata, encode_error] = fieldmap::encode(description, options);
        if (encode_error.has_error()) {
            RTC_LOG(LS_ERROR) << encode_error.get_full_description();
            return 1;
        }
        std::cout << metadata << std::endl;

        return 0;
    } catch (const std::exception& e) {
        RTC_LOG(LS_ERROR) << "Error in main: " << e.what();
        return 1;
    }
}
