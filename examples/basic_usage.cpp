/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the PropSync property synchronizer
 *
 * This example demonstrates:
 * - Type registration with data members and accessors
 * - Copying every member, or every member but a few
 * - Merging bindable lists while keeping their subscribers
 * - JSON serialization, cloning and path queries
 * - Enum descriptions
 * - Error handling
 */

#include "PropSync/PropSync.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace propsync;

// ============================================================================
// Example Classes
// ============================================================================

enum class Role {
    Guest,
    Member,
    Admin
};

class Person {
public:
    std::string name;
    int age = 0;
    Role role = Role::Guest;
    std::shared_ptr<ObservableList<std::string>> tags = std::make_shared<ObservableList<std::string>>();

    const std::string& nickname() const { return nickname_; }
    void set_nickname(const std::string& n) { nickname_ = n; }

private:
    std::string nickname_;
};

// ============================================================================
// Type Registration
// ============================================================================

PROPSYNC_REGISTRATION
{
    Registry<Person>()
        .property("Name", &Person::name)
        .property("Age", &Person::age)
        .property("Role", &Person::role)
        .property("Tags", &Person::tags)
        .property("Nickname", &Person::nickname, &Person::set_nickname);

    EnumRegistry<Role>()
        .value("Guest", Role::Guest, "Read-only visitor")
        .value("Member", Role::Member, "Registered member")
        .value("Admin", Role::Admin);
}

// ============================================================================
// Helpers
// ============================================================================

static void print_person(const char* label, const Person& p) {
    std::cout << label << ": " << p.name << ", " << p.age
              << ", " << enum_description(p.role)
              << ", nickname=" << p.nickname() << ", tags=[";
    for (std::size_t i = 0; i < p.tags->size(); ++i) {
        std::cout << (i ? ", " : "") << (*p.tags)[i];
    }
    std::cout << "]\n";
}

static Person make_source() {
    Person p;
    p.name = "Alice";
    p.age = 30;
    p.role = Role::Admin;
    p.set_nickname("ali");
    p.tags->add("ops");
    p.tags->add("oncall");
    return p;
}

// ============================================================================
// Demonstrations
// ============================================================================

void demo_copy() {
    std::cout << "\n=== Copy ===\n";

    const Person source = make_source();

    Person all;
    copy_all(all, source);
    print_person("copy_all", all);
    std::cout << "tags shared with source: " << (all.tags == source.tags ? "yes" : "no") << "\n";

    Person fast;
    copy_all_fast(fast, source);
    print_person("copy_all_fast", fast);

    Person by_name;
    by_name.age = 99;
    copy_excluding(by_name, source, {"Age", "Tags"});
    print_person("excluding Age, Tags", by_name);

    Person by_selector;
    by_selector.name = "kept";
    copy_excluding(by_selector, source, {&Person::name, &Person::nickname});
    print_person("excluding name, nickname", by_selector);
}

void demo_merge() {
    std::cout << "\n=== Merge Collections ===\n";

    const Person source = make_source();

    Person target;
    target.tags->add("stale");
    const auto original_tags = target.tags;

    int notifications = 0;
    target.tags->subscribe([&](const CollectionChange& change) {
        ++notifications;
        std::cout << "  tags changed: " << to_string(change.action) << "\n";
    });

    copy_merging_collections(target, source);

    print_person("merged", target);
    std::cout << "same list instance: " << (target.tags == original_tags ? "yes" : "no")
              << ", notifications: " << notifications << "\n";
}

void demo_json() {
    std::cout << "\n=== JSON ===\n";

    const Person source = make_source();

    const std::string text = to_json(source);
    std::cout << text << "\n";

    if (auto parsed = from_json<Person>(text)) {
        print_person("from_json", *parsed);
    }

    const Person clone = json_clone(source);
    clone.tags->add("clone-only");
    std::cout << "source tags after clone edit: " << source.tags->size() << "\n";

    if (auto tag = get_json_fragment(text, "tags[1]")) {
        std::cout << "tags[1] = " << *tag << "\n";
    }
    if (auto age = get_json_value<int>(text, "age")) {
        std::cout << "age = " << *age << "\n";
    }
    std::cout << "has 'address': " << (has_json_path(text, "address") ? "yes" : "no") << "\n";
}

void demo_errors() {
    std::cout << "\n=== Error Handling ===\n";

    Person* missing = nullptr;
    const Person source = make_source();

    try {
        copy_all(missing, &source);
    } catch (const InvalidArgumentError& e) {
        std::cout << "Caught InvalidArgumentError: " << e.what() << "\n";
    }

    try {
        (void)from_json<Person>(R"({"age": "thirty"})");
    } catch (const JsonError& e) {
        std::cout << "Caught JsonError: " << e.what() << "\n";
    }

    Person untouched;
    if (!try_from_json("{not json", untouched)) {
        std::cout << "try_from_json rejected malformed input\n";
    }
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "PropSync Basic Usage Example\n";
    std::cout << "============================\n";

    try {
        demo_copy();
        demo_merge();
        demo_json();
        demo_errors();

        std::cout << "\n=== All demos completed successfully ===\n";
    } catch (const SyncError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
